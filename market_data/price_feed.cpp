#include "price_feed.H"

#include "common/errors.H"
#include "stream/stream_protocol.H"

namespace perpdesk::md {

PriceFeed::PriceFeed(stream::ConnectionManager& connection, std::shared_ptr<spdlog::logger> logger)
    : connection(connection), logger(logger) {}

PriceFeed::~PriceFeed() {
    stop();
}

void PriceFeed::track_ticker(const std::string& raw_symbol) {
    std::string symbol = normalize_symbol(raw_symbol);
    tokens.push_back(connection.subscribe(stream::ticker_stream(symbol), [this, symbol](const nlohmann::json& data) {
        on_ticker(symbol, data);
    }));
}

void PriceFeed::track_mark_price(const std::string& raw_symbol) {
    std::string symbol = normalize_symbol(raw_symbol);
    tokens.push_back(connection.subscribe(stream::mark_price_stream(symbol),
                                          [this, symbol](const nlohmann::json& data) { on_mark_price(symbol, data); }));
}

void PriceFeed::subscribe_klines(const std::string& raw_symbol, const std::string& interval, KlineListener listener) {
    std::string symbol = normalize_symbol(raw_symbol);
    tokens.push_back(connection.subscribe(
        stream::kline_stream(symbol, interval),
        [this, symbol, listener = std::move(listener)](const nlohmann::json& data) { on_kline(symbol, data, listener); }));
}

void PriceFeed::stop() {
    std::vector<stream::ConnectionManager::Token> revoked;
    revoked.swap(tokens);
    for (auto token : revoked) {
        connection.unsubscribe(token);
    }
}

void PriceFeed::set_price_listener(PriceListener listener) {
    price_listener = std::move(listener);
}

void PriceFeed::set_mark_price_listener(PriceListener listener) {
    mark_price_listener = std::move(listener);
}

void PriceFeed::on_ticker(const std::string& symbol, const nlohmann::json& data) {
    Ticker ticker;
    try {
        ticker = stream::parse_ticker(data);
    } catch (const ValidationError& e) {
        logger->error("Dropping malformed ticker for {}: {}", symbol, e.what());
        return;
    }
    ticker.symbol = symbol;
    tickers[symbol] = ticker;

    if (price_listener) {
        price_listener(symbol, ticker.last_price);
    }
}

void PriceFeed::on_mark_price(const std::string& symbol, const nlohmann::json& data) {
    Decimal price;
    try {
        price = stream::parse_mark_price(data);
    } catch (const ValidationError& e) {
        logger->error("Dropping malformed mark price for {}: {}", symbol, e.what());
        return;
    }
    mark_prices[symbol] = price;

    if (price_listener) {
        price_listener(symbol, price);
    }
    if (mark_price_listener) {
        mark_price_listener(symbol, price);
    }
}

void PriceFeed::on_kline(const std::string& symbol, const nlohmann::json& data, const KlineListener& listener) {
    Kline kline;
    try {
        kline = stream::parse_kline(data);
    } catch (const ValidationError& e) {
        logger->error("Dropping malformed kline for {}: {}", symbol, e.what());
        return;
    }
    kline.symbol = symbol;
    if (listener) {
        listener(kline);
    }
}

std::optional<Decimal> PriceFeed::get_price(const std::string& symbol) const {
    std::string key = normalize_symbol(symbol);
    auto mark = mark_prices.find(key);
    if (mark != mark_prices.end()) {
        return mark->second;
    }
    auto ticker = tickers.find(key);
    if (ticker != tickers.end()) {
        return ticker->second.last_price;
    }
    return std::nullopt;
}

std::optional<Ticker> PriceFeed::get_ticker(const std::string& symbol) const {
    auto it = tickers.find(normalize_symbol(symbol));
    if (it == tickers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Decimal> PriceFeed::get_mark_price(const std::string& symbol) const {
    auto it = mark_prices.find(normalize_symbol(symbol));
    if (it == mark_prices.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace perpdesk::md
