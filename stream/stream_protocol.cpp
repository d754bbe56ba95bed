#include "stream_protocol.H"

#include "common/errors.H"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace perpdesk::stream {

namespace {

std::string lower(const std::string& symbol) {
    return normalize_stream_key(symbol);
}

const json& require(const json& obj, const char* key) {
    if (!obj.is_object()) {
        throw ValidationError(std::string("Expected an object holding '") + key + "'");
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw ValidationError(std::string("Missing field '") + key + "'");
    }
    return *it;
}

Decimal to_decimal(const json& value, const char* key) {
    if (value.is_string()) {
        return Decimal::parse(value.get_ref<const std::string&>());
    }
    if (value.is_number_integer()) {
        return Decimal(value.get<int64_t>());
    }
    throw ValidationError(std::string("Field '") + key + "' is not a decimal string");
}

Decimal decimal_field(const json& obj, const char* key) {
    return to_decimal(require(obj, key), key);
}

uint64_t uint_field(const json& obj, const char* key) {
    const json& value = require(obj, key);
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw ValidationError(std::string("Field '") + key + "' is not an unsigned integer");
    }
    return value.get<uint64_t>();
}

uint64_t optional_uint_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<uint64_t>();
}

std::string string_field(const json& obj, const char* key) {
    const json& value = require(obj, key);
    if (!value.is_string()) {
        throw ValidationError(std::string("Field '") + key + "' is not a string");
    }
    return value.get<std::string>();
}

std::vector<md::PriceLevel> parse_levels(const json& levels, const char* key) {
    if (!levels.is_array()) {
        throw ValidationError(std::string("Field '") + key + "' is not an array");
    }
    std::vector<md::PriceLevel> result;
    result.reserve(levels.size());
    for (const auto& level : levels) {
        if (!level.is_array() || level.size() < 2) {
            throw ValidationError(std::string("Malformed price level in '") + key + "'");
        }
        md::PriceLevel parsed{to_decimal(level[0], key), to_decimal(level[1], key)};
        if (!parsed.price.is_positive() || parsed.quantity.is_negative()) {
            throw ValidationError(std::string("Out of range price level in '") + key + "'");
        }
        result.push_back(parsed);
    }
    return result;
}

} // namespace

std::string normalize_stream_key(std::string_view key) {
    std::string result(key);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string ticker_stream(const std::string& symbol) {
    return lower(symbol) + "@ticker";
}

std::string depth_stream(const std::string& symbol, const std::string& speed) {
    if (speed.empty()) {
        return lower(symbol) + "@depth";
    }
    return lower(symbol) + "@depth@" + speed;
}

std::string kline_stream(const std::string& symbol, const std::string& interval) {
    return lower(symbol) + "@kline_" + interval;
}

std::string agg_trade_stream(const std::string& symbol) {
    return lower(symbol) + "@aggTrade";
}

std::string mark_price_stream(const std::string& symbol) {
    return lower(symbol) + "@markPrice";
}

std::string build_stream_url(const std::string& base_url, const std::vector<std::string>& keys) {
    std::string url = base_url + "/stream?streams=";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            url += '/';
        }
        url += keys[i];
    }
    return url;
}

std::string make_control_frame(const std::string& method, const std::vector<std::string>& keys, uint64_t id) {
    json frame;
    frame["method"] = method;
    frame["params"] = keys;
    frame["id"] = id;
    return frame.dump();
}

bool is_control_reply(const json& message) {
    return message.is_object() && message.contains("id") && !message.contains("stream") &&
           (message.contains("result") || message.contains("error"));
}

bool is_combined_envelope(const json& message) {
    return message.is_object() && message.contains("stream") && message["stream"].is_string() &&
           message.contains("data");
}

md::DepthDiff parse_depth_diff(const json& data) {
    md::DepthDiff diff;
    auto symbol = data.find("s");
    if (symbol != data.end() && symbol->is_string()) {
        diff.symbol = symbol->get<std::string>();
    }
    diff.event_time = optional_uint_field(data, "E");
    diff.first_update_id = uint_field(data, "U");
    diff.final_update_id = uint_field(data, "u");
    if (data.contains("pu") && !data["pu"].is_null()) {
        diff.prev_final_update_id = uint_field(data, "pu");
    }
    if (diff.first_update_id > diff.final_update_id) {
        throw ValidationError("Depth diff has U > u");
    }
    diff.bids = parse_levels(require(data, "b"), "b");
    diff.asks = parse_levels(require(data, "a"), "a");
    return diff;
}

md::DepthSnapshot parse_depth_snapshot(const json& body, const std::string& symbol) {
    md::DepthSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.last_update_id = uint_field(body, "lastUpdateId");
    snapshot.bids = parse_levels(require(body, "bids"), "bids");
    snapshot.asks = parse_levels(require(body, "asks"), "asks");

    auto is_empty = [](const md::PriceLevel& level) { return level.quantity.is_zero(); };
    snapshot.bids.erase(std::remove_if(snapshot.bids.begin(), snapshot.bids.end(), is_empty), snapshot.bids.end());
    snapshot.asks.erase(std::remove_if(snapshot.asks.begin(), snapshot.asks.end(), is_empty), snapshot.asks.end());
    return snapshot;
}

md::Ticker parse_ticker(const json& data) {
    md::Ticker ticker;
    ticker.symbol = string_field(data, "s");
    ticker.event_time = optional_uint_field(data, "E");
    ticker.last_price = decimal_field(data, "c");
    ticker.price_change = decimal_field(data, "p");
    ticker.price_change_percent = decimal_field(data, "P");
    ticker.high = decimal_field(data, "h");
    ticker.low = decimal_field(data, "l");
    ticker.base_volume = decimal_field(data, "v");
    ticker.quote_volume = decimal_field(data, "q");
    return ticker;
}

md::Kline parse_kline(const json& data) {
    const json& k = require(data, "k");

    md::Kline kline;
    kline.symbol = data.contains("s") ? string_field(data, "s") : string_field(k, "s");
    kline.interval = string_field(k, "i");
    kline.open_time = uint_field(k, "t");
    kline.close_time = uint_field(k, "T");
    kline.open = decimal_field(k, "o");
    kline.high = decimal_field(k, "h");
    kline.low = decimal_field(k, "l");
    kline.close = decimal_field(k, "c");
    kline.volume = decimal_field(k, "v");

    const json& is_final = require(k, "x");
    if (!is_final.is_boolean()) {
        throw ValidationError("Field 'x' is not a boolean");
    }
    kline.is_final = is_final.get<bool>();
    return kline;
}

Decimal parse_mark_price(const json& data) {
    return decimal_field(data, "p");
}

} // namespace perpdesk::stream
