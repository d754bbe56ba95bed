#include "order_book.H"

#include <algorithm>

namespace perpdesk::md {

OrderBook::OrderBook(std::string symbol, std::shared_ptr<spdlog::logger> logger)
    : symbol(std::move(symbol)), logger(logger) {}

void OrderBook::load_snapshot(const DepthSnapshot& snapshot) {
    clear();
    for (const auto& level : snapshot.bids) {
        if (level.quantity.is_positive()) {
            bid_levels[level.price] = level.quantity;
        }
    }
    for (const auto& level : snapshot.asks) {
        if (level.quantity.is_positive()) {
            ask_levels[level.price] = level.quantity;
        }
    }
    last_update_id = snapshot.last_update_id;

    logger->info("Loaded snapshot: symbol={}, last_update_id={}, bids={}, asks={}", symbol, last_update_id,
                 bid_levels.size(), ask_levels.size());
}

template <typename PriceLevels>
void OrderBook::update_levels(const std::vector<PriceLevel>& changes, PriceLevels& levels) {
    for (const auto& change : changes) {
        if (change.quantity.is_zero()) {
            levels.erase(change.price);
            continue;
        }
        if (change.quantity.is_negative()) {
            logger->warn("Ignoring negative quantity {} at price {} for {}", change.quantity.to_string(),
                         change.price.to_string(), symbol);
            continue;
        }
        levels[change.price] = change.quantity;
    }
}

void OrderBook::apply_diff(const DepthDiff& diff) {
    update_levels(diff.bids, bid_levels);
    update_levels(diff.asks, ask_levels);
    last_update_id = diff.final_update_id;

    // a crossed book is kept as received but flagged
    if (!bid_levels.empty() && !ask_levels.empty() && bid_levels.begin()->first >= ask_levels.begin()->first) {
        logger->warn("Crossed book for {}: bid={} ask={} at update {}", symbol, bid_levels.begin()->first.to_string(),
                     ask_levels.begin()->first.to_string(), last_update_id);
    }
}

void OrderBook::clear() {
    bid_levels.clear();
    ask_levels.clear();
    last_update_id = 0;
}

PriceLevel OrderBook::get_best_bid() const {
    return bid_levels.empty() ? PriceLevel{} : PriceLevel{bid_levels.begin()->first, bid_levels.begin()->second};
}

PriceLevel OrderBook::get_best_ask() const {
    return ask_levels.empty() ? PriceLevel{} : PriceLevel{ask_levels.begin()->first, ask_levels.begin()->second};
}

Decimal OrderBook::get_spread() const {
    if (bid_levels.empty() || ask_levels.empty()) {
        return Decimal();
    }
    return ask_levels.begin()->first - bid_levels.begin()->first;
}

Decimal OrderBook::get_spread_percent() const {
    if (bid_levels.empty() || ask_levels.empty()) {
        return Decimal();
    }
    return Decimal::mul_div(get_spread(), Decimal(100), ask_levels.begin()->first);
}

Decimal OrderBook::get_mid_price() const {
    if (bid_levels.empty() || ask_levels.empty()) {
        return Decimal();
    }
    return Decimal::div(bid_levels.begin()->first + ask_levels.begin()->first, Decimal(2));
}

template <typename PriceLevels>
Decimal OrderBook::total_volume(const PriceLevels& levels) {
    Decimal total;
    for (const auto& [price, quantity] : levels) {
        total += quantity;
    }
    return total;
}

Decimal OrderBook::get_total_bid_volume() const {
    return total_volume(bid_levels);
}

Decimal OrderBook::get_total_ask_volume() const {
    return total_volume(ask_levels);
}

template <typename PriceLevels>
std::vector<PriceLevel> OrderBook::top_levels(const PriceLevels& levels, size_t depth) {
    std::vector<PriceLevel> result;
    result.reserve(std::min(depth, levels.size()));
    for (const auto& [price, quantity] : levels) {
        if (result.size() == depth) {
            break;
        }
        result.push_back(PriceLevel{price, quantity});
    }
    return result;
}

std::vector<PriceLevel> OrderBook::get_top_bids(size_t depth) const {
    return top_levels(bid_levels, depth);
}

std::vector<PriceLevel> OrderBook::get_top_asks(size_t depth) const {
    return top_levels(ask_levels, depth);
}

DepthSnapshot OrderBook::to_snapshot() const {
    DepthSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.last_update_id = last_update_id;
    snapshot.bids = top_levels(bid_levels, bid_levels.size());
    snapshot.asks = top_levels(ask_levels, ask_levels.size());
    return snapshot;
}

} // namespace perpdesk::md
