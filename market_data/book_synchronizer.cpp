#include "book_synchronizer.H"

#include "common/errors.H"

namespace perpdesk::md {

const char* to_string(APPLY_RESULT result) {
    switch (result) {
        case APPLY_RESULT::APPLIED:
            return "applied";
        case APPLY_RESULT::STALE:
            return "stale";
        case APPLY_RESULT::BUFFERED:
            return "buffered";
        case APPLY_RESULT::GAP:
            return "gap";
    }
    return "unknown";
}

BookSynchronizer::BookSynchronizer(SnapshotSource& source, const BookConfig& config,
                                   std::shared_ptr<spdlog::logger> logger)
    : source(source), config(config), logger(logger) {}

BookSynchronizer::SymbolState& BookSynchronizer::state_for(const std::string& symbol) {
    auto it = states.find(symbol);
    if (it == states.end()) {
        it = states.emplace(symbol, SymbolState{}).first;
        it->second.book = std::make_unique<OrderBook>(symbol, logger);
    }
    return it->second;
}

DepthSnapshot BookSynchronizer::load_snapshot(const std::string& symbol) {
    logger->info("Requesting depth snapshot for {}", symbol);
    DepthSnapshot snapshot = source.fetch_snapshot(symbol);
    snapshot.symbol = symbol;
    install_snapshot(snapshot);
    return snapshot;
}

void BookSynchronizer::install_snapshot(const DepthSnapshot& snapshot) {
    SymbolState& state = state_for(snapshot.symbol);
    state.book->load_snapshot(snapshot);
    state.needs_snapshot = false;
    state.first_after_snapshot = true;

    std::deque<DepthDiff> pending;
    pending.swap(state.buffer);

    size_t replayed = 0;
    while (!pending.empty()) {
        DepthDiff diff = std::move(pending.front());
        pending.pop_front();

        APPLY_RESULT result = apply_diff(snapshot.symbol, diff);
        if (result == APPLY_RESULT::APPLIED) {
            ++replayed;
        } else if (result == APPLY_RESULT::GAP) {
            // the gap diff is already buffered, keep the rest behind it
            for (const auto& remaining : pending) {
                buffer_diff(state, remaining);
            }
            break;
        }
    }

    logger->info("Snapshot installed for {}: last_update_id={}, replayed={}, synced={}", snapshot.symbol,
                 state.book->get_last_update_id(), replayed, !state.needs_snapshot);
}

APPLY_RESULT BookSynchronizer::check_sequence(const SymbolState& state, const DepthDiff& diff) const {
    uint64_t last = state.book->get_last_update_id();
    if (diff.final_update_id <= last) {
        return APPLY_RESULT::STALE;
    }

    if (state.first_after_snapshot || !diff.prev_final_update_id.has_value()) {
        // u > last already holds, so U <= last + 1 <= u reduces to this
        return diff.first_update_id <= last + 1 ? APPLY_RESULT::APPLIED : APPLY_RESULT::GAP;
    }

    return *diff.prev_final_update_id == last ? APPLY_RESULT::APPLIED : APPLY_RESULT::GAP;
}

APPLY_RESULT BookSynchronizer::apply_diff(const std::string& symbol, const DepthDiff& diff) {
    SymbolState& state = state_for(symbol);

    if (state.needs_snapshot) {
        buffer_diff(state, diff);
        return APPLY_RESULT::BUFFERED;
    }

    APPLY_RESULT result = check_sequence(state, diff);
    switch (result) {
        case APPLY_RESULT::STALE:
            logger->debug("Dropping stale diff for {}: u={} last_update_id={}", symbol, diff.final_update_id,
                          state.book->get_last_update_id());
            return result;
        case APPLY_RESULT::GAP:
            logger->warn("Sequence gap for {}: last_update_id={}, U={}, u={}, pu={}", symbol,
                         state.book->get_last_update_id(), diff.first_update_id, diff.final_update_id,
                         diff.prev_final_update_id ? std::to_string(*diff.prev_final_update_id) : "none");
            state.needs_snapshot = true;
            buffer_diff(state, diff);
            return result;
        default:
            break;
    }

    state.book->apply_diff(diff);
    state.first_after_snapshot = false;
    return APPLY_RESULT::APPLIED;
}

void BookSynchronizer::buffer_diff(SymbolState& state, const DepthDiff& diff) {
    if (config.buffer_limit == 0) {
        return;
    }
    state.buffer.push_back(diff);
    while (state.buffer.size() > config.buffer_limit) {
        logger->warn("Diff buffer for {} is full, dropping u={}", state.book->get_symbol(),
                     state.buffer.front().final_update_id);
        state.buffer.pop_front();
    }
}

const OrderBook* BookSynchronizer::get_book(const std::string& symbol) const {
    auto it = states.find(symbol);
    if (it == states.end()) {
        return nullptr;
    }
    return it->second.book.get();
}

const OrderBook& BookSynchronizer::checked_book(const std::string& symbol) const {
    auto it = states.find(symbol);
    if (it == states.end()) {
        throw NotFoundError("No order book for symbol " + symbol);
    }
    if (it->second.needs_snapshot) {
        throw StreamGapError("Order book for " + symbol + " is waiting for a snapshot");
    }
    return *it->second.book;
}

bool BookSynchronizer::is_synced(const std::string& symbol) const {
    auto it = states.find(symbol);
    return it != states.end() && !it->second.needs_snapshot;
}

bool BookSynchronizer::needs_snapshot(const std::string& symbol) const {
    auto it = states.find(symbol);
    return it == states.end() || it->second.needs_snapshot;
}

size_t BookSynchronizer::get_buffered_count(const std::string& symbol) const {
    auto it = states.find(symbol);
    return it == states.end() ? 0 : it->second.buffer.size();
}

std::vector<std::string> BookSynchronizer::get_symbols() const {
    std::vector<std::string> symbols;
    symbols.reserve(states.size());
    for (const auto& [symbol, state] : states) {
        symbols.push_back(symbol);
    }
    return symbols;
}

} // namespace perpdesk::md
