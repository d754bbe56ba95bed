#include "depth_feed.H"

#include "common/errors.H"
#include "stream/stream_protocol.H"

namespace perpdesk::md {

DepthFeed::DepthFeed(stream::ConnectionManager& connection, stream::Scheduler& scheduler,
                     BookSynchronizer& synchronizer, const BookConfig& config, std::shared_ptr<spdlog::logger> logger)
    : connection(connection), scheduler(scheduler), synchronizer(synchronizer), config(config), logger(logger) {}

DepthFeed::~DepthFeed() {
    stop_all();
}

void DepthFeed::start(const std::string& raw_symbol, const std::string& speed) {
    std::string symbol = normalize_symbol(raw_symbol);
    if (feeds.count(symbol) > 0) {
        logger->warn("Depth feed for {} already started", symbol);
        return;
    }

    stream::ConnectionManager::Token token = connection.subscribe(
        stream::depth_stream(symbol, speed),
        [this, symbol](const nlohmann::json& data) { on_depth_message(symbol, data); });
    feeds[symbol].token = token;
    logger->info("Depth feed started for {}", symbol);

    // let diffs buffer before the snapshot so the replay can bridge them
    schedule_snapshot(symbol);
}

void DepthFeed::stop(const std::string& raw_symbol) {
    std::string symbol = normalize_symbol(raw_symbol);
    auto it = feeds.find(symbol);
    if (it == feeds.end()) {
        return;
    }
    if (it->second.snapshot_timer) {
        scheduler.cancel(*it->second.snapshot_timer);
    }
    stream::ConnectionManager::Token token = it->second.token;
    feeds.erase(it);
    connection.unsubscribe(token);
    logger->info("Depth feed stopped for {}", symbol);
}

void DepthFeed::stop_all() {
    while (!feeds.empty()) {
        stop(feeds.begin()->first);
    }
}

void DepthFeed::set_book_listener(BookListener listener) {
    book_listener = std::move(listener);
}

bool DepthFeed::is_started(const std::string& symbol) const {
    return feeds.count(normalize_symbol(symbol)) > 0;
}

bool DepthFeed::is_snapshot_pending(const std::string& symbol) const {
    auto it = feeds.find(normalize_symbol(symbol));
    return it != feeds.end() && it->second.snapshot_timer.has_value();
}

void DepthFeed::on_depth_message(const std::string& symbol, const nlohmann::json& data) {
    DepthDiff diff;
    try {
        diff = stream::parse_depth_diff(data);
    } catch (const ValidationError& e) {
        logger->error("Dropping malformed depth diff for {}: {}", symbol, e.what());
        return;
    }

    if (!diff.symbol.empty() && normalize_symbol(diff.symbol) != symbol) {
        logger->warn("Depth diff for {} arrived on the {} stream", diff.symbol, symbol);
        return;
    }
    diff.symbol = symbol;

    APPLY_RESULT result = synchronizer.apply_diff(symbol, diff);
    if (result == APPLY_RESULT::APPLIED) {
        notify(symbol);
    } else if (result == APPLY_RESULT::GAP) {
        logger->warn("Resyncing {} after sequence gap", symbol);
    }

    if (synchronizer.needs_snapshot(symbol)) {
        schedule_snapshot(symbol);
    }
}

void DepthFeed::schedule_snapshot(const std::string& symbol) {
    auto it = feeds.find(symbol);
    if (it == feeds.end() || it->second.snapshot_timer) {
        return;
    }
    it->second.snapshot_timer =
        scheduler.schedule(config.resync_delay, [this, symbol]() { request_snapshot(symbol); });
}

void DepthFeed::request_snapshot(const std::string& symbol) {
    auto it = feeds.find(symbol);
    if (it == feeds.end()) {
        return;
    }
    it->second.snapshot_timer.reset();

    try {
        synchronizer.load_snapshot(symbol);
    } catch (const ConnectionError& e) {
        logger->error("Snapshot for {} failed, retrying in {} ms: {}", symbol, config.resync_delay.count(), e.what());
        schedule_snapshot(symbol);
        return;
    }

    if (synchronizer.needs_snapshot(symbol)) {
        // the buffered diffs did not bridge onto the snapshot
        schedule_snapshot(symbol);
        return;
    }
    notify(symbol);
}

void DepthFeed::notify(const std::string& symbol) {
    if (!book_listener) {
        return;
    }
    const OrderBook* book = synchronizer.get_book(symbol);
    if (book != nullptr) {
        book_listener(*book);
    }
}

} // namespace perpdesk::md
