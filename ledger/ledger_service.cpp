#include "ledger_service.H"

#include "common/errors.H"

namespace perpdesk::ledger {

LedgerService::LedgerService(const LedgerConfig& config, const RiskConfig& risk_config,
                             std::shared_ptr<spdlog::logger> logger)
    : logger(logger), ledger(config, risk_config, logger), wallet(ledger.get_wallet()) {
    worker = std::thread([this]() { run(); });
}

LedgerService::~LedgerService() {
    stop();
}

std::future<Order> LedgerService::create_order(const CreateOrderParams& params) {
    return submit([params](TradingLedger& l) { return l.create_order(params); });
}

std::future<Order> LedgerService::execute_order(uint64_t order_id, Decimal price, std::optional<Decimal> quantity) {
    return submit([=](TradingLedger& l) { return l.execute_order(order_id, price, quantity); });
}

std::future<Order> LedgerService::cancel_order(uint64_t order_id) {
    return submit([order_id](TradingLedger& l) { return l.cancel_order(order_id); });
}

std::future<size_t> LedgerService::cancel_all_orders(std::optional<std::string> symbol) {
    return submit([symbol](TradingLedger& l) { return l.cancel_all_orders(symbol); });
}

std::future<Position> LedgerService::close_position(uint64_t position_id, std::optional<Decimal> quantity) {
    return submit([=](TradingLedger& l) { return l.close_position(position_id, quantity); });
}

std::future<Position> LedgerService::update_position_tp_sl(uint64_t position_id, std::optional<Decimal> take_profit,
                                                           std::optional<Decimal> stop_loss) {
    return submit([=](TradingLedger& l) { return l.update_position_tp_sl(position_id, take_profit, stop_loss); });
}

std::future<void> LedgerService::reset_wallet() {
    return submit([](TradingLedger& l) { l.reset_wallet(); });
}

std::future<std::optional<Position>> LedgerService::get_position(const std::string& symbol) {
    return submit([symbol](TradingLedger& l) -> std::optional<Position> {
        const Position* position = l.get_position(symbol);
        if (position == nullptr) {
            return std::nullopt;
        }
        return *position;
    });
}

std::future<std::vector<Order>> LedgerService::get_active_orders(std::optional<std::string> symbol) {
    return submit([symbol](TradingLedger& l) { return l.get_active_orders(symbol); });
}

std::future<std::vector<Position>> LedgerService::get_open_positions(std::optional<std::string> symbol) {
    return submit([symbol](TradingLedger& l) { return l.get_open_positions(symbol); });
}

std::future<std::vector<Trade>> LedgerService::get_trades() {
    return submit([](TradingLedger& l) { return l.get_trades(); });
}

std::future<PositionMetrics> LedgerService::position_metrics(uint64_t position_id, std::optional<Decimal> mark) {
    return submit([=](TradingLedger& l) { return l.position_metrics(position_id, mark); });
}

void LedgerService::post_mark_price(const std::string& symbol, Decimal price) {
    post([this, symbol, price]() {
        try {
            ledger.on_mark_price(symbol, price);
        } catch (const Error& e) {
            logger->error("Failed to apply mark price {} for {}: {}", price.to_string(), symbol, e.what());
        } catch (const std::exception& e) {
            logger->error("Arithmetic failure applying mark price {} for {}: {}", price.to_string(), symbol,
                          e.what());
        }
    });
}

Wallet LedgerService::wallet_snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    return wallet;
}

Decimal LedgerService::available_balance() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    return wallet.available_balance;
}

void LedgerService::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        stopping = true;
    }
    queue_cv.notify_all();
    if (worker.joinable()) {
        worker.join();
        logger->info("Ledger service stopped");
    }
}

void LedgerService::post(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping) {
            throw Error("Ledger service is stopped");
        }
        jobs.push_back(std::move(job));
    }
    queue_cv.notify_one();
}

void LedgerService::run() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_cv.wait(lock, [this]() { return stopping || !jobs.empty(); });
            if (jobs.empty()) {
                return;
            }
            job = std::move(jobs.front());
            jobs.pop_front();
        }
        job();
        publish();
    }
}

void LedgerService::publish() {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    wallet = ledger.get_wallet();
}

} // namespace perpdesk::ledger
