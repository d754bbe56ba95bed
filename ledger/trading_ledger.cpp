#include "trading_ledger.H"

#include "common/errors.H"
#include "risk/risk_calculator.H"

#include <algorithm>

namespace perpdesk::ledger {

namespace {

Timestamp now() {
    return std::chrono::system_clock::now();
}

} // namespace

TradingLedger::TradingLedger(const LedgerConfig& config, const RiskConfig& risk_config,
                             std::shared_ptr<spdlog::logger> logger, const PriceSource* prices)
    : config(config), risk_config(risk_config), logger(logger), prices(prices), validator(config, logger) {
    wallet.balance = config.default_balance;
    wallet.available_balance = config.default_balance;
    wallet.updated_at = now();
}

const Order& TradingLedger::create_order(const CreateOrderParams& params) {
    std::vector<REJECT_REASON> reasons = validator.validate_new_order(params);
    if (!reasons.empty()) {
        throw ValidationError(OrderValidator::describe(reasons));
    }

    std::string symbol = normalize_symbol(params.symbol);
    Decimal price = reference_price(params, symbol);

    Decimal reservation;
    if (params.reduce_only) {
        const Position* position = get_position(symbol);
        if (position == nullptr || position->side == position_side_for(params.side)) {
            throw ValidationError("Reduce only order for " + symbol + " has no position to reduce");
        }
        if (params.quantity > position->quantity) {
            throw ValidationError("Reduce only quantity " + params.quantity.to_string() + " exceeds position size " +
                                  position->quantity.to_string());
        }
    } else {
        const Position* position = get_position(symbol);
        if (position != nullptr && position->side == position_side_for(params.side)) {
            if (params.leverage != position->leverage) {
                throw ValidationError("Leverage " + std::to_string(params.leverage) + " does not match the open " +
                                      symbol + " position leverage " + std::to_string(position->leverage));
            }
            // a market add is charged exactly what fill_order will take
            reservation = params.type == ORDER_TYPE::MARKET ? add_margin(*position, params.quantity, price)
                                                            : risk::margin_required(params.quantity, price,
                                                                                    params.leverage);
        } else {
            reservation = risk::margin_required(params.quantity, price, params.leverage);
        }
    }

    Decimal required = reservation;
    if (params.type == ORDER_TYPE::MARKET) {
        required += risk::commission(params.quantity, price, risk_config.taker_fee, risk_config.commission_precision);
    }
    if (required > wallet.available_balance) {
        logger->warn("Rejecting {} {} {}: required {} available {}", to_string(params.side), params.quantity.to_string(),
                     symbol, required.to_string(), wallet.available_balance.to_string());
        throw InsufficientMarginError("Insufficient margin. Required: " + required.to_string() +
                                      ", Available: " + wallet.available_balance.to_string());
    }

    Timestamp ts = now();
    uint64_t id = next_order_id++;
    Order& order = orders[id];
    order.id = id;
    order.symbol = symbol;
    order.side = params.side;
    order.type = params.type;
    order.status = ORDER_STATUS::PENDING;
    order.price = params.price;
    order.stop_price = params.stop_price;
    order.quantity = params.quantity;
    order.leverage = params.leverage;
    order.margin_mode = params.margin_mode;
    order.reduce_only = params.reduce_only;
    order.created_at = ts;
    order.updated_at = ts;

    order.margin_reserved = reservation;
    wallet.available_balance -= reservation;
    wallet.updated_at = ts;

    logger->info("Order {} created: {} {} {} {} at {} reserving {}", id, to_string(order.type), to_string(order.side),
                 order.quantity.to_string(), symbol, price.to_string(), reservation.to_string());

    if (order.type == ORDER_TYPE::MARKET) {
        fill_order(order, price, order.quantity, false);
    } else {
        order.status = ORDER_STATUS::OPEN;
    }
    return order;
}

const Order& TradingLedger::execute_order(uint64_t order_id, Decimal price, std::optional<Decimal> quantity) {
    Order& order = find_order(order_id);
    if (!order.is_active()) {
        throw InvalidStateTransitionError("Cannot execute order " + std::to_string(order_id) + " in state " +
                                          to_string(order.status));
    }
    if (!price.is_positive()) {
        throw ValidationError("Execution price must be positive: " + price.to_string());
    }

    Decimal remaining = order.remaining_quantity();
    Decimal fill = quantity.value_or(remaining);
    if (!fill.is_positive() || fill > remaining) {
        throw ValidationError("Execution quantity " + fill.to_string() + " outside of (0, " + remaining.to_string() +
                              "]");
    }

    fill_order(order, price, fill, false);
    return order;
}

const Order& TradingLedger::cancel_order(uint64_t order_id) {
    Order& order = find_order(order_id);
    if (!order.is_active()) {
        throw InvalidStateTransitionError("Cannot cancel order " + std::to_string(order_id) + " in state " +
                                          to_string(order.status));
    }

    release_reservation(order);
    Timestamp ts = now();
    order.status = ORDER_STATUS::CANCELLED;
    order.cancelled_at = ts;
    order.updated_at = ts;
    logger->info("Order {} cancelled, {} of {} filled", order_id, order.filled_quantity.to_string(),
                 order.quantity.to_string());
    return order;
}

size_t TradingLedger::cancel_all_orders(const std::optional<std::string>& symbol) {
    std::optional<std::string> filter;
    if (symbol) {
        filter = normalize_symbol(*symbol);
    }

    size_t cancelled = 0;
    for (auto& [id, order] : orders) {
        if (!order.is_active() || (filter && order.symbol != *filter)) {
            continue;
        }
        cancel_order(id);
        ++cancelled;
    }
    return cancelled;
}

const Position& TradingLedger::close_position(uint64_t position_id, std::optional<Decimal> quantity) {
    Position& position = find_position(position_id);
    if (!position.is_open) {
        throw InvalidStateTransitionError("Position " + std::to_string(position_id) + " is already closed");
    }

    Decimal close_quantity = quantity.value_or(position.quantity);
    if (!close_quantity.is_positive() || close_quantity > position.quantity) {
        throw ValidationError("Close quantity " + close_quantity.to_string() + " outside of (0, " +
                              position.quantity.to_string() + "]");
    }

    Decimal mark = require_mark(position.symbol);
    close_at(position, close_quantity, mark);
    return position;
}

const Position& TradingLedger::update_position_tp_sl(uint64_t position_id, std::optional<Decimal> take_profit,
                                                     std::optional<Decimal> stop_loss) {
    Position& position = find_position(position_id);
    if (!position.is_open) {
        throw InvalidStateTransitionError("Position " + std::to_string(position_id) + " is already closed");
    }
    if (take_profit && !take_profit->is_positive()) {
        throw ValidationError("Take profit must be positive: " + take_profit->to_string());
    }
    if (stop_loss && !stop_loss->is_positive()) {
        throw ValidationError("Stop loss must be positive: " + stop_loss->to_string());
    }

    position.take_profit = take_profit;
    position.stop_loss = stop_loss;
    position.updated_at = now();
    return position;
}

void TradingLedger::on_mark_price(const std::string& raw_symbol, Decimal price) {
    if (!price.is_positive()) {
        throw ValidationError("Mark price must be positive: " + price.to_string());
    }
    std::string symbol = normalize_symbol(raw_symbol);
    marks[symbol] = price;

    for (auto& [id, order] : orders) {
        if (order.symbol != symbol || !order.is_active()) {
            continue;
        }
        bool resting = order.type == ORDER_TYPE::LIMIT || (order.type == ORDER_TYPE::STOP_LIMIT && order.triggered);
        if (resting && limit_crosses(order, price)) {
            fill_order(order, *order.price, order.remaining_quantity(), true);
        }
    }

    for (auto& [id, order] : orders) {
        if (order.symbol != symbol || !order.is_active() || !is_stop(order.type) || order.triggered) {
            continue;
        }
        if (!stop_triggers(order, price)) {
            continue;
        }
        order.triggered = true;
        order.updated_at = now();
        logger->info("Order {} triggered at mark {}", id, price.to_string());

        if (order.type == ORDER_TYPE::STOP_MARKET) {
            fill_order(order, price, order.remaining_quantity(), false);
        } else if (limit_crosses(order, price)) {
            fill_order(order, *order.price, order.remaining_quantity(), false);
        }
    }

    check_take_profit_stop_loss(symbol, price);
    check_liquidation(symbol, price);
}

void TradingLedger::reset_wallet() {
    size_t cancelled = cancel_all_orders();

    Timestamp ts = now();
    size_t closed = 0;
    for (auto& [id, position] : positions) {
        if (!position.is_open) {
            continue;
        }
        position.is_open = false;
        position.margin = Decimal();
        position.closed_at = ts;
        position.updated_at = ts;
        ++closed;
    }
    open_position_ids.clear();

    wallet.balance = config.default_balance;
    wallet.available_balance = config.default_balance;
    wallet.updated_at = ts;
    logger->info("Wallet reset to {}, {} orders cancelled, {} positions closed", config.default_balance.to_string(),
                 cancelled, closed);
}

const Position* TradingLedger::get_position(const std::string& symbol) const {
    auto it = open_position_ids.find(normalize_symbol(symbol));
    if (it == open_position_ids.end()) {
        return nullptr;
    }
    return &positions.at(it->second);
}

const Position& TradingLedger::get_position_by_id(uint64_t position_id) const {
    auto it = positions.find(position_id);
    if (it == positions.end()) {
        throw NotFoundError("Position " + std::to_string(position_id) + " not found");
    }
    return it->second;
}

const Order& TradingLedger::get_order(uint64_t order_id) const {
    auto it = orders.find(order_id);
    if (it == orders.end()) {
        throw NotFoundError("Order " + std::to_string(order_id) + " not found");
    }
    return it->second;
}

std::vector<Order> TradingLedger::get_orders() const {
    std::vector<Order> result;
    result.reserve(orders.size());
    for (const auto& [id, order] : orders) {
        result.push_back(order);
    }
    return result;
}

std::vector<Order> TradingLedger::get_active_orders(const std::optional<std::string>& symbol) const {
    std::optional<std::string> filter;
    if (symbol) {
        filter = normalize_symbol(*symbol);
    }
    std::vector<Order> result;
    for (const auto& [id, order] : orders) {
        if (order.is_active() && (!filter || order.symbol == *filter)) {
            result.push_back(order);
        }
    }
    return result;
}

std::vector<Position> TradingLedger::get_positions() const {
    std::vector<Position> result;
    result.reserve(positions.size());
    for (const auto& [id, position] : positions) {
        result.push_back(position);
    }
    return result;
}

std::vector<Position> TradingLedger::get_open_positions(const std::optional<std::string>& symbol) const {
    std::optional<std::string> filter;
    if (symbol) {
        filter = normalize_symbol(*symbol);
    }
    std::vector<Position> result;
    for (const auto& [id, position] : positions) {
        if (position.is_open && (!filter || position.symbol == *filter)) {
            result.push_back(position);
        }
    }
    return result;
}

PositionMetrics TradingLedger::position_metrics(uint64_t position_id, std::optional<Decimal> mark) const {
    const Position& position = get_position_by_id(position_id);
    Decimal price = mark ? *mark : require_mark(position.symbol);

    PositionMetrics metrics;
    metrics.mark_price = price;
    metrics.unrealized_pnl = risk::unrealized_pnl(position.side, position.quantity, position.entry_price, price);
    metrics.roe = risk::roe(metrics.unrealized_pnl, position.margin);
    metrics.notional = risk::notional(position.quantity, price);
    metrics.risk_level = risk::liquidation_risk_level(position.side, position.quantity, position.entry_price,
                                                      position.margin, price);
    metrics.liquidation_risk = risk::is_liquidation_risk(position.side, position.quantity, position.entry_price,
                                                         position.margin, price);
    return metrics;
}

std::optional<Decimal> TradingLedger::get_mark_price(const std::string& symbol) const {
    auto it = marks.find(normalize_symbol(symbol));
    if (it == marks.end()) {
        return std::nullopt;
    }
    return it->second;
}

Decimal TradingLedger::reserved_margin() const {
    Decimal total;
    for (const auto& [id, order] : orders) {
        total += order.margin_reserved;
    }
    return total;
}

Decimal TradingLedger::position_margin() const {
    Decimal total;
    for (const auto& [id, position] : positions) {
        if (position.is_open) {
            total += position.margin;
        }
    }
    return total;
}

Order& TradingLedger::find_order(uint64_t order_id) {
    auto it = orders.find(order_id);
    if (it == orders.end()) {
        throw NotFoundError("Order " + std::to_string(order_id) + " not found");
    }
    return it->second;
}

Position& TradingLedger::find_position(uint64_t position_id) {
    auto it = positions.find(position_id);
    if (it == positions.end()) {
        throw NotFoundError("Position " + std::to_string(position_id) + " not found");
    }
    return it->second;
}

Position* TradingLedger::open_position(const std::string& symbol) {
    auto it = open_position_ids.find(symbol);
    if (it == open_position_ids.end()) {
        return nullptr;
    }
    return &positions.at(it->second);
}

Decimal TradingLedger::reference_price(const CreateOrderParams& params, const std::string& symbol) const {
    switch (params.type) {
        case ORDER_TYPE::LIMIT:
        case ORDER_TYPE::STOP_LIMIT:
            return *params.price;
        case ORDER_TYPE::STOP_MARKET:
            return *params.stop_price;
        case ORDER_TYPE::MARKET:
            break;
    }
    return require_mark(symbol);
}

Decimal TradingLedger::require_mark(const std::string& symbol) const {
    auto it = marks.find(symbol);
    if (it != marks.end()) {
        return it->second;
    }
    if (prices != nullptr) {
        std::optional<Decimal> price = prices->get_price(symbol);
        if (price && price->is_positive()) {
            return *price;
        }
    }
    throw ValidationError("No market price available for " + symbol);
}

bool TradingLedger::fill_order(Order& order, Decimal price, Decimal quantity, bool is_maker) {
    Decimal remaining = order.remaining_quantity();
    Decimal release = quantity == remaining
                          ? order.margin_reserved
                          : Decimal::mul_div(order.margin_reserved, quantity, remaining, ROUNDING::DOWN);
    Decimal fee_rate = risk::fee_rate(is_maker, risk_config);
    Decimal available = wallet.available_balance + release;

    Position* position = open_position(order.symbol);
    POSITION_SIDE direction = position_side_for(order.side);
    Decimal fee = risk::commission(quantity, price, fee_rate, risk_config.commission_precision);

    if (position == nullptr || position->side == direction) {
        if (order.reduce_only) {
            reject_order(order, "no opposing position left to reduce");
            return false;
        }

        Decimal delta = position != nullptr ? add_margin(*position, quantity, price)
                                            : risk::margin_required(quantity, price, order.leverage);
        if ((available - delta - fee).is_negative()) {
            reject_order(order, "insufficient balance for margin " + delta.to_string() + " and commission " +
                                    fee.to_string());
            return false;
        }

        order.margin_reserved -= release;
        wallet.available_balance = available - delta - fee;
        wallet.balance -= fee;

        if (position != nullptr) {
            Decimal new_quantity = position->quantity + quantity;
            position->cost_basis.add(quantity, price);
            position->entry_price = position->cost_basis.average(new_quantity);
            position->quantity = new_quantity;
            position->margin += delta;
            position->liquidation_price = risk::liquidation_price(position->side, position->entry_price,
                                                                  position->leverage,
                                                                  risk_config.liquidation_buffer);
            position->updated_at = now();
            logger->info("Position {} increased to {} {} at entry {}", position->id, position->quantity.to_string(),
                         position->symbol, position->entry_price.to_string());
        } else {
            position = &open_new_position(order.symbol, direction, quantity, price, order.leverage,
                                          order.margin_mode);
        }
        record_trade(order.id, *position, order.side, price, quantity, fee, Decimal());
    } else {
        Decimal close_quantity = std::min(quantity, position->quantity);
        Decimal excess = quantity - close_quantity;
        if (order.reduce_only && excess.is_positive()) {
            reject_order(order, "fill exceeds the position it reduces");
            return false;
        }

        Decimal close_fee = excess.is_positive()
                                ? risk::commission(close_quantity, price, fee_rate, risk_config.commission_precision)
                                : fee;
        Decimal open_fee = excess.is_positive()
                               ? risk::commission(excess, price, fee_rate, risk_config.commission_precision)
                               : Decimal();
        ReducePreview preview = preview_reduce(*position, close_quantity, price, close_fee, available);

        Decimal open_margin;
        if (excess.is_positive()) {
            open_margin = risk::margin_required(excess, price, order.leverage);
            if ((preview.available_after - open_margin - open_fee).is_negative()) {
                reject_order(order, "insufficient balance to open the reversed position");
                return false;
            }
        }

        order.margin_reserved -= release;
        wallet.available_balance += release;
        apply_reduce(*position, preview, close_quantity, price, close_fee, order.id);

        if (excess.is_positive()) {
            wallet.available_balance -= open_margin + open_fee;
            wallet.balance -= open_fee;
            Position& flipped =
                open_new_position(order.symbol, direction, excess, price, order.leverage, order.margin_mode);
            record_trade(order.id, flipped, order.side, price, excess, open_fee, Decimal());
        }
        fee = close_fee + open_fee;
    }

    Timestamp ts = now();
    order.average_price = order.average_price
                              ? Decimal::weighted_average(order.filled_quantity, *order.average_price, quantity, price)
                              : price;
    order.filled_quantity += quantity;
    order.commission += fee;
    order.updated_at = ts;
    if (order.filled_quantity == order.quantity) {
        order.status = ORDER_STATUS::FILLED;
        order.filled_at = ts;
    } else {
        order.status = ORDER_STATUS::PARTIALLY_FILLED;
    }
    wallet.updated_at = ts;

    logger->info("Order {} filled {} at {} ({} of {}), commission {}", order.id, quantity.to_string(),
                 price.to_string(), order.filled_quantity.to_string(), order.quantity.to_string(), fee.to_string());
    return true;
}

void TradingLedger::reject_order(Order& order, const std::string& reason) {
    release_reservation(order);
    order.status = ORDER_STATUS::REJECTED;
    order.updated_at = now();
    logger->warn("Order {} rejected: {}", order.id, reason);
}

void TradingLedger::release_reservation(Order& order) {
    wallet.available_balance += order.margin_reserved;
    order.margin_reserved = Decimal();
    wallet.updated_at = now();
}

Decimal TradingLedger::add_margin(const Position& position, Decimal quantity, Decimal price) const {
    Decimal new_quantity = position.quantity + quantity;
    Notional basis = position.cost_basis;
    basis.add(quantity, price);
    return risk::margin_required(new_quantity, basis.average(new_quantity), position.leverage) - position.margin;
}

TradingLedger::ReducePreview TradingLedger::preview_reduce(const Position& position, Decimal quantity, Decimal price,
                                                           Decimal fee, Decimal available_before) const {
    ReducePreview preview;
    preview.pnl = risk::unrealized_pnl(position.side, quantity, position.entry_price, price);
    preview.released_margin = quantity == position.quantity
                                  ? position.margin
                                  : Decimal::mul_div(position.margin, quantity, position.quantity, ROUNDING::DOWN);
    preview.available_after = available_before + preview.released_margin + preview.pnl - fee;
    if (preview.available_after.is_negative()) {
        preview.shortfall = -preview.available_after;
        preview.available_after = Decimal();
    }
    return preview;
}

void TradingLedger::apply_reduce(Position& position, const ReducePreview& preview, Decimal quantity, Decimal price,
                                 Decimal fee, std::optional<uint64_t> order_id) {
    Decimal realized = preview.pnl + preview.shortfall;
    if (preview.shortfall.is_positive()) {
        logger->error("Position {} bankrupt: loss capped, shortfall {} not charged", position.id,
                      preview.shortfall.to_string());
    }

    wallet.balance += realized - fee;
    wallet.available_balance = preview.available_after;
    wallet.updated_at = now();

    Timestamp ts = now();
    position.quantity -= quantity;
    position.margin -= preview.released_margin;
    position.realized_pnl += realized;
    position.updated_at = ts;
    if (position.quantity.is_zero()) {
        position.is_open = false;
        position.margin = Decimal();
        position.closed_at = ts;
        open_position_ids.erase(position.symbol);
        logger->info("Position {} closed at {}, realized {}", position.id, price.to_string(),
                     position.realized_pnl.to_string());
    } else {
        // the remainder keeps its entry
        position.cost_basis = Notional::of(position.quantity, position.entry_price);
        logger->info("Position {} reduced by {} at {}, {} left", position.id, quantity.to_string(), price.to_string(),
                     position.quantity.to_string());
    }

    record_trade(order_id, position, closing_side(position.side), price, quantity, fee, realized);
}

Position& TradingLedger::open_new_position(const std::string& symbol, POSITION_SIDE side, Decimal quantity,
                                           Decimal price, uint32_t leverage, MARGIN_MODE margin_mode) {
    Timestamp ts = now();
    uint64_t id = next_position_id++;
    Position& position = positions[id];
    position.id = id;
    position.symbol = symbol;
    position.side = side;
    position.quantity = quantity;
    position.entry_price = price;
    position.cost_basis = Notional::of(quantity, price);
    position.leverage = leverage;
    position.margin_mode = margin_mode;
    position.margin = risk::margin_required(quantity, price, leverage);
    position.liquidation_price = risk::liquidation_price(side, price, leverage, risk_config.liquidation_buffer);
    position.opened_at = ts;
    position.updated_at = ts;
    open_position_ids[symbol] = id;

    logger->info("Position {} opened: {} {} {} at {}, margin {}, liquidation {}", id, to_string(side),
                 quantity.to_string(), symbol, price.to_string(), position.margin.to_string(),
                 position.liquidation_price.to_string());
    return position;
}

void TradingLedger::close_at(Position& position, Decimal quantity, Decimal price) {
    Decimal fee = risk::commission(quantity, price, risk_config.taker_fee, risk_config.commission_precision);
    ReducePreview preview = preview_reduce(position, quantity, price, fee, wallet.available_balance);
    apply_reduce(position, preview, quantity, price, fee, std::nullopt);
}

void TradingLedger::record_trade(std::optional<uint64_t> order_id, const Position& position, SIDE side,
                                 Decimal price, Decimal quantity, Decimal fee, Decimal realized_pnl) {
    Trade trade;
    trade.id = next_trade_id++;
    trade.order_id = order_id;
    trade.position_id = position.id;
    trade.symbol = position.symbol;
    trade.side = side;
    trade.price = price;
    trade.quantity = quantity;
    trade.commission = fee;
    trade.realized_pnl = realized_pnl;
    trade.executed_at = now();
    trades.push_back(trade);
}

bool TradingLedger::limit_crosses(const Order& order, Decimal mark) const {
    if (order.side == SIDE::BUY) {
        return mark <= *order.price;
    }
    return mark >= *order.price;
}

bool TradingLedger::stop_triggers(const Order& order, Decimal mark) const {
    if (order.side == SIDE::BUY) {
        return mark >= *order.stop_price;
    }
    return mark <= *order.stop_price;
}

void TradingLedger::check_take_profit_stop_loss(const std::string& symbol, Decimal mark) {
    Position* position = open_position(symbol);
    if (position == nullptr) {
        return;
    }

    bool is_long = position->side == POSITION_SIDE::LONG;
    bool take_profit = position->take_profit && (is_long ? mark >= *position->take_profit
                                                         : mark <= *position->take_profit);
    bool stop_loss = position->stop_loss && (is_long ? mark <= *position->stop_loss
                                                     : mark >= *position->stop_loss);
    if (!take_profit && !stop_loss) {
        return;
    }

    logger->info("Position {} hit {} at mark {}", position->id, take_profit ? "take profit" : "stop loss",
                 mark.to_string());
    close_at(*position, position->quantity, mark);
}

void TradingLedger::check_liquidation(const std::string& symbol, Decimal mark) {
    Position* position = open_position(symbol);
    if (position == nullptr || !risk::is_liquidated(position->side, position->liquidation_price, mark)) {
        return;
    }

    logger->warn("Liquidating position {} {} {} at {}, mark {}", position->id, to_string(position->side),
                 position->symbol, position->liquidation_price.to_string(), mark.to_string());
    position->liquidated = true;
    close_at(*position, position->quantity, position->liquidation_price);
}

} // namespace perpdesk::ledger
