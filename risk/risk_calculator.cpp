#include "risk_calculator.H"
#include "common/errors.H"

#include <string>

namespace perpdesk::risk {

namespace {

Decimal leverage_decimal(uint32_t leverage) {
    if (leverage == 0) {
        throw ValidationError("Leverage must be at least 1");
    }
    return Decimal(static_cast<int64_t>(leverage));
}

} // namespace

const char* to_string(RISK_LEVEL level) {
    switch (level) {
        case RISK_LEVEL::SAFE:
            return "safe";
        case RISK_LEVEL::WARNING:
            return "warning";
        case RISK_LEVEL::DANGER:
            return "danger";
    }
    return "unknown";
}

Decimal notional(Decimal quantity, Decimal price) {
    return Decimal::mul(quantity, price);
}

Decimal margin_required(Decimal quantity, Decimal price, uint32_t leverage) {
    return Decimal::mul_div(quantity, price, leverage_decimal(leverage));
}

Decimal liquidation_price(POSITION_SIDE side, Decimal entry_price, uint32_t leverage, Decimal buffer_ratio) {
    Decimal lev = leverage_decimal(leverage);
    // entry * (lev -/+ buffer) / lev keeps buffer / leverage unrounded
    Decimal factor = side == POSITION_SIDE::LONG ? lev - buffer_ratio : lev + buffer_ratio;
    return Decimal::mul_div(entry_price, factor, lev);
}

Decimal unrealized_pnl(POSITION_SIDE side, Decimal quantity, Decimal entry_price, Decimal mark_price) {
    Decimal move = side == POSITION_SIDE::LONG ? mark_price - entry_price : entry_price - mark_price;
    return Decimal::mul(move, quantity);
}

Decimal roe(Decimal pnl, Decimal margin) {
    if (margin.is_zero()) {
        return Decimal();
    }
    return Decimal::mul_div(pnl, Decimal(100), margin);
}

Decimal commission(Decimal quantity, Decimal price, Decimal fee_rate, int precision) {
    return Decimal::mul3(quantity, price, fee_rate, ROUNDING::DOWN).round(precision, ROUNDING::DOWN);
}

Decimal fee_rate(bool is_maker, const RiskConfig& config) {
    return is_maker ? config.maker_fee : config.taker_fee;
}

bool is_liquidation_risk(POSITION_SIDE side, Decimal quantity, Decimal entry_price, Decimal margin,
                         Decimal mark_price) {
    Decimal remaining = margin + unrealized_pnl(side, quantity, entry_price, mark_price);
    return remaining <= Decimal();
}

RISK_LEVEL liquidation_risk_level(POSITION_SIDE side, Decimal quantity, Decimal entry_price, Decimal margin,
                                  Decimal mark_price) {
    if (margin.is_zero()) {
        return RISK_LEVEL::SAFE;
    }

    Decimal remaining = margin + unrealized_pnl(side, quantity, entry_price, mark_price);
    Decimal percent = Decimal::mul_div(remaining, Decimal(100), margin);

    if (percent < Decimal(25)) {
        return RISK_LEVEL::DANGER;
    }
    if (percent < Decimal(50)) {
        return RISK_LEVEL::WARNING;
    }
    return RISK_LEVEL::SAFE;
}

bool is_liquidated(POSITION_SIDE side, Decimal liquidation_price, Decimal mark_price) {
    if (side == POSITION_SIDE::LONG) {
        return mark_price <= liquidation_price;
    }
    return mark_price >= liquidation_price;
}

} // namespace perpdesk::risk
