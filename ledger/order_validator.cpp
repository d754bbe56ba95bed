#include "order_validator.H"

namespace perpdesk::ledger {

const char* to_string(REJECT_REASON reason) {
    switch (reason) {
        case REJECT_REASON::NONE:
            return "none";
        case REJECT_REASON::EMPTY_SYMBOL:
            return "symbol is required";
        case REJECT_REASON::INVALID_LEVERAGE:
            return "leverage out of range";
        case REJECT_REASON::INVALID_QUANTITY:
            return "quantity must be positive";
        case REJECT_REASON::QUANTITY_PRECISION:
            return "quantity has too many decimals";
        case REJECT_REASON::MISSING_PRICE:
            return "price is required";
        case REJECT_REASON::INVALID_PRICE:
            return "price must be positive";
        case REJECT_REASON::MISSING_STOP_PRICE:
            return "stop price is required";
        case REJECT_REASON::INVALID_STOP_PRICE:
            return "stop price must be positive";
    }
    return "unknown";
}

OrderValidator::OrderValidator(const LedgerConfig& config, std::shared_ptr<spdlog::logger> logger)
    : config(config), logger(logger) {}

std::vector<REJECT_REASON> OrderValidator::validate_new_order(const CreateOrderParams& params) const {
    std::vector<REJECT_REASON> reasons;

    if (params.symbol.empty()) {
        logger->error("Order has no symbol");
        reasons.push_back(REJECT_REASON::EMPTY_SYMBOL);
    }

    if (params.leverage < config.min_leverage || params.leverage > config.max_leverage) {
        logger->error("Leverage {} outside of range [{}, {}]", params.leverage, config.min_leverage,
                      config.max_leverage);
        reasons.push_back(REJECT_REASON::INVALID_LEVERAGE);
    }

    if (!params.quantity.is_positive()) {
        logger->error("Quantity {} is not positive", params.quantity.to_string());
        reasons.push_back(REJECT_REASON::INVALID_QUANTITY);
    } else if (params.quantity.decimal_places() > config.quantity_precision) {
        logger->error("Quantity {} has more than {} decimals", params.quantity.to_string(),
                      config.quantity_precision);
        reasons.push_back(REJECT_REASON::QUANTITY_PRECISION);
    }

    bool needs_price = params.type == ORDER_TYPE::LIMIT || params.type == ORDER_TYPE::STOP_LIMIT;
    if (needs_price && !params.price) {
        logger->error("{} order without price", to_string(params.type));
        reasons.push_back(REJECT_REASON::MISSING_PRICE);
    }
    if (params.price && !params.price->is_positive()) {
        logger->error("Price {} is not positive", params.price->to_string());
        reasons.push_back(REJECT_REASON::INVALID_PRICE);
    }

    if (is_stop(params.type) && !params.stop_price) {
        logger->error("{} order without stop price", to_string(params.type));
        reasons.push_back(REJECT_REASON::MISSING_STOP_PRICE);
    }
    if (params.stop_price && !params.stop_price->is_positive()) {
        logger->error("Stop price {} is not positive", params.stop_price->to_string());
        reasons.push_back(REJECT_REASON::INVALID_STOP_PRICE);
    }

    return reasons;
}

std::string OrderValidator::describe(const std::vector<REJECT_REASON>& reasons) {
    std::string message = "Order validation failed: ";
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) {
            message += ", ";
        }
        message += to_string(reasons[i]);
    }
    return message;
}

} // namespace perpdesk::ledger
