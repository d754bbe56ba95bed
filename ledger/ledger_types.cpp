#include "ledger_types.H"

#include "common/errors.H"

#include <algorithm>
#include <cctype>

namespace perpdesk::ledger {

namespace {

std::string lowercase(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

const char* to_string(ORDER_TYPE type) {
    switch (type) {
        case ORDER_TYPE::LIMIT:
            return "limit";
        case ORDER_TYPE::MARKET:
            return "market";
        case ORDER_TYPE::STOP_LIMIT:
            return "stop_limit";
        case ORDER_TYPE::STOP_MARKET:
            return "stop_market";
    }
    return "unknown";
}

const char* to_string(ORDER_STATUS status) {
    switch (status) {
        case ORDER_STATUS::PENDING:
            return "pending";
        case ORDER_STATUS::OPEN:
            return "open";
        case ORDER_STATUS::PARTIALLY_FILLED:
            return "partially_filled";
        case ORDER_STATUS::FILLED:
            return "filled";
        case ORDER_STATUS::CANCELLED:
            return "cancelled";
        case ORDER_STATUS::REJECTED:
            return "rejected";
    }
    return "unknown";
}

const char* to_string(MARGIN_MODE mode) {
    return mode == MARGIN_MODE::CROSS ? "cross" : "isolated";
}

SIDE parse_side(std::string_view text) {
    std::string value = lowercase(text);
    if (value == "buy") {
        return SIDE::BUY;
    }
    if (value == "sell") {
        return SIDE::SELL;
    }
    throw ValidationError("Invalid side: " + std::string(text));
}

ORDER_TYPE parse_order_type(std::string_view text) {
    std::string value = lowercase(text);
    if (value == "limit") {
        return ORDER_TYPE::LIMIT;
    }
    if (value == "market") {
        return ORDER_TYPE::MARKET;
    }
    if (value == "stop_limit") {
        return ORDER_TYPE::STOP_LIMIT;
    }
    if (value == "stop_market") {
        return ORDER_TYPE::STOP_MARKET;
    }
    throw ValidationError("Invalid order type: " + std::string(text));
}

MARGIN_MODE parse_margin_mode(std::string_view text) {
    std::string value = lowercase(text);
    if (value == "cross") {
        return MARGIN_MODE::CROSS;
    }
    if (value == "isolated") {
        return MARGIN_MODE::ISOLATED;
    }
    throw ValidationError("Invalid margin mode: " + std::string(text));
}

} // namespace perpdesk::ledger
