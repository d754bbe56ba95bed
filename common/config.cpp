#include "config.H"
#include "errors.H"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace perpdesk {

namespace {

Decimal read_decimal(const json& j, const std::string& key) {
    try {
        if (j.is_string()) {
            return Decimal::parse(j.get<std::string>());
        }
        if (j.is_number_integer()) {
            return Decimal(j.get<int64_t>());
        }
        if (j.is_number_float()) {
            return Decimal::parse_rounded(j.dump(), ROUNDING::HALF_UP);
        }
    } catch (const ValidationError& e) {
        throw ValidationError("Config key '" + key + "': " + e.what());
    }
    throw ValidationError("Config key '" + key + "' must be a decimal string or number");
}

template <typename T>
T read_value(const json& section, const std::string& name, const std::string& key, T fallback) {
    auto it = section.find(name);
    if (it == section.end()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        throw ValidationError("Config key '" + key + "' has the wrong type: " + e.what());
    }
}

// json integers are cast, not range checked, by get<uint32_t>()
uint64_t read_count(const json& section, const std::string& name, const std::string& key, uint64_t fallback,
                    uint64_t max) {
    auto it = section.find(name);
    if (it == section.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw ValidationError("Config key '" + key + "' must be an integer");
    }
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value > max) {
            throw ValidationError("Config key '" + key + "' must not exceed " + std::to_string(max));
        }
        return value;
    }
    int64_t value = it->get<int64_t>();
    if (value < 0) {
        throw ValidationError("Config key '" + key + "' must not be negative");
    }
    if (static_cast<uint64_t>(value) > max) {
        throw ValidationError("Config key '" + key + "' must not exceed " + std::to_string(max));
    }
    return static_cast<uint64_t>(value);
}

std::chrono::milliseconds read_ms(const json& section, const std::string& name, const std::string& key,
                                  std::chrono::milliseconds fallback) {
    int64_t ms = read_value<int64_t>(section, name, key, fallback.count());
    if (ms < 0) {
        throw ValidationError("Config key '" + key + "' must not be negative");
    }
    return std::chrono::milliseconds(ms);
}

const json& section_of(const json& root, const std::string& name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) {
        return empty;
    }
    if (!it->is_object()) {
        throw ValidationError("Config section '" + name + "' must be an object");
    }
    return *it;
}

void parse_stream(const json& root, StreamConfig& cfg) {
    const json& s = section_of(root, "stream");
    cfg.base_url = read_value<std::string>(s, "base_url", "stream.base_url", cfg.base_url);

    std::string mode = read_value<std::string>(s, "topology_mode", "stream.topology_mode",
                                               to_string(cfg.topology_mode));
    if (mode == "control_frames") {
        cfg.topology_mode = TOPOLOGY_MODE::CONTROL_FRAMES;
    } else if (mode == "reconnect") {
        cfg.topology_mode = TOPOLOGY_MODE::RECONNECT;
    } else {
        throw ValidationError("Config key 'stream.topology_mode' must be control_frames or reconnect");
    }

    cfg.reconnect_base = read_ms(s, "reconnect_base_ms", "stream.reconnect_base_ms", cfg.reconnect_base);
    cfg.reconnect_max = read_ms(s, "reconnect_max_ms", "stream.reconnect_max_ms", cfg.reconnect_max);
    cfg.reconnect_multiplier = read_value<double>(s, "reconnect_multiplier", "stream.reconnect_multiplier",
                                                  cfg.reconnect_multiplier);

    if (cfg.reconnect_base.count() == 0) {
        throw ValidationError("Config key 'stream.reconnect_base_ms' must be positive");
    }
    if (cfg.reconnect_max < cfg.reconnect_base) {
        throw ValidationError("Config key 'stream.reconnect_max_ms' must be >= reconnect_base_ms");
    }
    if (cfg.reconnect_multiplier < 1.0) {
        throw ValidationError("Config key 'stream.reconnect_multiplier' must be >= 1");
    }
}

void parse_rest(const json& root, RestConfig& cfg) {
    const json& r = section_of(root, "rest");
    cfg.base_url = read_value<std::string>(r, "base_url", "rest.base_url", cfg.base_url);
    cfg.depth_path = read_value<std::string>(r, "depth_path", "rest.depth_path", cfg.depth_path);
    cfg.timeout = read_ms(r, "timeout_ms", "rest.timeout_ms", cfg.timeout);
    cfg.max_retries =
        static_cast<uint32_t>(read_count(r, "max_retries", "rest.max_retries", cfg.max_retries, 100));
    cfg.retry_delay = read_ms(r, "retry_delay_ms", "rest.retry_delay_ms", cfg.retry_delay);
    cfg.depth_limit =
        static_cast<uint32_t>(read_count(r, "depth_limit", "rest.depth_limit", cfg.depth_limit, 5000));

    if (cfg.timeout.count() == 0) {
        throw ValidationError("Config key 'rest.timeout_ms' must be positive");
    }
    if (cfg.depth_limit == 0) {
        throw ValidationError("Config key 'rest.depth_limit' must be positive");
    }
}

void parse_book(const json& root, BookConfig& cfg) {
    const json& b = section_of(root, "book");
    cfg.buffer_limit = static_cast<size_t>(
        read_count(b, "buffer_limit", "book.buffer_limit", cfg.buffer_limit, std::numeric_limits<uint32_t>::max()));
    cfg.resync_delay = read_ms(b, "resync_delay_ms", "book.resync_delay_ms", cfg.resync_delay);
}

void parse_risk(const json& root, RiskConfig& cfg) {
    const json& r = section_of(root, "risk");
    if (r.contains("taker_fee")) {
        cfg.taker_fee = read_decimal(r["taker_fee"], "risk.taker_fee");
    }
    if (r.contains("maker_fee")) {
        cfg.maker_fee = read_decimal(r["maker_fee"], "risk.maker_fee");
    }
    if (r.contains("liquidation_buffer")) {
        cfg.liquidation_buffer = read_decimal(r["liquidation_buffer"], "risk.liquidation_buffer");
    }
    cfg.commission_precision = read_value<int>(r, "commission_precision", "risk.commission_precision",
                                               cfg.commission_precision);

    if (cfg.taker_fee.is_negative() || cfg.maker_fee.is_negative()) {
        throw ValidationError("Config keys 'risk.taker_fee' and 'risk.maker_fee' must not be negative");
    }
    if (!cfg.liquidation_buffer.is_positive() || cfg.liquidation_buffer > Decimal(1)) {
        throw ValidationError("Config key 'risk.liquidation_buffer' must be in (0, 1]");
    }
    if (cfg.commission_precision < 0 || cfg.commission_precision > Decimal::SCALE) {
        throw ValidationError("Config key 'risk.commission_precision' must be in [0, 8]");
    }
}

void parse_ledger(const json& root, LedgerConfig& cfg) {
    const json& l = section_of(root, "ledger");
    if (l.contains("default_balance")) {
        cfg.default_balance = read_decimal(l["default_balance"], "ledger.default_balance");
    }
    cfg.min_leverage = static_cast<uint32_t>(
        read_count(l, "min_leverage", "ledger.min_leverage", cfg.min_leverage, MAX_LEVERAGE));
    cfg.max_leverage = static_cast<uint32_t>(
        read_count(l, "max_leverage", "ledger.max_leverage", cfg.max_leverage, MAX_LEVERAGE));
    cfg.quantity_precision = read_value<int>(l, "quantity_precision", "ledger.quantity_precision",
                                             cfg.quantity_precision);

    if (cfg.default_balance.is_negative()) {
        throw ValidationError("Config key 'ledger.default_balance' must not be negative");
    }
    if (cfg.min_leverage == 0 || cfg.max_leverage < cfg.min_leverage) {
        throw ValidationError("Config keys 'ledger.min_leverage'/'ledger.max_leverage' are out of range");
    }
    if (cfg.quantity_precision < 0 || cfg.quantity_precision > Decimal::SCALE) {
        throw ValidationError("Config key 'ledger.quantity_precision' must be in [0, 8]");
    }
}

} // namespace

AppConfig parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ValidationError("Config root must be an object");
    }

    AppConfig cfg;
    parse_stream(root, cfg.stream);
    parse_rest(root, cfg.rest);
    parse_book(root, cfg.book);
    parse_risk(root, cfg.risk);
    parse_ledger(root, cfg.ledger);

    cfg.symbols = read_value<std::vector<std::string>>(root, "symbols", "symbols", cfg.symbols);
    if (cfg.symbols.empty()) {
        throw ValidationError("Config key 'symbols' must list at least one symbol");
    }
    cfg.log_dir = read_value<std::string>(root, "log_dir", "log_dir", cfg.log_dir);
    return cfg;
}

AppConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Failed to open config file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_config(ss.str());
}

const char* to_string(TOPOLOGY_MODE mode) {
    switch (mode) {
        case TOPOLOGY_MODE::CONTROL_FRAMES:
            return "control_frames";
        case TOPOLOGY_MODE::RECONNECT:
            return "reconnect";
    }
    return "unknown";
}

} // namespace perpdesk
