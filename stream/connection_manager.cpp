#include "connection_manager.H"
#include "stream_protocol.H"

#include "common/errors.H"

#include <algorithm>

using json = nlohmann::json;

namespace perpdesk::stream {

const char* to_string(CONNECTION_STATUS status) {
    switch (status) {
        case CONNECTION_STATUS::DISCONNECTED:
            return "disconnected";
        case CONNECTION_STATUS::CONNECTING:
            return "connecting";
        case CONNECTION_STATUS::CONNECTED:
            return "connected";
        case CONNECTION_STATUS::RECONNECTING:
            return "reconnecting";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(Transport& transport, Scheduler& scheduler, const StreamConfig& config,
                                     std::shared_ptr<spdlog::logger> logger)
    : transport(transport), scheduler(scheduler), config(config), logger(logger),
      current_delay(config.reconnect_base) {
    transport.set_listener(this);
}

ConnectionManager::~ConnectionManager() {
    should_reconnect = false;
    cancel_reconnect();
    close_transport();
    transport.set_listener(nullptr);
}

ConnectionManager::Token ConnectionManager::subscribe(const std::string& stream_key, MessageHandler handler) {
    std::string key = normalize_stream_key(stream_key);
    if (key.empty()) {
        throw ValidationError("Stream key must not be empty");
    }
    if (!handler) {
        throw ValidationError("Handler for " + key + " must be callable");
    }

    Token token = next_token++;
    auto& handlers = subscriptions[key];
    bool new_key = handlers.empty();
    handlers.emplace(token, std::move(handler));
    token_to_key.emplace(token, key);

    if (new_key) {
        logger->info("Subscribed to {}", key);
    }

    if (status == CONNECTION_STATUS::CONNECTED) {
        if (new_key) {
            sync_topology();
        }
    } else if (status == CONNECTION_STATUS::DISCONNECTED) {
        connect();
    }
    return token;
}

bool ConnectionManager::unsubscribe(Token token) {
    auto it = token_to_key.find(token);
    if (it == token_to_key.end()) {
        return false;
    }
    std::string key = it->second;
    token_to_key.erase(it);

    auto sub = subscriptions.find(key);
    if (sub == subscriptions.end()) {
        return false;
    }
    sub->second.erase(token);
    if (!sub->second.empty()) {
        return true;
    }

    subscriptions.erase(sub);
    logger->info("Unsubscribed from {}", key);

    if (subscriptions.empty()) {
        disconnect();
    } else if (status == CONNECTION_STATUS::CONNECTED) {
        sync_topology();
    }
    return true;
}

void ConnectionManager::connect() {
    if (status != CONNECTION_STATUS::DISCONNECTED) {
        return;
    }
    if (subscriptions.empty()) {
        logger->info("No stream subscriptions, not connecting");
        return;
    }
    should_reconnect = true;
    cancel_reconnect();
    open_transport(CONNECTION_STATUS::CONNECTING);
}

void ConnectionManager::disconnect() {
    should_reconnect = false;
    cancel_reconnect();

    bool was_live = connection_id != 0;
    close_transport();

    if (status == CONNECTION_STATUS::DISCONNECTED) {
        return;
    }
    logger->info("Stream disconnected by caller");
    set_status(CONNECTION_STATUS::DISCONNECTED);
    if (was_live) {
        notify_disconnect();
    }
}

void ConnectionManager::open_transport(CONNECTION_STATUS next_status) {
    set_status(next_status);

    std::vector<std::string> keys = get_subscriptions();
    std::string url = build_stream_url(config.base_url, keys);
    logger->info("Opening stream connection: {}", url);

    live_keys.clear();
    pending_requests.clear();
    connection_id = transport.open(url);
    live_keys.insert(keys.begin(), keys.end());
}

void ConnectionManager::close_transport() {
    if (connection_id != 0) {
        connection_id = 0;
        transport.close();
    }
    live_keys.clear();
    pending_requests.clear();
}

void ConnectionManager::reconnect_now() {
    cancel_reconnect();
    close_transport();
    should_reconnect = true;
    open_transport(CONNECTION_STATUS::CONNECTING);
}

void ConnectionManager::schedule_reconnect() {
    cancel_reconnect();
    set_status(CONNECTION_STATUS::RECONNECTING);

    std::chrono::milliseconds delay = current_delay;
    logger->info("Reconnecting in {} ms", delay.count());

    reconnect_timer = scheduler.schedule(delay, [this]() {
        reconnect_timer.reset();
        if (!should_reconnect || subscriptions.empty()) {
            set_status(CONNECTION_STATUS::DISCONNECTED);
            return;
        }
        open_transport(CONNECTION_STATUS::RECONNECTING);
    });

    auto grown = std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(current_delay.count()) * config.reconnect_multiplier));
    current_delay = std::min(grown, config.reconnect_max);
}

void ConnectionManager::cancel_reconnect() {
    if (reconnect_timer) {
        scheduler.cancel(*reconnect_timer);
        reconnect_timer.reset();
    }
}

void ConnectionManager::sync_topology() {
    std::vector<std::string> to_add;
    std::vector<std::string> to_remove;
    for (const auto& [key, handlers] : subscriptions) {
        if (live_keys.count(key) == 0) {
            to_add.push_back(key);
        }
    }
    for (const auto& key : live_keys) {
        if (subscriptions.count(key) == 0) {
            to_remove.push_back(key);
        }
    }
    if (to_add.empty() && to_remove.empty()) {
        return;
    }

    if (config.topology_mode == TOPOLOGY_MODE::RECONNECT) {
        logger->info("Stream topology changed (+{} -{}), reconnecting", to_add.size(), to_remove.size());
        reconnect_now();
        return;
    }

    if (!to_add.empty()) {
        send_control("SUBSCRIBE", to_add);
    }
    if (!to_remove.empty() && status == CONNECTION_STATUS::CONNECTED) {
        send_control("UNSUBSCRIBE", to_remove);
    }
}

void ConnectionManager::send_control(const std::string& method, const std::vector<std::string>& keys) {
    uint64_t id = next_request_id++;
    if (!transport.send(make_control_frame(method, keys, id))) {
        logger->error("Failed to send {} id={}, reconnecting", method, id);
        reconnect_now();
        return;
    }

    pending_requests.emplace(id, ControlRequest{method, keys});
    for (const auto& key : keys) {
        if (method == "SUBSCRIBE") {
            live_keys.insert(key);
        } else {
            live_keys.erase(key);
        }
    }
    logger->info("Sent {} id={} for {} streams", method, id, keys.size());
}

void ConnectionManager::handle_control_reply(const json& message) {
    const json& id_field = message["id"];
    if (!id_field.is_number_integer()) {
        logger->warn("Control reply with non numeric id: {}", message.dump());
        return;
    }
    uint64_t id = id_field.get<uint64_t>();

    auto it = pending_requests.find(id);
    auto error = message.find("error");
    if (error != message.end() && !error->is_null()) {
        std::string reason = error->dump();
        logger->error("Control frame id={} rejected: {}, falling back to reconnect", id, reason);
        if (it != pending_requests.end()) {
            pending_requests.erase(it);
        }
        notify_error(reason);
        if (status == CONNECTION_STATUS::CONNECTED) {
            reconnect_now();
        }
        return;
    }

    if (it == pending_requests.end()) {
        logger->warn("Reply for unknown control frame id={}", id);
        return;
    }
    logger->info("{} id={} acknowledged", it->second.method, id);
    pending_requests.erase(it);
}

void ConnectionManager::on_transport_open(uint64_t id) {
    if (connection_id == 0 || id != connection_id) {
        return;
    }
    current_delay = config.reconnect_base;
    set_status(CONNECTION_STATUS::CONNECTED);
    logger->info("Stream connected carrying {} streams", live_keys.size());
    notify_connect();

    // subscriptions may have changed while the open was in flight
    if (status == CONNECTION_STATUS::CONNECTED) {
        sync_topology();
    }
}

void ConnectionManager::on_transport_message(uint64_t id, const std::string& payload) {
    if (connection_id == 0 || id != connection_id) {
        return;
    }

    json message;
    try {
        message = json::parse(payload);
    } catch (const json::parse_error& e) {
        logger->error("Dropping malformed stream message: {}", e.what());
        return;
    }

    if (is_control_reply(message)) {
        handle_control_reply(message);
        return;
    }
    if (is_combined_envelope(message)) {
        dispatch(normalize_stream_key(message["stream"].get<std::string>()), message["data"]);
        return;
    }
    dispatch_all(message);
}

void ConnectionManager::on_transport_close(uint64_t id, const std::string& reason) {
    if (connection_id == 0 || id != connection_id) {
        return;
    }
    logger->warn("Stream connection closed: {}", reason);

    connection_id = 0;
    live_keys.clear();
    pending_requests.clear();

    if (should_reconnect && !subscriptions.empty()) {
        schedule_reconnect();
    } else {
        set_status(CONNECTION_STATUS::DISCONNECTED);
    }
    notify_disconnect();
}

void ConnectionManager::on_transport_error(uint64_t id, const std::string& reason) {
    if (connection_id == 0 || id != connection_id) {
        return;
    }
    logger->error("Stream transport error: {}", reason);
    notify_error(reason);
}

void ConnectionManager::dispatch(const std::string& stream_key, const json& data) {
    auto sub = subscriptions.find(stream_key);
    if (sub == subscriptions.end()) {
        logger->debug("No handlers for stream {}", stream_key);
        return;
    }
    std::vector<Token> tokens;
    tokens.reserve(sub->second.size());
    for (const auto& [token, handler] : sub->second) {
        tokens.push_back(token);
    }
    invoke_handlers(stream_key, tokens, data);
}

void ConnectionManager::dispatch_all(const json& data) {
    std::vector<std::pair<std::string, std::vector<Token>>> targets;
    for (const auto& [key, handlers] : subscriptions) {
        std::vector<Token> tokens;
        for (const auto& [token, handler] : handlers) {
            tokens.push_back(token);
        }
        targets.emplace_back(key, std::move(tokens));
    }
    for (const auto& [key, tokens] : targets) {
        invoke_handlers(key, tokens, data);
    }
}

void ConnectionManager::invoke_handlers(const std::string& stream_key, const std::vector<Token>& tokens,
                                        const json& data) {
    for (Token token : tokens) {
        // a handler may disconnect or unsubscribe others
        if (connection_id == 0) {
            return;
        }
        auto sub = subscriptions.find(stream_key);
        if (sub == subscriptions.end()) {
            return;
        }
        auto it = sub->second.find(token);
        if (it == sub->second.end()) {
            continue;
        }

        MessageHandler handler = it->second;
        try {
            handler(data);
        } catch (const std::exception& e) {
            logger->error("Handler {} for {} failed: {}", token, stream_key, e.what());
        }
    }
}

void ConnectionManager::set_status(CONNECTION_STATUS next) {
    if (status == next) {
        return;
    }
    logger->info("Stream status {} -> {}", to_string(status), to_string(next));
    status = next;

    auto listeners = status_listeners;
    for (auto& [token, listener] : listeners) {
        listener(next);
    }
}

void ConnectionManager::notify_connect() {
    auto listeners = connect_listeners;
    for (auto& [token, listener] : listeners) {
        listener();
    }
}

void ConnectionManager::notify_disconnect() {
    auto listeners = disconnect_listeners;
    for (auto& [token, listener] : listeners) {
        listener();
    }
}

void ConnectionManager::notify_error(const std::string& reason) {
    auto listeners = error_listeners;
    for (auto& [token, listener] : listeners) {
        listener(reason);
    }
}

ConnectionManager::Token ConnectionManager::add_status_listener(StatusListener listener) {
    Token token = next_token++;
    StatusListener& stored = status_listeners.emplace(token, std::move(listener)).first->second;
    stored(status);
    return token;
}

ConnectionManager::Token ConnectionManager::add_connect_listener(ConnectionListener listener) {
    Token token = next_token++;
    connect_listeners.emplace(token, std::move(listener));
    return token;
}

ConnectionManager::Token ConnectionManager::add_disconnect_listener(ConnectionListener listener) {
    Token token = next_token++;
    disconnect_listeners.emplace(token, std::move(listener));
    return token;
}

ConnectionManager::Token ConnectionManager::add_error_listener(ErrorListener listener) {
    Token token = next_token++;
    error_listeners.emplace(token, std::move(listener));
    return token;
}

bool ConnectionManager::remove_listener(Token token) {
    return status_listeners.erase(token) + connect_listeners.erase(token) + disconnect_listeners.erase(token) +
               error_listeners.erase(token) >
           0;
}

std::vector<std::string> ConnectionManager::get_subscriptions() const {
    std::vector<std::string> keys;
    keys.reserve(subscriptions.size());
    for (const auto& [key, handlers] : subscriptions) {
        keys.push_back(key);
    }
    return keys;
}

std::string ConnectionManager::get_stream_url() const {
    return build_stream_url(config.base_url, get_subscriptions());
}

} // namespace perpdesk::stream
