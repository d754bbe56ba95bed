#include "websocket_transport.H"

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

namespace perpdesk::stream {

WebSocketTransport::WebSocketTransport(boost::asio::io_context& io_context, std::shared_ptr<spdlog::logger> logger)
    : io_context(io_context), logger(logger) {
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio(&io_context);

    client.set_tls_init_handler([this](websocketpp::connection_hdl) {
        auto ctx = websocketpp::lib::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tlsv12_client);
        boost::system::error_code ec;
        ctx->set_default_verify_paths(ec);
        if (ec) {
            this->logger->warn("Failed to load default certificate paths: {}", ec.message());
        }
        ctx->set_verify_mode(boost::asio::ssl::verify_peer);
        ctx->set_verify_callback(boost::asio::ssl::host_name_verification(host));
        return ctx;
    });
}

WebSocketTransport::~WebSocketTransport() {
    listener = nullptr;
    close();
}

void WebSocketTransport::set_listener(TransportListener* listener) {
    this->listener = listener;
}

void WebSocketTransport::report_failure(uint64_t id, const std::string& reason) {
    if (listener == nullptr) {
        return;
    }
    listener->on_transport_error(id, reason);
    // the error callback may have detached us
    if (listener != nullptr) {
        listener->on_transport_close(id, reason);
    }
}

uint64_t WebSocketTransport::open(const std::string& url) {
    uint64_t id = next_connection_id++;
    active_id = id;

    websocketpp::lib::error_code ec;
    ws_client::connection_ptr con = client.get_connection(url, ec);
    if (ec) {
        logger->error("Failed to create connection to {}: {}", url, ec.message());
        std::string reason = ec.message();
        boost::asio::post(io_context, [this, id, reason]() { report_failure(id, reason); });
        return id;
    }
    host = con->get_host();

    con->set_open_handler([this, id](websocketpp::connection_hdl h) {
        if (id != active_id) {
            websocketpp::lib::error_code close_ec;
            client.close(h, websocketpp::close::status::going_away, "replaced", close_ec);
            return;
        }
        logger->info("Websocket connection {} open", id);
        if (listener != nullptr) {
            listener->on_transport_open(id);
        }
    });

    con->set_message_handler([this, id](websocketpp::connection_hdl, ws_client::message_ptr msg) {
        if (listener != nullptr) {
            listener->on_transport_message(id, msg->get_payload());
        }
    });

    con->set_close_handler([this, id](websocketpp::connection_hdl h) {
        ws_client::connection_ptr closed = client.get_con_from_hdl(h);
        std::string reason = "code " + std::to_string(closed->get_remote_close_code()) + " " +
                             closed->get_remote_close_reason();
        if (listener != nullptr) {
            listener->on_transport_close(id, reason);
        }
    });

    con->set_fail_handler([this, id](websocketpp::connection_hdl h) {
        ws_client::connection_ptr failed = client.get_con_from_hdl(h);
        report_failure(id, failed->get_ec().message());
    });

    hdl = con->get_handle();
    client.connect(con);
    return id;
}

void WebSocketTransport::close() {
    active_id = 0;
    if (hdl.expired()) {
        return;
    }

    websocketpp::lib::error_code ec;
    ws_client::connection_ptr con = client.get_con_from_hdl(hdl, ec);
    if (!ec && con->get_state() == websocketpp::session::state::open) {
        client.close(hdl, websocketpp::close::status::normal, "", ec);
        if (ec) {
            logger->warn("Failed to close websocket connection: {}", ec.message());
        }
    }
    hdl.reset();
}

bool WebSocketTransport::send(const std::string& payload) {
    if (hdl.expired()) {
        return false;
    }

    websocketpp::lib::error_code ec;
    client.send(hdl, payload, websocketpp::frame::opcode::text, ec);
    if (ec) {
        logger->error("Failed to send websocket frame: {}", ec.message());
        return false;
    }
    return true;
}

} // namespace perpdesk::stream
