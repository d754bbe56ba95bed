#include "snapshot_client.H"

#include "common/errors.H"
#include "stream/stream_protocol.H"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace perpdesk::md {

SnapshotClient::SnapshotClient(const RestConfig& config, std::shared_ptr<spdlog::logger> logger)
    : config(config), logger(logger) {
    const std::string scheme = "https://";
    if (config.base_url.compare(0, scheme.size(), scheme) != 0) {
        throw ValidationError("rest.base_url must start with https://: " + config.base_url);
    }

    std::string authority = config.base_url.substr(scheme.size());
    size_t slash = authority.find('/');
    if (slash != std::string::npos) {
        authority = authority.substr(0, slash);
    }

    size_t colon = authority.find(':');
    if (colon == std::string::npos) {
        host = authority;
        port = "443";
    } else {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    if (host.empty() || port.empty()) {
        throw ValidationError("rest.base_url has no host: " + config.base_url);
    }
}

std::string SnapshotClient::build_target(const std::string& symbol) const {
    return config.depth_path + "?symbol=" + normalize_symbol(symbol) +
           "&limit=" + std::to_string(config.depth_limit);
}

DepthSnapshot SnapshotClient::fetch_snapshot(const std::string& symbol) {
    std::string target = build_target(symbol);
    std::string last_error;

    for (uint32_t attempt = 0; attempt <= config.max_retries; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(config.retry_delay);
        }

        try {
            std::string body = request(target);
            return stream::parse_depth_snapshot(nlohmann::json::parse(body), normalize_symbol(symbol));
        } catch (const ConnectionError& e) {
            last_error = e.what();
        } catch (const nlohmann::json::exception& e) {
            last_error = std::string("malformed snapshot body: ") + e.what();
        } catch (const ValidationError& e) {
            last_error = std::string("invalid snapshot: ") + e.what();
        }
        logger->warn("Snapshot attempt {}/{} for {} failed: {}", attempt + 1, config.max_retries + 1, symbol,
                     last_error);
    }

    logger->error("Giving up on snapshot for {}: {}", symbol, last_error);
    throw ConnectionError("Depth snapshot for " + symbol + " failed: " + last_error);
}

std::string SnapshotClient::request(const std::string& target) {
    net::io_context ioc;
    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw ConnectionError("Failed to set SNI host name " + host);
    }
    stream.set_verify_callback(ssl::host_name_verification(host));

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");

    tcp::resolver resolver(ioc);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    beast::error_code result;
    std::string stage = "resolve";
    bool done = false;

    auto finish = [&](beast::error_code ec) {
        result = ec;
        done = true;
    };

    resolver.async_resolve(host, port, [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return finish(ec);
        }
        stage = "connect";
        beast::get_lowest_layer(stream).async_connect(results, [&](beast::error_code ec,
                                                                   tcp::resolver::results_type::endpoint_type) {
            if (ec) {
                return finish(ec);
            }
            stage = "handshake";
            stream.async_handshake(ssl::stream_base::client, [&](beast::error_code ec) {
                if (ec) {
                    return finish(ec);
                }
                stage = "write";
                http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec) {
                        return finish(ec);
                    }
                    stage = "read";
                    http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
                        finish(ec);
                    });
                });
            });
        });
    });

    ioc.run_for(config.timeout);

    if (!done) {
        beast::get_lowest_layer(stream).close();
        throw ConnectionError("timed out after " + std::to_string(config.timeout.count()) + " ms during " + stage);
    }
    if (result) {
        throw ConnectionError(stage + " failed: " + result.message());
    }

    beast::get_lowest_layer(stream).close();

    if (res.result() != http::status::ok) {
        throw ConnectionError("HTTP " + std::to_string(res.result_int()) + ": " + res.body().substr(0, 200));
    }
    return res.body();
}

} // namespace perpdesk::md
