#include "common/config.H"
#include "common/errors.H"
#include "ledger/ledger_service.H"
#include "market_data/book_synchronizer.H"
#include "market_data/depth_feed.H"
#include "market_data/price_feed.H"
#include "market_data/snapshot_client.H"
#include "stream/connection_manager.H"
#include "stream/asio_scheduler.H"
#include "stream/websocket_transport.H"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <functional>
#include <iostream>

using namespace perpdesk;

int main(int argc, char** argv) {

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }

    AppConfig config;
    try {
        config = load_config(argv[1]);
    } catch (const Error& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    spdlog::init_thread_pool(8192, 1);
    auto logger = spdlog::daily_logger_mt<spdlog::async_factory>("async_logger", config.log_dir + "/perpdesk");
    logger->info("Starting perpdesk with {} symbols, stream {} ({})", config.symbols.size(), config.stream.base_url,
                 to_string(config.stream.topology_mode));

    boost::asio::io_context io_context;
    stream::WebSocketTransport transport(io_context, logger);
    stream::AsioScheduler scheduler(io_context);
    stream::ConnectionManager connection(transport, scheduler, config.stream, logger);

    md::SnapshotClient snapshots(config.rest, logger);
    md::BookSynchronizer synchronizer(snapshots, config.book, logger);
    md::DepthFeed depth_feed(connection, scheduler, synchronizer, config.book, logger);
    md::PriceFeed price_feed(connection, logger);

    ledger::LedgerService ledger_service(config.ledger, config.risk, logger);

    connection.add_status_listener([logger](stream::CONNECTION_STATUS status) {
        logger->info("Stream connection {}", stream::to_string(status));
    });
    price_feed.set_mark_price_listener([&ledger_service](const std::string& symbol, Decimal price) {
        ledger_service.post_mark_price(symbol, price);
    });
    depth_feed.set_book_listener([logger](const md::OrderBook& book) {
        logger->debug("{} u={} bid {} ask {}", book.get_symbol(), book.get_last_update_id(),
                      book.get_best_bid().price.to_string(), book.get_best_ask().price.to_string());
    });

    for (const std::string& symbol : config.symbols) {
        price_feed.track_ticker(symbol);
        price_feed.track_mark_price(symbol);
        depth_feed.start(symbol);
    }

    std::function<void()> report_wallet;
    report_wallet = [&]() {
        ledger::Wallet wallet = ledger_service.wallet_snapshot();
        logger->info("Wallet balance {} available {}", wallet.balance.to_string(),
                     wallet.available_balance.to_string());
        scheduler.schedule(std::chrono::seconds(30), report_wallet);
    };
    scheduler.schedule(std::chrono::seconds(30), report_wallet);

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        logger->info("Received signal {}, shutting down", signal_number);
        depth_feed.stop_all();
        price_feed.stop();
        connection.disconnect();
        io_context.stop();
    });

    try {
        io_context.run();
    } catch (const std::exception& e) {
        logger->error("Exception in main thread: {}", e.what());
        std::cout << "Exception in main thread: " << e.what() << std::endl;
        ledger_service.stop();
        logger->flush();
        spdlog::shutdown();
        return 1;
    }

    ledger_service.stop();
    logger->flush();
    spdlog::shutdown();
    return 0;
}
