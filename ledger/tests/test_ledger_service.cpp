#include "ledger/ledger_service.H"

#include "common/errors.H"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <thread>

using namespace perpdesk;
using namespace perpdesk::ledger;

namespace {

CreateOrderParams order(ORDER_TYPE type, SIDE side, const char* quantity, uint32_t leverage) {
    CreateOrderParams params;
    params.symbol = "BTCUSDT";
    params.side = side;
    params.type = type;
    params.quantity = Decimal(quantity);
    params.leverage = leverage;
    return params;
}

} // namespace

class LedgerServiceTest : public ::testing::Test {
protected:
    LedgerConfig config;
    RiskConfig risk_config;
    LedgerService service{config, risk_config, spdlog::default_logger()};
};

TEST_F(LedgerServiceTest, MarkPriceThenMarketOrder) {
    service.post_mark_price("BTCUSDT", Decimal(95000));
    Order filled = service.create_order(order(ORDER_TYPE::MARKET, SIDE::BUY, "0.5", 20)).get();

    EXPECT_EQ(filled.status, ORDER_STATUS::FILLED);
    EXPECT_EQ(*filled.average_price, Decimal(95000));

    // the snapshot is republished once the request has finished
    EXPECT_EQ(service.get_trades().get().size(), 1);
    EXPECT_EQ(service.available_balance(), Decimal(7606));
    EXPECT_EQ(service.wallet_snapshot().balance, Decimal(9981));

    std::optional<Position> position = service.get_position("BTCUSDT").get();
    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(position->margin, Decimal(2375));

    PositionMetrics metrics = service.position_metrics(position->id).get();
    EXPECT_EQ(metrics.mark_price, Decimal(95000));
    EXPECT_TRUE(metrics.unrealized_pnl.is_zero());
}

TEST_F(LedgerServiceTest, LedgerErrorsSurfaceOnTheFuture) {
    std::future<Order> rejected = service.create_order(order(ORDER_TYPE::MARKET, SIDE::BUY, "0", 10));
    EXPECT_THROW(rejected.get(), ValidationError);

    EXPECT_THROW(service.cancel_order(42).get(), NotFoundError);
    EXPECT_THROW(service.close_position(42).get(), NotFoundError);
}

TEST_F(LedgerServiceTest, BadMarkPriceIsOnlyLogged) {
    service.post_mark_price("BTCUSDT", Decimal());
    EXPECT_TRUE(service.get_trades().get().empty());
    EXPECT_EQ(service.available_balance(), Decimal(10000));
}

TEST_F(LedgerServiceTest, OverflowingMarkPriceKeepsWorkerAlive) {
    service.post_mark_price("BTCUSDT", Decimal(100));
    Order filled = service.create_order(order(ORDER_TYPE::MARKET, SIDE::BUY, "2", 10)).get();
    ASSERT_EQ(filled.status, ORDER_STATUS::FILLED);
    std::optional<Position> position = service.get_position("BTCUSDT").get();
    ASSERT_TRUE(position.has_value());
    service.update_position_tp_sl(position->id, Decimal(110), std::nullopt).get();

    // closing 2 at this mark realizes more than a Decimal can hold
    service.post_mark_price("BTCUSDT", Decimal(int64_t{90000000000}));

    EXPECT_EQ(service.get_trades().get().size(), 1);
    EXPECT_TRUE(service.get_position("BTCUSDT").get().has_value());
}

TEST_F(LedgerServiceTest, StopDrainsQueuedRequests) {
    CreateOrderParams params = order(ORDER_TYPE::LIMIT, SIDE::BUY, "1", 10);
    params.price = Decimal(100);

    std::vector<std::future<Order>> pending;
    for (int i = 0; i < 5; ++i) {
        pending.push_back(service.create_order(params));
    }
    service.stop();

    for (auto& f : pending) {
        EXPECT_EQ(f.get().status, ORDER_STATUS::OPEN);
    }
    EXPECT_EQ(service.available_balance(), Decimal(9950));
    EXPECT_THROW(service.get_trades(), Error);
    EXPECT_THROW(service.post_mark_price("BTCUSDT", Decimal(1)), Error);
}

TEST_F(LedgerServiceTest, ConcurrentClientsAreSerialized) {
    CreateOrderParams params = order(ORDER_TYPE::LIMIT, SIDE::BUY, "0.01", 10);
    params.price = Decimal(100);

    std::vector<std::thread> clients;
    for (int t = 0; t < 4; ++t) {
        clients.emplace_back([this, params]() {
            for (int i = 0; i < 10; ++i) {
                service.create_order(params).get();
            }
        });
    }
    for (auto& client : clients) {
        client.join();
    }

    std::vector<Order> active = service.get_active_orders().get();
    EXPECT_EQ(active.size(), 40);
    EXPECT_EQ(service.available_balance(), Decimal(9996));

    EXPECT_EQ(service.cancel_all_orders(std::string("BTCUSDT")).get(), 40);
    service.reset_wallet().get();
    EXPECT_TRUE(service.get_active_orders().get().empty());
    EXPECT_TRUE(service.get_open_positions().get().empty());
}
