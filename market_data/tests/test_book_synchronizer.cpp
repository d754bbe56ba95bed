#include "market_data/book_synchronizer.H"
#include "md_test_helpers.H"

#include "common/errors.H"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace perpdesk;
using namespace perpdesk::md;
using namespace perpdesk::md::testing;

class BookSynchronizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source.snapshots.push_back(
            make_snapshot(1027024, {level("97000", "1"), level("96990", "2")}, {level("97010", "1.5")}));
    }

    BookConfig config;
    FakeSnapshotSource source;
    BookSynchronizer sync{source, config, spdlog::default_logger()};
};

TEST_F(BookSynchronizerTest, DiffAfterSnapshotAdvancesUpdateId) {
    sync.load_snapshot("BTCUSDT");

    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027025, 1027029, std::nullopt, {level("97001", "0.4")})),
              APPLY_RESULT::APPLIED);

    const OrderBook& book = sync.checked_book("BTCUSDT");
    EXPECT_EQ(book.get_last_update_id(), 1027029);
    EXPECT_EQ(book.get_best_bid().price, Decimal("97001"));
    EXPECT_TRUE(sync.is_synced("BTCUSDT"));
}

TEST_F(BookSynchronizerTest, FirstDiffMayStraddleSnapshot) {
    sync.load_snapshot("BTCUSDT");
    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027020, 1027030, 1027019)), APPLY_RESULT::APPLIED);
    EXPECT_EQ(sync.get_book("BTCUSDT")->get_last_update_id(), 1027030);
}

TEST_F(BookSynchronizerTest, StaleDiffIsDiscarded) {
    sync.load_snapshot("BTCUSDT");
    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027000, 1027024, std::nullopt, {level("97000", "0")})),
              APPLY_RESULT::STALE);

    const OrderBook& book = sync.checked_book("BTCUSDT");
    EXPECT_EQ(book.get_last_update_id(), 1027024);
    EXPECT_EQ(book.get_best_bid().price, Decimal("97000"));
}

TEST_F(BookSynchronizerTest, GapLeavesBookUntouchedUntilResync) {
    sync.load_snapshot("BTCUSDT");
    DepthSnapshot before = sync.get_book("BTCUSDT")->to_snapshot();

    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027027, 1027030, std::nullopt, {level("97000", "0")})),
              APPLY_RESULT::GAP);

    const OrderBook* book = sync.get_book("BTCUSDT");
    EXPECT_EQ(book->get_last_update_id(), before.last_update_id);
    EXPECT_EQ(book->get_bid_depth(), before.bids.size());
    EXPECT_EQ(book->get_best_bid().price, Decimal("97000"));
    EXPECT_TRUE(sync.needs_snapshot("BTCUSDT"));
    EXPECT_THROW(sync.checked_book("BTCUSDT"), StreamGapError);

    // later diffs wait for the next snapshot
    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027031, 1027032, 1027030)), APPLY_RESULT::BUFFERED);
    EXPECT_EQ(sync.get_buffered_count("BTCUSDT"), 2);

    source.snapshots.push_back(make_snapshot(1027030, {level("96000", "5")}, {level("97100", "1")}));
    sync.load_snapshot("BTCUSDT");

    EXPECT_TRUE(sync.is_synced("BTCUSDT"));
    EXPECT_EQ(sync.get_buffered_count("BTCUSDT"), 0);
    const OrderBook& resynced = sync.checked_book("BTCUSDT");
    EXPECT_EQ(resynced.get_last_update_id(), 1027032);
    EXPECT_EQ(resynced.get_best_bid().price, Decimal("96000"));
}

TEST_F(BookSynchronizerTest, PreviousIdMustChainAfterFirstDiff) {
    sync.load_snapshot("BTCUSDT");
    ASSERT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027020, 1027030, 1027019)), APPLY_RESULT::APPLIED);

    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027031, 1027035, 1027030)), APPLY_RESULT::APPLIED);
    // U continues but pu does not match the last applied u
    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027036, 1027040, 1027034)), APPLY_RESULT::GAP);
    EXPECT_EQ(sync.get_book("BTCUSDT")->get_last_update_id(), 1027035);
}

TEST_F(BookSynchronizerTest, WithoutPreviousIdUpdateIdsMustBeContiguous) {
    sync.load_snapshot("BTCUSDT");
    ASSERT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027025, 1027026, std::nullopt)), APPLY_RESULT::APPLIED);

    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027027, 1027028, std::nullopt)), APPLY_RESULT::APPLIED);
    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027030, 1027031, std::nullopt)), APPLY_RESULT::GAP);
}

TEST_F(BookSynchronizerTest, DiffsBeforeSnapshotAreReplayed) {
    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027010, 1027020, std::nullopt)), APPLY_RESULT::BUFFERED);
    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027021, 1027026, 1027020, {level("97005", "3")})),
              APPLY_RESULT::BUFFERED);
    EXPECT_EQ(sync.apply_diff("BTCUSDT", make_diff(1027027, 1027028, 1027026, {}, {level("97010", "0")})),
              APPLY_RESULT::BUFFERED);
    EXPECT_THROW(sync.checked_book("BTCUSDT"), StreamGapError);

    sync.load_snapshot("BTCUSDT");

    const OrderBook& book = sync.checked_book("BTCUSDT");
    EXPECT_EQ(book.get_last_update_id(), 1027028);
    EXPECT_EQ(book.get_best_bid().price, Decimal("97005"));
    EXPECT_EQ(book.get_ask_depth(), 0);
    EXPECT_EQ(sync.get_buffered_count("BTCUSDT"), 0);
}

TEST_F(BookSynchronizerTest, ReplayThatCannotBridgeStaysUnsynced) {
    sync.apply_diff("BTCUSDT", make_diff(1027030, 1027040, std::nullopt));
    sync.apply_diff("BTCUSDT", make_diff(1027041, 1027042, 1027040));

    sync.load_snapshot("BTCUSDT");

    EXPECT_TRUE(sync.needs_snapshot("BTCUSDT"));
    EXPECT_EQ(sync.get_buffered_count("BTCUSDT"), 2);
    EXPECT_EQ(sync.get_book("BTCUSDT")->get_last_update_id(), 1027024);

    source.snapshots.push_back(make_snapshot(1027035, {level("97000", "1")}, {level("97010", "1")}));
    sync.load_snapshot("BTCUSDT");
    EXPECT_TRUE(sync.is_synced("BTCUSDT"));
    EXPECT_EQ(sync.get_book("BTCUSDT")->get_last_update_id(), 1027042);
}

TEST_F(BookSynchronizerTest, BufferDropsOldestPastLimit) {
    BookConfig small;
    small.buffer_limit = 2;
    BookSynchronizer bounded(source, small, spdlog::default_logger());

    bounded.apply_diff("BTCUSDT", make_diff(1027020, 1027021, std::nullopt));
    bounded.apply_diff("BTCUSDT", make_diff(1027022, 1027025, 1027021, {level("97002", "1")}));
    bounded.apply_diff("BTCUSDT", make_diff(1027026, 1027027, 1027025, {level("97003", "1")}));
    EXPECT_EQ(bounded.get_buffered_count("BTCUSDT"), 2);

    bounded.load_snapshot("BTCUSDT");
    EXPECT_TRUE(bounded.is_synced("BTCUSDT"));
    EXPECT_EQ(bounded.get_book("BTCUSDT")->get_last_update_id(), 1027027);
    EXPECT_EQ(bounded.get_book("BTCUSDT")->get_best_bid().price, Decimal("97003"));
}

TEST_F(BookSynchronizerTest, SameInputsGiveSameBook) {
    auto run = [](BookSynchronizer& target, FakeSnapshotSource& feed) {
        feed.snapshots.push_back(
            make_snapshot(1027024, {level("97000", "1"), level("96990", "2")}, {level("97010", "1.5")}));
        target.apply_diff("BTCUSDT", make_diff(1027020, 1027025, std::nullopt, {level("96995", "1")}));
        target.load_snapshot("BTCUSDT");
        target.apply_diff("BTCUSDT", make_diff(1027026, 1027030, 1027025, {level("97000", "0")}));
        target.apply_diff("BTCUSDT", make_diff(1027031, 1027031, 1027030, {}, {level("97005", "2")}));
        return target.get_book("BTCUSDT")->to_snapshot();
    };

    FakeSnapshotSource first_source;
    FakeSnapshotSource second_source;
    BookSynchronizer first(first_source, config, spdlog::default_logger());
    BookSynchronizer second(second_source, config, spdlog::default_logger());
    DepthSnapshot a = run(first, first_source);
    DepthSnapshot b = run(second, second_source);

    EXPECT_EQ(a.last_update_id, b.last_update_id);
    ASSERT_EQ(a.bids.size(), b.bids.size());
    for (size_t i = 0; i < a.bids.size(); ++i) {
        EXPECT_EQ(a.bids[i].price, b.bids[i].price);
        EXPECT_EQ(a.bids[i].quantity, b.bids[i].quantity);
    }
    ASSERT_EQ(a.asks.size(), b.asks.size());
    for (size_t i = 0; i < a.asks.size(); ++i) {
        EXPECT_EQ(a.asks[i].price, b.asks[i].price);
        EXPECT_EQ(a.asks[i].quantity, b.asks[i].quantity);
    }
}

TEST_F(BookSynchronizerTest, FailedFetchLeavesStateAlone) {
    source.snapshots.clear();
    sync.apply_diff("BTCUSDT", make_diff(1, 2, std::nullopt));

    EXPECT_THROW(sync.load_snapshot("BTCUSDT"), ConnectionError);
    EXPECT_TRUE(sync.needs_snapshot("BTCUSDT"));
    EXPECT_EQ(sync.get_buffered_count("BTCUSDT"), 1);
}

TEST_F(BookSynchronizerTest, UnknownSymbol) {
    EXPECT_EQ(sync.get_book("ETHUSDT"), nullptr);
    EXPECT_THROW(sync.checked_book("ETHUSDT"), NotFoundError);
    EXPECT_FALSE(sync.is_synced("ETHUSDT"));
    EXPECT_TRUE(sync.needs_snapshot("ETHUSDT"));
}
