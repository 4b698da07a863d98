#include <gtest/gtest.h>
#include <portage/bridge/ingestion.hpp>
#include <portage/testing/bridge_fixture.hpp>

namespace {

class ingestion_test : public portage::testing::bridge_fixture {
 protected:
  void set_cursor(uint64_t index, uint64_t height = 0) {
    settlement_.set_cursor(portage::schema::sync_cursor_t{
        .last_processed_index = index, .last_external_height = height});
  }

  portage::bridge::ingestion_report ingest_at(uint64_t height) {
    return portage::bridge::ingest_deposits(params_, reader_, settlement_,
                                            block_time_for(height), events_);
  }
};

}  // namespace

TEST_F(ingestion_test, credits_the_next_record_and_advances_the_cursor) {
  auto account = portage::testing::make_account(1);
  reader_.add_deposit(5, account, portage::schema::amount_t{1'000'000}, 80);
  set_cursor(4);

  auto report = ingest_at(100);
  EXPECT_EQ(report.external_height, 100u);
  EXPECT_EQ(report.credited, 1u);
  EXPECT_EQ(report.skipped, 0u);
  EXPECT_EQ(bank_.balance(account), portage::schema::amount_t{1'000'000});

  auto cursor = settlement_.cursor();
  EXPECT_EQ(cursor.last_processed_index, 5u);
  EXPECT_EQ(cursor.last_external_height, 100u);
}

TEST_F(ingestion_test, skips_malformed_records_and_still_advances) {
  reader_.add_deposit(6, "not-an-account", portage::schema::amount_t{10}, 80);
  set_cursor(5);

  auto report = ingest_at(100);
  EXPECT_EQ(report.credited, 0u);
  EXPECT_EQ(report.skipped, 1u);
  EXPECT_EQ(settlement_.cursor().last_processed_index, 6u);
  EXPECT_TRUE(settlement_.is_processed(6));
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].type, "deposit_skipped");
}

TEST_F(ingestion_test, missing_record_leaves_state_untouched) {
  reader_.add_deposit(6, portage::testing::make_account(1),
                      portage::schema::amount_t{10}, 80);
  set_cursor(6, 90);
  auto before = store_.block_writes();

  auto report = ingest_at(100);
  EXPECT_EQ(report.credited + report.skipped, 0u);
  EXPECT_EQ(store_.block_writes(), before);
  EXPECT_EQ(settlement_.cursor().last_processed_index, 6u);
  EXPECT_TRUE(events_.empty());
  EXPECT_FALSE(settlement_.is_processed(7));
}

TEST_F(ingestion_test, records_above_the_derived_height_wait) {
  reader_.add_deposit(1, portage::testing::make_account(1),
                      portage::schema::amount_t{10}, 150);

  ingest_at(100);
  EXPECT_EQ(settlement_.cursor().last_processed_index, 0u);

  ingest_at(150);
  EXPECT_EQ(settlement_.cursor().last_processed_index, 1u);
}

TEST_F(ingestion_test, stops_at_the_per_block_cap) {
  for (uint64_t index = 1; index <= 7; ++index) {
    reader_.add_deposit(index, portage::testing::make_account(1),
                        portage::schema::amount_t{1}, 10);
  }

  auto report = ingest_at(100);
  EXPECT_EQ(report.credited, params_.per_block_cap);
  EXPECT_EQ(settlement_.cursor().last_processed_index, 5u);

  ingest_at(101);
  EXPECT_EQ(settlement_.cursor().last_processed_index, 7u);
  EXPECT_EQ(bank_.balance(portage::testing::make_account(1)),
            portage::schema::amount_t{7});
}

TEST_F(ingestion_test, unavailable_chain_changes_nothing) {
  reader_.add_deposit(1, portage::testing::make_account(1),
                      portage::schema::amount_t{10}, 10);
  reader_.set_available(false);

  auto report = ingest_at(100);
  EXPECT_EQ(report.credited + report.skipped, 0u);
  EXPECT_TRUE(store_.block_writes().empty());
}

TEST_F(ingestion_test, already_processed_record_only_moves_the_cursor) {
  auto account = portage::testing::make_account(1);
  reader_.add_deposit(1, account, portage::schema::amount_t{10}, 10);
  reader_.add_deposit(2, account, portage::schema::amount_t{20}, 10);
  auto record = reader_.fetch_deposit(1, std::nullopt).record.value();
  settlement_.settle(record, 50, events_);
  events_.clear();

  auto report = ingest_at(100);
  EXPECT_EQ(report.credited, 0u);
  EXPECT_EQ(bank_.balance(account), portage::schema::amount_t{10});
  auto cursor = settlement_.cursor();
  EXPECT_EQ(cursor.last_processed_index, 1u);
  EXPECT_EQ(cursor.last_external_height, 0u);

  ingest_at(101);
  EXPECT_EQ(bank_.balance(account), portage::schema::amount_t{30});
  EXPECT_EQ(settlement_.cursor().last_processed_index, 2u);
}

TEST_F(ingestion_test, repeated_passes_never_double_credit) {
  auto account = portage::testing::make_account(4);
  for (uint64_t index = 1; index <= 3; ++index) {
    reader_.add_deposit(index, account, portage::schema::amount_t{100}, 10);
  }
  for (uint64_t height = 100; height < 110; ++height) {
    ingest_at(height);
  }
  EXPECT_EQ(bank_.balance(account), portage::schema::amount_t{300});
  EXPECT_EQ(settlement_.cursor().last_processed_index, 3u);
  EXPECT_EQ(events_.size(), 3u);
}
