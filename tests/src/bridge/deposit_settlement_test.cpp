#include <gtest/gtest.h>
#include <portage/bridge/deposit_settlement.hpp>
#include <portage/testing/bridge_fixture.hpp>

#include <string>
#include <utility>

namespace {

class deposit_settlement_test : public portage::testing::bridge_fixture {
 protected:
  portage::schema::deposit_record_t make_record(
      uint64_t index,
      std::string account,
      const portage::schema::amount_t& amount) {
    auto record = portage::schema::deposit_record_t{};
    record.index = index;
    record.account = std::move(account);
    record.amount = amount;
    record.external_height = 10;
    return record;
  }
};

}  // namespace

TEST(bridge_record_id, hashes_contract_and_decimal_index) {
  EXPECT_EQ(
      portage::bridge::make_record_id(
          "0xcc391c8f1aFd6DB5D8b0e064BA81b1383b14FE5B", 5),
      "0xe94028dcf92adbbd75dfe155c3507883a2dda938f3617d3caa4d9507d2e417c1");
  EXPECT_NE(portage::bridge::make_record_id(
                "0xcc391c8f1aFd6DB5D8b0e064BA81b1383b14FE5B", 5),
            portage::bridge::make_record_id(
                "0xcc391c8f1afd6db5d8b0e064ba81b1383b14fe5b", 5));
}

TEST_F(deposit_settlement_test, credits_valid_records) {
  auto account = portage::testing::make_account(1);
  auto outcome = settlement_.settle(
      make_record(5, account, portage::schema::amount_t{1'000'000}), 40,
      events_);

  EXPECT_EQ(outcome.status, portage::bridge::settle_status::credited);
  EXPECT_EQ(outcome.recipient, account);
  EXPECT_EQ(bank_.balance(account), portage::schema::amount_t{1'000'000});
  EXPECT_TRUE(settlement_.is_processed(5));
  EXPECT_EQ(settlement_.processed_height(5).value_or(0), 40u);

  auto entry = settlement_.processed(outcome.record_id);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->outcome, portage::schema::deposit_outcome_t::credited);
  EXPECT_TRUE(entry->reason.empty());

  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].type, "deposit_synced");
  EXPECT_EQ(portage::testing::event_attribute(events_[0], "amount"),
            "1000000");
  EXPECT_EQ(portage::testing::event_attribute(events_[0], "record_id"),
            outcome.record_id);
}

TEST_F(deposit_settlement_test, normalizes_prefixed_hex_recipients) {
  auto outcome = settlement_.settle(
      make_record(1, "b520102030405060708090a0b0c0d0e0f1011121314",
                  portage::schema::amount_t{5}),
      2, events_);
  EXPECT_EQ(outcome.status, portage::bridge::settle_status::credited);
  EXPECT_EQ(outcome.recipient, "b521qypqxpq9qcrsszg2pvxq6rs0zqg3yyc50tgtkv");
  EXPECT_EQ(bank_.balance(outcome.recipient), portage::schema::amount_t{5});
}

TEST_F(deposit_settlement_test, skips_invalid_recipients_and_zero_amounts) {
  auto bad_account = settlement_.settle(
      make_record(6, "b52xyz", portage::schema::amount_t{100}), 3, events_);
  EXPECT_EQ(bad_account.status, portage::bridge::settle_status::skipped);
  EXPECT_EQ(bad_account.reason, portage::bridge::kInvalidRecipientReason);

  auto zero = settlement_.settle(
      make_record(7, portage::testing::make_account(2),
                  portage::schema::amount_t{0}),
      3, events_);
  EXPECT_EQ(zero.status, portage::bridge::settle_status::skipped);
  EXPECT_EQ(zero.reason, portage::bridge::kZeroAmountReason);
  EXPECT_EQ(bank_.balance(portage::testing::make_account(2)),
            portage::schema::amount_t{0});

  EXPECT_TRUE(settlement_.is_processed(6));
  EXPECT_TRUE(settlement_.is_processed(7));
  auto entry = settlement_.processed(bad_account.record_id);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->outcome, portage::schema::deposit_outcome_t::skipped);
  EXPECT_EQ(entry->reason, portage::bridge::kInvalidRecipientReason);

  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[0].type, "deposit_skipped");
  EXPECT_EQ(portage::testing::event_attribute(events_[0], "reason"),
            "invalid recipient address");
}

TEST_F(deposit_settlement_test, settling_twice_is_a_no_op) {
  auto account = portage::testing::make_account(3);
  auto record = make_record(9, account, portage::schema::amount_t{250});
  settlement_.settle(record, 12, events_);
  auto writes_after_first = store_.block_writes();

  auto again = settlement_.settle(record, 99, events_);
  EXPECT_EQ(again.status, portage::bridge::settle_status::already_processed);
  EXPECT_EQ(bank_.balance(account), portage::schema::amount_t{250});
  EXPECT_EQ(settlement_.processed_height(9).value_or(0), 12u);
  EXPECT_EQ(store_.block_writes(), writes_after_first);
  EXPECT_EQ(events_.size(), 1u);
}

TEST_F(deposit_settlement_test, cursor_starts_empty_and_persists) {
  auto cursor = settlement_.cursor();
  EXPECT_EQ(cursor.last_processed_index, 0u);
  EXPECT_EQ(cursor.last_external_height, 0u);

  cursor.last_processed_index = 4;
  cursor.last_external_height = 20;
  settlement_.set_cursor(cursor);
  EXPECT_EQ(settlement_.cursor().last_processed_index, 4u);
  EXPECT_EQ(settlement_.cursor().last_external_height, 20u);
}
