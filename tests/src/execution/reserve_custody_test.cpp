#include <steward/execution/reserve_custody.hpp>
#include <steward/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <limits>

using steward::schema::transaction_error_code;
using steward::testing::code_of;
using steward::testing::execution_fixture;

namespace {

steward::schema::transaction_result_t deposit(
    execution_fixture& fixture,
    const steward::schema::amount_t& amount) {
  return fixture.submit(steward::schema::deposit_reserve_t{
      .authority = fixture.authority, .amount = amount});
}

steward::schema::transaction_result_t withdraw(
    execution_fixture& fixture,
    const steward::schema::amount_t& amount) {
  return fixture.submit(steward::schema::withdraw_reserve_t{
      .authority = fixture.authority, .amount = amount});
}

}  // namespace

TEST(reserve_custody, deposit_and_withdraw_track_balance) {
  auto fixture = execution_fixture{"steward_reserve_balance"};
  fixture.initialize();

  const auto deposited = deposit(fixture, 1'000);
  ASSERT_EQ(deposited.code, 0u) << deposited.log;
  EXPECT_EQ(steward::testing::event_attribute(deposited, "reserve_deposit",
                                              "reserve_units"),
            "1000");
  EXPECT_TRUE(steward::testing::has_event(deposited, "vault_health"));

  const auto withdrawn = withdraw(fixture, 400);
  ASSERT_EQ(withdrawn.code, 0u) << withdrawn.log;
  EXPECT_EQ(steward::testing::event_attribute(withdrawn, "reserve_withdrawal",
                                              "reserve_units"),
            "600");
  EXPECT_EQ(fixture.vault().reserve_units, 600);
}

TEST(reserve_custody, rejects_zero_and_overdraw) {
  auto fixture = execution_fixture{"steward_reserve_reject"};
  fixture.initialize();
  ASSERT_EQ(deposit(fixture, 10).code, 0u);

  EXPECT_EQ(deposit(fixture, 0).code,
            code_of(transaction_error_code::invalid_amount));
  EXPECT_EQ(withdraw(fixture, 0).code,
            code_of(transaction_error_code::invalid_amount));
  EXPECT_EQ(withdraw(fixture, 11).code,
            code_of(transaction_error_code::insufficient_reserve));
  EXPECT_EQ(fixture.vault().reserve_units, 10);
}

TEST(reserve_custody, deposit_overflow_is_rejected) {
  auto fixture = execution_fixture{"steward_reserve_overflow"};
  fixture.initialize();
  ASSERT_EQ(
      deposit(fixture, std::numeric_limits<steward::schema::amount_t>::max())
          .code,
      0u);
  EXPECT_EQ(deposit(fixture, 1).code,
            code_of(transaction_error_code::arithmetic_overflow));
}

TEST(reserve_custody, only_authority_moves_reserves) {
  auto fixture = execution_fixture{"steward_reserve_auth"};
  fixture.initialize();
  EXPECT_EQ(fixture
                .submit(steward::schema::deposit_reserve_t{
                    .authority = fixture.agent(1), .amount = 10})
                .code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(fixture
                .submit(steward::schema::withdraw_reserve_t{
                    .authority = fixture.reserve_vault, .amount = 10})
                .code,
            code_of(transaction_error_code::unauthorized));
}
