#include <steward/execution/protocol_state.hpp>
#include <steward/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

using steward::schema::transaction_error_code;
using steward::testing::code_of;
using steward::testing::execution_fixture;

TEST(protocol_state, validate_parameters_bounds) {
  auto parameters = steward::testing::make_default_parameters();
  EXPECT_FALSE(
      steward::execution::protocol_state::validate_parameters(parameters)
          .has_value());

  auto bad = parameters;
  bad.epoch_duration = 0;
  EXPECT_TRUE(
      steward::execution::protocol_state::validate_parameters(bad).has_value());

  bad = parameters;
  bad.mint_burn_cap_bps = 10'001;
  EXPECT_TRUE(
      steward::execution::protocol_state::validate_parameters(bad).has_value());

  bad = parameters;
  bad.stability_fee_bps = 10'001;
  EXPECT_TRUE(
      steward::execution::protocol_state::validate_parameters(bad).has_value());

  bad = parameters;
  bad.vhr_critical_bps = 9'999;
  EXPECT_TRUE(
      steward::execution::protocol_state::validate_parameters(bad).has_value());

  bad = parameters;
  bad.vhr_warning_bps = bad.vhr_critical_bps;
  auto failure = steward::execution::protocol_state::validate_parameters(bad);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->code, transaction_error_code::invalid_parameters);
}

TEST(protocol_state, initialize_stores_global_and_empty_vault) {
  auto fixture = execution_fixture{"steward_protocol_init"};
  const auto result = fixture.submit(fixture.make_initialize());
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_TRUE(steward::testing::has_event(result, "protocol_initialized"));

  auto global = fixture.global();
  ASSERT_TRUE(global.has_value());
  EXPECT_EQ(global->authority, fixture.authority);
  EXPECT_EQ(global->oracle, fixture.oracle);
  EXPECT_EQ(global->settlement_service, fixture.settlement);
  EXPECT_EQ(global->proposal_counter, 0u);
  EXPECT_EQ(global->credit_rate_bps, 0u);
  EXPECT_EQ(global->initialized_at, fixture.now());
  EXPECT_EQ(steward::schema::phase_of(global->circuit_breaker),
            steward::schema::breaker_phase_t::idle);
  EXPECT_FALSE(global->last_oracle_update_at.has_value());

  const auto vault = fixture.vault();
  EXPECT_EQ(vault.reserve_units, 0);
  EXPECT_EQ(vault.health, steward::schema::health_level_t::healthy);
}

TEST(protocol_state, second_initialize_is_rejected) {
  auto fixture = execution_fixture{"steward_protocol_reinit"};
  fixture.initialize();
  auto again = fixture.make_initialize();
  again.parameters.stability_fee_bps = 900;
  const auto result = fixture.submit(again);
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::protocol_already_initialized));
  EXPECT_EQ(fixture.global()->parameters.stability_fee_bps, 100u);
}

TEST(protocol_state, initialize_rejects_bad_references) {
  auto fixture = execution_fixture{"steward_protocol_refs"};

  auto zero_oracle = fixture.make_initialize();
  zero_oracle.oracle = {};
  EXPECT_EQ(fixture.submit(zero_oracle).code,
            code_of(transaction_error_code::invalid_reference));

  auto aliased = fixture.make_initialize();
  aliased.token_mint = aliased.reserve_vault;
  EXPECT_EQ(fixture.submit(aliased).code,
            code_of(transaction_error_code::invalid_reference));

  auto bad_parameters = fixture.make_initialize();
  bad_parameters.parameters.epoch_duration = -1;
  EXPECT_EQ(fixture.submit(bad_parameters).code,
            code_of(transaction_error_code::invalid_parameters));

  EXPECT_FALSE(fixture.global().has_value());
}

TEST(protocol_state, operations_before_initialize_fail) {
  auto fixture = execution_fixture{"steward_protocol_uninit"};
  const auto result = fixture.submit(steward::schema::deposit_reserve_t{
      .authority = fixture.authority, .amount = 1});
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::protocol_not_initialized));
}

TEST(protocol_state, update_parameters_requires_authority) {
  auto fixture = execution_fixture{"steward_protocol_update"};
  fixture.initialize();

  auto parameters = steward::testing::make_default_parameters();
  parameters.mint_burn_cap_bps = 1'000;

  auto rejected = fixture.submit(steward::schema::update_parameters_t{
      .authority = fixture.agent(1), .parameters = parameters});
  EXPECT_EQ(rejected.code, code_of(transaction_error_code::unauthorized));

  auto invalid = parameters;
  invalid.vhr_warning_bps = 11'000;
  EXPECT_EQ(fixture
                .submit(steward::schema::update_parameters_t{
                    .authority = fixture.authority, .parameters = invalid})
                .code,
            code_of(transaction_error_code::invalid_parameters));

  auto accepted = fixture.submit(steward::schema::update_parameters_t{
      .authority = fixture.authority, .parameters = parameters});
  ASSERT_EQ(accepted.code, 0u) << accepted.log;
  EXPECT_TRUE(steward::testing::has_event(accepted, "parameters_updated"));
  EXPECT_EQ(fixture.global()->parameters.mint_burn_cap_bps, 1'000u);
}
