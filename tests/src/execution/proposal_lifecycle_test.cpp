#include <steward/execution/proposal_registry.hpp>
#include <steward/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <limits>

using steward::schema::proposal_status_t;
using steward::schema::transaction_error_code;
using steward::testing::code_of;
using steward::testing::execution_fixture;

namespace {

constexpr auto kVotingPeriod = steward::schema::duration_seconds_t{86'400};
constexpr auto kExecutionDelay = steward::schema::duration_seconds_t{172'800};

/// Create, vote through and finalize a proposal; leaves the clock at the
/// moment it becomes executable.
steward::schema::proposal_id_t pass_proposal(
    execution_fixture& fixture,
    steward::schema::policy_payload_t payload) {
  const auto id = fixture.create_proposal(fixture.agent(1), std::move(payload));
  EXPECT_EQ(fixture.vote(fixture.agent(2), id, true, 100).code, 0u);
  fixture.advance(kVotingPeriod);
  EXPECT_EQ(fixture.finalize(id).code, 0u);
  fixture.advance(kExecutionDelay);
  return id;
}

steward::schema::transaction_result_t execute(
    execution_fixture& fixture,
    const steward::schema::proposal_id_t id) {
  return fixture.submit(steward::schema::execute_proposal_t{
      .authority = fixture.authority, .proposal_id = id});
}

}  // namespace

TEST(proposal_lifecycle, validate_payload_rules) {
  using steward::execution::proposal_registry::validate_payload;
  const auto asset = [](uint8_t seed) {
    return steward::testing::make_hash(seed);
  };

  EXPECT_TRUE(validate_payload(steward::schema::mint_supply_t{}).has_value());
  EXPECT_TRUE(validate_payload(steward::schema::burn_supply_t{}).has_value());
  EXPECT_FALSE(
      validate_payload(steward::schema::burn_supply_t{.amount = 1})
          .has_value());

  EXPECT_FALSE(validate_payload(steward::schema::rebalance_t{
                                    .targets = {{asset(1), 6'000},
                                                {asset(2), 4'000}}})
                   .has_value());
  EXPECT_TRUE(validate_payload(steward::schema::rebalance_t{}).has_value());
  EXPECT_TRUE(validate_payload(steward::schema::rebalance_t{
                                   .targets = {{asset(1), 6'000},
                                               {asset(2), 3'999}}})
                  .has_value());
  EXPECT_TRUE(validate_payload(steward::schema::rebalance_t{
                                   .targets = {{asset(1), 5'000},
                                               {asset(1), 5'000}}})
                  .has_value());
  EXPECT_TRUE(validate_payload(steward::schema::rebalance_t{
                                   .targets = {{asset(1), 10'000},
                                               {asset(2), 0}}})
                  .has_value());

  EXPECT_TRUE(validate_payload(steward::schema::parameter_update_t{
                                   .parameter = steward::schema::
                                       protocol_parameter_t::epoch_duration,
                                   .value = 0})
                  .has_value());
  EXPECT_TRUE(validate_payload(steward::schema::parameter_update_t{
                                   .parameter = steward::schema::
                                       protocol_parameter_t::stability_fee_bps,
                                   .value = 10'001})
                  .has_value());
  EXPECT_TRUE(
      validate_payload(steward::schema::credit_rate_update_t{.rate_bps = 10'001})
          .has_value());
  EXPECT_FALSE(
      validate_payload(steward::schema::credit_rate_update_t{.rate_bps = 250})
          .has_value());
}

TEST(proposal_lifecycle, create_assigns_sequential_ids) {
  auto fixture = execution_fixture{"steward_proposal_ids"};
  fixture.initialize();

  const auto first = fixture.create_proposal(fixture.agent(1));
  const auto second = fixture.create_proposal(fixture.agent(2));
  EXPECT_EQ(first, 0u);
  EXPECT_EQ(second, 1u);
  EXPECT_EQ(fixture.global()->proposal_counter, 2u);

  auto proposal = fixture.proposal(first);
  ASSERT_TRUE(proposal.has_value());
  EXPECT_EQ(proposal->proposer, fixture.agent(1));
  EXPECT_EQ(proposal->status, proposal_status_t::active);
  EXPECT_EQ(proposal->voting_starts_at, fixture.now());
  EXPECT_EQ(proposal->voting_ends_at, fixture.now() + kVotingPeriod);
  EXPECT_EQ(proposal->yes_stake, 0);
}

TEST(proposal_lifecycle, create_rejects_voting_period_outside_bounds) {
  auto fixture = execution_fixture{"steward_proposal_period"};
  fixture.initialize();

  for (const auto duration :
       {steward::schema::duration_seconds_t{3'599},
        steward::schema::duration_seconds_t{604'801}}) {
    const auto result = fixture.submit(steward::schema::create_proposal_t{
        .proposer = fixture.agent(1),
        .payload = steward::schema::mint_supply_t{.amount = 1},
        .voting_duration = duration});
    EXPECT_EQ(result.code,
              code_of(transaction_error_code::invalid_voting_period));
  }
  EXPECT_NE(fixture.create_proposal(fixture.agent(1),
                                    steward::schema::mint_supply_t{.amount = 1},
                                    3'600),
            std::numeric_limits<steward::schema::proposal_id_t>::max());
  EXPECT_EQ(fixture.global()->proposal_counter, 1u);
}

TEST(proposal_lifecycle, create_rejects_invalid_payload) {
  auto fixture = execution_fixture{"steward_proposal_payload"};
  fixture.initialize();
  const auto result = fixture.submit(steward::schema::create_proposal_t{
      .proposer = fixture.agent(1),
      .payload = steward::schema::rebalance_t{},
      .voting_duration = kVotingPeriod});
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::invalid_policy_payload));
  EXPECT_EQ(fixture.global()->proposal_counter, 0u);
}

TEST(proposal_lifecycle, finalize_waits_for_voting_to_close) {
  auto fixture = execution_fixture{"steward_proposal_open"};
  fixture.initialize();
  const auto id = fixture.create_proposal(fixture.agent(1));

  fixture.advance(kVotingPeriod - 1);
  EXPECT_EQ(fixture.finalize(id).code,
            code_of(transaction_error_code::voting_still_open));
  fixture.advance(1);
  EXPECT_EQ(fixture.finalize(id).code, 0u);
  EXPECT_EQ(fixture.finalize(id).code,
            code_of(transaction_error_code::proposal_not_active));
  EXPECT_EQ(fixture.finalize(99).code,
            code_of(transaction_error_code::proposal_missing));
}

TEST(proposal_lifecycle, majority_stake_passes) {
  auto fixture = execution_fixture{"steward_proposal_pass"};
  fixture.initialize();
  const auto id = fixture.create_proposal(fixture.agent(1));
  ASSERT_EQ(fixture.vote(fixture.agent(2), id, true, 300).code, 0u);
  ASSERT_EQ(fixture.vote(fixture.agent(3), id, false, 100).code, 0u);

  fixture.advance(kVotingPeriod);
  const auto result = fixture.finalize(id);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(steward::testing::event_attribute(result, "proposal_finalized",
                                              "approval_bps"),
            "7500");

  const auto proposal = fixture.proposal(id);
  EXPECT_EQ(proposal->status, proposal_status_t::passed);
  EXPECT_EQ(proposal->passed_at, fixture.now());
  EXPECT_EQ(proposal->resolved_at, fixture.now());
}

TEST(proposal_lifecycle, tie_and_empty_votes_fail) {
  auto fixture = execution_fixture{"steward_proposal_fail"};
  fixture.initialize();
  const auto tied = fixture.create_proposal(fixture.agent(1));
  const auto empty = fixture.create_proposal(fixture.agent(1));
  ASSERT_EQ(fixture.vote(fixture.agent(2), tied, true, 100).code, 0u);
  ASSERT_EQ(fixture.vote(fixture.agent(3), tied, false, 100).code, 0u);

  fixture.advance(kVotingPeriod);
  ASSERT_EQ(fixture.finalize(tied).code, 0u);
  const auto result = fixture.finalize(empty);
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(steward::testing::event_attribute(result, "proposal_finalized",
                                              "approval_bps"),
            "none");

  EXPECT_EQ(fixture.proposal(tied)->status, proposal_status_t::failed);
  EXPECT_EQ(fixture.proposal(empty)->status, proposal_status_t::failed);
  EXPECT_FALSE(fixture.proposal(empty)->passed_at.has_value());
  EXPECT_EQ(execute(fixture, tied).code,
            code_of(transaction_error_code::proposal_not_passed));
}

TEST(proposal_lifecycle, execution_waits_for_delay) {
  auto fixture = execution_fixture{"steward_proposal_delay"};
  fixture.initialize();
  const auto id = fixture.create_proposal(fixture.agent(1));
  ASSERT_EQ(fixture.vote(fixture.agent(2), id, true, 100).code, 0u);
  fixture.advance(kVotingPeriod);
  ASSERT_EQ(fixture.finalize(id).code, 0u);

  EXPECT_EQ(execute(fixture, id).code,
            code_of(transaction_error_code::execution_delay_not_elapsed));
  fixture.advance(kExecutionDelay - 1);
  EXPECT_EQ(execute(fixture, id).code,
            code_of(transaction_error_code::execution_delay_not_elapsed));
  fixture.advance(1);

  const auto result = execute(fixture, id);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_TRUE(steward::testing::has_event(result, "proposal_executed"));
  EXPECT_EQ(fixture.proposal(id)->status, proposal_status_t::executed);
  EXPECT_EQ(fixture.proposal(id)->executed_at, fixture.now());
  EXPECT_EQ(fixture.vault().liabilities, 1'000);

  EXPECT_EQ(execute(fixture, id).code,
            code_of(transaction_error_code::proposal_not_passed));
}

TEST(proposal_lifecycle, only_authority_executes) {
  auto fixture = execution_fixture{"steward_proposal_exec_auth"};
  fixture.initialize();
  const auto id = pass_proposal(fixture, steward::schema::mint_supply_t{
                                             .amount = 1'000});
  const auto result = fixture.submit(steward::schema::execute_proposal_t{
      .authority = fixture.agent(1), .proposal_id = id});
  EXPECT_EQ(result.code, code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(fixture.proposal(id)->status, proposal_status_t::passed);
}

TEST(proposal_lifecycle, supply_changes_respect_cap) {
  auto fixture = execution_fixture{"steward_proposal_cap"};
  fixture.initialize();
  ASSERT_EQ(execute(fixture, pass_proposal(fixture,
                                           steward::schema::mint_supply_t{
                                               .amount = 1'000}))
                .code,
            0u);

  // 500 bps of 1000 liabilities.
  const auto over = pass_proposal(fixture,
                                  steward::schema::mint_supply_t{.amount = 51});
  EXPECT_EQ(execute(fixture, over).code,
            code_of(transaction_error_code::supply_cap_exceeded));
  EXPECT_EQ(fixture.proposal(over)->status, proposal_status_t::passed);

  const auto within = pass_proposal(
      fixture, steward::schema::burn_supply_t{.amount = 50});
  ASSERT_EQ(execute(fixture, within).code, 0u);
  EXPECT_EQ(fixture.vault().liabilities, 950);
}

TEST(proposal_lifecycle, burn_beyond_liabilities_is_rejected) {
  auto fixture = execution_fixture{"steward_proposal_burn"};
  fixture.initialize();
  const auto id =
      pass_proposal(fixture, steward::schema::burn_supply_t{.amount = 1});
  EXPECT_EQ(execute(fixture, id).code,
            code_of(transaction_error_code::invalid_amount));
}

TEST(proposal_lifecycle, executes_non_supply_payloads) {
  auto fixture = execution_fixture{"steward_proposal_payloads"};
  fixture.initialize();

  const auto rebalance = pass_proposal(
      fixture, steward::schema::rebalance_t{
                   .targets = {{steward::testing::make_hash(1), 7'000},
                               {steward::testing::make_hash(2), 3'000}}});
  ASSERT_EQ(execute(fixture, rebalance).code, 0u);
  const auto vault = fixture.vault();
  ASSERT_EQ(vault.composition.size(), 2u);
  EXPECT_EQ(vault.composition[0].weight_bps, 7'000u);
  EXPECT_EQ(vault.last_rebalance_at, fixture.now());

  const auto parameter = pass_proposal(
      fixture,
      steward::schema::parameter_update_t{
          .parameter = steward::schema::protocol_parameter_t::stability_fee_bps,
          .value = 250});
  ASSERT_EQ(execute(fixture, parameter).code, 0u);
  EXPECT_EQ(fixture.global()->parameters.stability_fee_bps, 250u);

  const auto credit = pass_proposal(
      fixture, steward::schema::credit_rate_update_t{.rate_bps = 300});
  ASSERT_EQ(execute(fixture, credit).code, 0u);
  EXPECT_EQ(fixture.global()->credit_rate_bps, 300u);
}

TEST(proposal_lifecycle, cancel_only_while_voting_is_open) {
  auto fixture = execution_fixture{"steward_proposal_cancel"};
  fixture.initialize();
  const auto open = fixture.create_proposal(fixture.agent(1));
  const auto closed = fixture.create_proposal(fixture.agent(1));

  EXPECT_EQ(fixture
                .submit(steward::schema::cancel_proposal_t{
                    .authority = fixture.agent(1), .proposal_id = open})
                .code,
            code_of(transaction_error_code::unauthorized));

  const auto result = fixture.submit(steward::schema::cancel_proposal_t{
      .authority = fixture.authority, .proposal_id = open});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_TRUE(steward::testing::has_event(result, "proposal_cancelled"));
  EXPECT_EQ(fixture.proposal(open)->status, proposal_status_t::cancelled);
  EXPECT_EQ(fixture.vote(fixture.agent(2), open, true, 10).code,
            code_of(transaction_error_code::proposal_not_active));

  fixture.advance(kVotingPeriod);
  EXPECT_EQ(fixture
                .submit(steward::schema::cancel_proposal_t{
                    .authority = fixture.authority, .proposal_id = closed})
                .code,
            code_of(transaction_error_code::voting_closed));
}

TEST(proposal_lifecycle, resolved_proposals_cannot_be_cancelled) {
  auto fixture = execution_fixture{"steward_proposal_cancel_resolved"};
  fixture.initialize();
  const auto cancel = [&](const steward::schema::proposal_id_t id) {
    return fixture.submit(steward::schema::cancel_proposal_t{
        .authority = fixture.authority, .proposal_id = id});
  };

  const auto failed = fixture.create_proposal(fixture.agent(1));
  const auto passed = pass_proposal(
      fixture, steward::schema::credit_rate_update_t{.rate_bps = 300});
  ASSERT_EQ(fixture.finalize(failed).code, 0u);
  ASSERT_EQ(fixture.proposal(failed)->status, proposal_status_t::failed);
  ASSERT_EQ(fixture.proposal(passed)->status, proposal_status_t::passed);

  auto result = cancel(passed);
  EXPECT_EQ(result.code, code_of(transaction_error_code::proposal_not_active));
  EXPECT_FALSE(steward::testing::has_event(result, "proposal_cancelled"));
  EXPECT_EQ(fixture.proposal(passed)->status, proposal_status_t::passed);

  EXPECT_EQ(cancel(failed).code,
            code_of(transaction_error_code::proposal_not_active));
  EXPECT_EQ(fixture.proposal(failed)->status, proposal_status_t::failed);

  ASSERT_EQ(execute(fixture, passed).code, 0u);
  EXPECT_EQ(cancel(passed).code,
            code_of(transaction_error_code::proposal_not_active));
  EXPECT_EQ(fixture.proposal(passed)->status, proposal_status_t::executed);
}

TEST(proposal_lifecycle, voting_window_end_overflow_is_rejected) {
  auto fixture = execution_fixture{"steward_proposal_time_overflow"};
  fixture.initialize();
  constexpr auto kLatest =
      std::numeric_limits<steward::schema::timestamp_seconds_t>::max();
  fixture.advance(kLatest - fixture.now() - 60);
  const auto counter = fixture.global()->proposal_counter;

  const auto result = fixture.submit(steward::schema::create_proposal_t{
      .proposer = fixture.agent(1),
      .payload = steward::schema::mint_supply_t{.amount = 5},
      .voting_duration = kVotingPeriod});
  EXPECT_EQ(result.code, code_of(transaction_error_code::arithmetic_overflow));
  EXPECT_EQ(fixture.global()->proposal_counter, counter);
  EXPECT_FALSE(fixture.proposal(counter).has_value());
}
