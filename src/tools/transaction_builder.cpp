#include <boost/program_options.hpp>
#include <steward/blake3/hash.hpp>
#include <steward/common/critical.hpp>
#include <steward/crypto/verify.hpp>
#include <steward/execution/auth_gate.hpp>
#include <steward/schema/encoding/scale/encoder.hpp>
#include <steward/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = steward::schema::encoding::encoder<
    steward::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

steward::schema::hash32_t get_hash32(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    steward::common::critical("missing required --" + name);
  }
  auto hash = steward::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    steward::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

steward::schema::amount_t get_amount(const po::variables_map& vm) {
  return steward::schema::amount_t{vm["amount"].as<std::string>().c_str()};
}

steward::schema::policy_payload_t build_policy(const po::variables_map& vm) {
  auto policy = vm["policy"].as<std::string>();
  if (policy == "mint_supply") {
    return steward::schema::mint_supply_t{.amount = get_amount(vm)};
  }
  if (policy == "burn_supply") {
    return steward::schema::burn_supply_t{.amount = get_amount(vm)};
  }
  if (policy == "rebalance") {
    if (!vm.contains("target")) {
      steward::common::critical("rebalance requires --target asset:bps");
    }
    auto rebalance = steward::schema::rebalance_t{};
    for (const auto& target : vm["target"].as<std::vector<std::string>>()) {
      auto separator = target.find(':');
      if (separator == std::string::npos) {
        steward::common::critical("--target must be asset_hex:weight_bps");
      }
      auto asset = steward::schema::try_make_hash32(
          std::string_view{target}.substr(0, separator));
      if (!asset) {
        steward::common::critical("--target asset must be 32 bytes of hex");
      }
      rebalance.targets.push_back(steward::schema::asset_weight_t{
          .asset_id = *asset,
          .weight_bps = static_cast<steward::schema::basis_points_t>(
              std::stoul(target.substr(separator + 1)))});
    }
    return rebalance;
  }
  if (policy == "parameter_update") {
    auto parameter =
        steward::schema::try_from_string<steward::schema::protocol_parameter_t>(
            vm["parameter"].as<std::string>());
    if (!parameter) {
      steward::common::critical(
          "parameter must be epoch_duration|mint_burn_cap_bps|"
          "stability_fee_bps");
    }
    return steward::schema::parameter_update_t{
        .parameter = *parameter, .value = vm["value"].as<uint64_t>()};
  }
  if (policy == "credit_rate_update") {
    return steward::schema::credit_rate_update_t{
        .rate_bps = vm["rate-bps"].as<uint32_t>()};
  }
  steward::common::critical("unsupported policy type");
}

steward::schema::protocol_parameters_t build_parameters(
    const po::variables_map& vm) {
  auto parameters = steward::schema::protocol_parameters_t{};
  parameters.epoch_duration = vm["epoch-duration"].as<int64_t>();
  parameters.mint_burn_cap_bps = vm["mint-burn-cap-bps"].as<uint32_t>();
  parameters.stability_fee_bps = vm["stability-fee-bps"].as<uint32_t>();
  parameters.vhr_warning_bps = vm["vhr-warning-bps"].as<uint32_t>();
  parameters.vhr_critical_bps = vm["vhr-critical-bps"].as<uint32_t>();
  return parameters;
}

steward::schema::instruction_t build_instruction(
    const po::variables_map& vm,
    const steward::schema::public_key_t& signer) {
  auto kind = vm["instruction"].as<std::string>();
  auto proposal_id = vm["proposal-id"].as<uint64_t>();
  if (kind == "initialize_protocol") {
    return steward::schema::initialize_protocol_t{
        .authority = signer,
        .oracle = get_hash32(vm, "oracle"),
        .settlement_service = get_hash32(vm, "settlement-service"),
        .reserve_vault = get_hash32(vm, "reserve-vault"),
        .token_mint = get_hash32(vm, "token-mint"),
        .parameters = build_parameters(vm)};
  }
  if (kind == "update_parameters") {
    return steward::schema::update_parameters_t{
        .authority = signer, .parameters = build_parameters(vm)};
  }
  if (kind == "create_proposal") {
    return steward::schema::create_proposal_t{
        .proposer = signer,
        .payload = build_policy(vm),
        .voting_duration = vm["voting-duration"].as<int64_t>()};
  }
  if (kind == "cast_vote") {
    return steward::schema::cast_vote_t{
        .agent = signer,
        .proposal_id = proposal_id,
        .prediction = vm["prediction"].as<bool>(),
        .stake_amount = vm["stake"].as<uint64_t>()};
  }
  if (kind == "finalize_proposal") {
    return steward::schema::finalize_proposal_t{.caller = signer,
                                                .proposal_id = proposal_id};
  }
  if (kind == "execute_proposal") {
    return steward::schema::execute_proposal_t{.authority = signer,
                                               .proposal_id = proposal_id};
  }
  if (kind == "cancel_proposal") {
    return steward::schema::cancel_proposal_t{.authority = signer,
                                              .proposal_id = proposal_id};
  }
  if (kind == "update_oracle") {
    return steward::schema::update_oracle_t{
        .reporter = signer,
        .reading = steward::schema::oracle_reading_t{
            .index_value = vm["index-value"].as<uint64_t>(),
            .avg_yield_bps = vm["avg-yield-bps"].as<uint32_t>(),
            .volatility_bps = vm["volatility-bps"].as<uint32_t>(),
            .tvl_usd = vm["tvl-usd"].as<uint64_t>(),
            .observed_at = vm["observed-at"].as<int64_t>(),
            .observed_slot = vm["observed-slot"].as<uint64_t>()}};
  }
  if (kind == "request_circuit_breaker") {
    return steward::schema::request_circuit_breaker_t{
        .authority = signer, .reason = vm["reason"].as<std::string>()};
  }
  if (kind == "activate_circuit_breaker") {
    return steward::schema::activate_circuit_breaker_t{.authority = signer};
  }
  if (kind == "resume_operations") {
    return steward::schema::resume_operations_t{.authority = signer};
  }
  if (kind == "settle_vote") {
    return steward::schema::settle_vote_t{.settlement_service = signer,
                                          .proposal_id = proposal_id,
                                          .agent = get_hash32(vm, "agent")};
  }
  if (kind == "deposit_reserve") {
    return steward::schema::deposit_reserve_t{.authority = signer,
                                              .amount = get_amount(vm)};
  }
  if (kind == "withdraw_reserve") {
    return steward::schema::withdraw_reserve_t{.authority = signer,
                                               .amount = get_amount(vm)};
  }
  steward::common::critical("unsupported instruction type");
}

steward::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/state/global" ||
      path == "/state/oracle" || path == "/state/vault" ||
      path == "/state/health") {
    return {};
  }
  if (path == "/state/proposal" || path == "/state/votes") {
    return encoder.encode(vm["proposal-id"].as<uint64_t>());
  }
  if (path == "/state/vote") {
    return encoder.encode(std::tuple{vm["proposal-id"].as<uint64_t>(),
                                     get_hash32(vm, "agent")});
  }
  if (path == "/state/agent") {
    return encoder.encode(get_hash32(vm, "agent"));
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  steward::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  steward-tx transaction --instruction <type> [options]\n"
            << "  steward-tx query-key --path <route> [options]\n"
            << "  steward-tx chain-id [--chain-name <name>]\n"
            << "  steward-tx public-key --secret-key <hex>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"steward-tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id|public-key")(
      "chain-name", po::value<std::string>()->default_value("steward-local"),
      "chain name; the chain id is its BLAKE3 hash")(
      "secret-key", po::value<std::string>(), "Ed25519 32-byte seed hex")(
      "nonce", po::value<uint64_t>()->default_value(0),
      "signer's current nonce (see /state/agent)")(
      "instruction", po::value<std::string>(), "instruction type")(
      "path", po::value<std::string>(), "query path")(
      "proposal-id", po::value<uint64_t>()->default_value(0), "proposal id")(
      "agent", po::value<std::string>(), "agent public key hex")(
      "policy", po::value<std::string>()->default_value("mint_supply"),
      "mint_supply|burn_supply|rebalance|parameter_update|credit_rate_update")(
      "amount", po::value<std::string>()->default_value("0"),
      "mint/burn/reserve amount (decimal, up to 128 bits)")(
      "target", po::value<std::vector<std::string>>()->multitoken(),
      "rebalance target asset_hex:weight_bps")(
      "parameter", po::value<std::string>()->default_value("epoch_duration"),
      "protocol parameter name")(
      "value", po::value<uint64_t>()->default_value(0),
      "protocol parameter value")(
      "rate-bps", po::value<uint32_t>()->default_value(0), "credit rate")(
      "voting-duration", po::value<int64_t>()->default_value(86'400),
      "voting window in seconds")(
      "prediction", po::value<bool>()->default_value(true), "vote direction")(
      "stake", po::value<uint64_t>()->default_value(0), "vote stake")(
      "oracle", po::value<std::string>(), "oracle reporter key hex")(
      "settlement-service", po::value<std::string>(),
      "settlement service key hex")("reserve-vault", po::value<std::string>(),
                                    "reserve vault reference hex")(
      "token-mint", po::value<std::string>(), "token mint reference hex")(
      "epoch-duration", po::value<int64_t>()->default_value(86'400),
      "epoch duration in seconds")(
      "mint-burn-cap-bps", po::value<uint32_t>()->default_value(500),
      "mint/burn cap per execution")(
      "stability-fee-bps", po::value<uint32_t>()->default_value(100),
      "stability fee")("vhr-warning-bps",
                       po::value<uint32_t>()->default_value(15'000),
                       "warning threshold")(
      "vhr-critical-bps", po::value<uint32_t>()->default_value(12'000),
      "critical threshold")("index-value", po::value<uint64_t>(),
                            "oracle index value (scaled by 1e6)")(
      "avg-yield-bps", po::value<uint32_t>()->default_value(0), "yield")(
      "volatility-bps", po::value<uint32_t>()->default_value(0), "volatility")(
      "tvl-usd", po::value<uint64_t>()->default_value(0), "TVL in USD")(
      "observed-at", po::value<int64_t>()->default_value(0),
      "oracle observation time")("observed-slot",
                                 po::value<uint64_t>()->default_value(0),
                                 "oracle observation slot")(
      "reason", po::value<std::string>()->default_value(""),
      "circuit breaker reason")("from-height",
                                po::value<uint64_t>()->default_value(1),
                                "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto chain_id =
      steward::blake3::hash(std::string_view{vm["chain-name"].as<std::string>()});

  if (command == "chain-id") {
    std::cout << steward::schema::to_hex(steward::schema::bytes_view_t{chain_id})
              << '\n';
    return 0;
  }

  if (command == "public-key") {
    auto public_key =
        steward::crypto::derive_public_key(get_hash32(vm, "secret-key"));
    if (!public_key) {
      steward::common::critical("failed to derive Ed25519 public key");
    }
    std::cout << steward::schema::to_hex(
                     steward::schema::bytes_view_t{*public_key})
              << '\n';
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("instruction")) {
      steward::common::critical("transaction mode requires --instruction");
    }
    auto seed = get_hash32(vm, "secret-key");
    auto signer = steward::crypto::derive_public_key(seed);
    if (!signer) {
      steward::common::critical("failed to derive Ed25519 public key");
    }

    auto encoder = encoder_t{};
    auto instruction = build_instruction(vm, *signer);
    auto message = steward::execution::make_signing_message(
        encoder, chain_id, vm["nonce"].as<uint64_t>(), instruction);
    auto signature =
        steward::crypto::sign(steward::schema::bytes_view_t{message}, seed);
    if (!signature) {
      steward::common::critical("failed to sign instruction");
    }

    auto transaction = steward::schema::transaction_t{.chain_id = chain_id};
    transaction.instructions.push_back(steward::schema::verify_signature_t{
        .public_key = *signer, .signature = *signature, .message = message});
    transaction.instructions.push_back(std::move(instruction));
    auto encoded = encoder.encode(transaction);
    std::cout << steward::schema::to_base64(
                     steward::schema::bytes_view_t{encoded})
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      steward::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << steward::schema::to_base64(steward::schema::bytes_view_t{key})
              << '\n';
    return 0;
  }

  steward::common::critical(
      "command must be transaction|query-key|chain-id|public-key");
}
