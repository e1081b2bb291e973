#include <spdlog/spdlog.h>
#include <steward/substrate/server.hpp>
#include <string>
#include <vector>

using namespace steward::substrate;
using namespace steward::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

std::string make_string(const hash32_t& hash) {
  return std::string{std::begin(hash), std::end(hash)};
}

void populate_tx_result(const transaction_result_t& source,
                        steward::substrate::v1::TxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(bytes_view_t{source.data}));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

}  // namespace

listener::listener(steward::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const steward::substrate::v1::InfoRequest* /*request*/,
    steward::substrate::v1::InfoResponse* response) {
  auto lock = std::scoped_lock{mutex_};
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(make_string(info.last_block_state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const steward::substrate::v1::CheckTxRequest* request,
    steward::substrate::v1::CheckTxResponse* response) {
  auto tx = make_bytes(request->tx());
  auto lock = std::scoped_lock{mutex_};
  auto check = execution_engine_.check_transaction(bytes_view_t{tx});
  populate_tx_result(check, response->mutable_result());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const steward::substrate::v1::FinalizeBlockRequest* request,
    steward::substrate::v1::FinalizeBlockResponse* response) {
  auto txs = std::vector<bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto lock = std::scoped_lock{mutex_};
  auto execution =
      execution_engine_.finalize_block(request->height(), request->time(), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_tx_result(tx_result, response->add_tx_results());
  }
  response->set_state_root(make_string(execution.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const steward::substrate::v1::CommitRequest* /*request*/,
    steward::substrate::v1::CommitResponse* response) {
  auto lock = std::scoped_lock{mutex_};
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  response->set_committed_height(commit.committed_height);
  response->set_state_root(make_string(commit.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const steward::substrate::v1::QueryRequest* request,
    steward::substrate::v1::QueryResponse* response) {
  auto data = make_bytes(request->data());
  auto lock = std::scoped_lock{mutex_};
  auto query = execution_engine_.query(request->path(), bytes_view_t{data});
  if (query.code != 0) {
    spdlog::debug("Query '{}' failed: {}", request->path(), query.log);
  }
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(bytes_view_t{query.key}));
  response->set_value(make_string(bytes_view_t{query.value}));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
