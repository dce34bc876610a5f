#include <spdlog/spdlog.h>
#include <algorithm>
#include <tessera/blake3/hash.hpp>
#include <tessera/common/critical.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <tessera/schema/query_error_code.hpp>
#include <tessera/schema/registry_error_code.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace tessera::schema;

namespace {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;
using storage_t =
    tessera::storage::storage<tessera::storage::rocksdb_storage_tag>;

constexpr auto kCheckTxCodespace = std::string_view{"tessera.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"tessera.finalize"};
constexpr auto kRegistryCodespace = std::string_view{"tessera.registry"};
constexpr auto kQueryCodespace = std::string_view{"tessera.query"};

tessera::schema::hash32_t fold_state_root(
    const tessera::schema::hash32_t& seed,
    const tessera::schema::bytes_t& tx,
    uint64_t height,
    uint64_t index) {
  auto material = tessera::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return tessera::blake3::hash(
      tessera::schema::bytes_view_t{material.data(), material.size()});
}

/// Decode and envelope-check raw transaction bytes. On failure `error` holds
/// the rejection code and `detail` a human-readable reason.
std::optional<tessera::schema::transaction_t> decode_transaction(
    const tessera::schema::bytes_view_t& raw_tx,
    registry_error_code& error,
    std::string& detail) {
  if (raw_tx.empty()) {
    error = registry_error_code::invalid_transaction;
    detail = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<tessera::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = registry_error_code::invalid_transaction;
    detail = "transaction bytes are not valid SCALE";
    return std::nullopt;
  }
  if (tx->version != 1) {
    error = registry_error_code::unsupported_transaction_version;
    detail = "expected version 1";
    return std::nullopt;
  }
  error = registry_error_code::ok;
  return tx;
}

tessera::schema::transaction_result_t make_rejection(
    const registry_error_code code,
    const std::string_view codespace,
    std::string info) {
  auto result = tessera::schema::transaction_result_t{};
  result.code = to_code(code);
  result.log = std::string{error_message(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

tessera::schema::query_result_t make_query_error(
    const query_error_code code,
    const std::string_view log,
    const tessera::schema::bytes_view_t& key) {
  auto result = tessera::schema::query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.key = make_bytes(key);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

template <typename T>
tessera::schema::query_result_t make_query_result(
    const tessera::execution::lookup_result<T>& lookup,
    const tessera::schema::bytes_view_t& key) {
  auto result = tessera::schema::query_result_t{};
  result.key = make_bytes(key);
  if (!lookup.ok()) {
    result.code = to_code(lookup.code);
    result.log = std::string{error_message(lookup.code)};
    result.codespace = std::string{kRegistryCodespace};
    return result;
  }
  auto encoder = encoder_t{};
  result.value = encoder.encode(lookup.value);
  return result;
}

std::vector<tessera::schema::history_entry_t> load_history(
    const storage_t& storage,
    const uint64_t from_height,
    const uint64_t to_height) {
  auto entries = std::vector<tessera::schema::history_entry_t>{};
  auto encoder = encoder_t{};
  for (auto height = from_height; height <= to_height; ++height) {
    auto prefix = key::make_history_height_prefix(height);
    for (const auto& [row_key, row_value] : storage.list_by_prefix(
             tessera::schema::bytes_view_t{prefix.data(), prefix.size()})) {
      auto entry = encoder.try_decode<tessera::schema::history_entry_t>(
          tessera::schema::bytes_view_t{row_value.data(), row_value.size()});
      if (!entry) {
        tessera::common::critical("failed to decode history entry");
      }
      entries.push_back(std::move(*entry));
    }
    if (height == to_height) {
      break;
    }
  }
  return entries;
}

std::vector<tessera::schema::event_record_t> load_events(
    const storage_t& storage,
    const uint64_t from_id,
    const uint64_t to_id) {
  auto records = std::vector<tessera::schema::event_record_t>{};
  auto encoder = encoder_t{};
  for (auto event_id = std::max<uint64_t>(from_id, 1); event_id <= to_id;
       ++event_id) {
    auto event_key = key::make_event_key(event_id);
    auto record = storage.get<encoder_t, tessera::schema::event_record_t>(
        encoder,
        tessera::schema::bytes_view_t{event_key.data(), event_key.size()});
    if (!record) {
      spdlog::warn("Change log is missing event {}", event_id);
      continue;
    }
    records.push_back(std::move(*record));
    if (event_id == to_id) {
      break;
    }
  }
  return records;
}

}  // namespace

namespace tessera::execution {

engine::engine(
    tessera::schema::encoding::encoder<
        tessera::schema::encoding::scale_encoder_tag>& encoder,
    tessera::storage::storage<tessera::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder},
      storage_{storage},
      block_journal_{std::make_unique<state_journal>(storage)} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing registry engine");
  load_persisted_state();

  if (!storage_.load_committed_state()) {
    last_committed_state_root_ = make_zero_hash();
    pending_state_root_ = last_committed_state_root_;
    storage_.save_committed_state(tessera::storage::committed_state{
        .height = last_committed_height_,
        .state_root = last_committed_state_root_});
  }
  spdlog::info("Registry engine ready at height {} with {} change-log event(s)",
               last_committed_height_, committed_event_seq_);
}

tessera::schema::transaction_result_t engine::check_transaction(
    const tessera::schema::bytes_view_t& raw_tx) {
  auto error = registry_error_code::ok;
  auto detail = std::string{};
  auto tx = decode_transaction(raw_tx, error, detail);
  if (!tx) {
    spdlog::warn("CheckTx rejected transaction: {}", detail);
    return make_rejection(error, kCheckTxCodespace, std::move(detail));
  }
  return tessera::schema::transaction_result_t{};
}

tessera::schema::block_result_t engine::finalize_block(
    uint64_t height,
    const std::vector<tessera::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (!block_journal_->empty()) {
    spdlog::warn("Discarding uncommitted block at height {}", pending_height_);
    block_journal_->discard();
  }

  auto result = tessera::schema::block_result_t{};
  result.tx_results.reserve(txs.size());
  pending_event_seq_ = committed_event_seq_;

  auto rolling_root = last_committed_state_root_;
  auto accepted = size_t{0};
  for (size_t i = 0; i < txs.size(); ++i) {
    const auto index = static_cast<uint32_t>(i);
    auto error = registry_error_code::ok;
    auto detail = std::string{};
    auto tx = decode_transaction(
        tessera::schema::bytes_view_t{txs[i].data(), txs[i].size()}, error,
        detail);

    auto tx_result = tessera::schema::transaction_result_t{};
    if (!tx) {
      spdlog::warn("Block {} tx {} rejected: {}", height, index, detail);
      tx_result = make_rejection(error, kFinalizeCodespace, std::move(detail));
    } else {
      auto tx_journal = state_journal{*block_journal_};
      auto outcome = execute_operation(*tx, tx_journal);
      if (outcome.ok()) {
        tx_journal.commit();
        for (const auto& event : outcome.events) {
          ++pending_event_seq_;
          block_journal_->put(key::make_event_key(pending_event_seq_),
                              event_record_t{.event_id = pending_event_seq_,
                                             .height = height,
                                             .tx_index = index,
                                             .event = event});
        }
        tx_result.events = std::move(outcome.events);
        rolling_root = fold_state_root(rolling_root, txs[i], height, index);
        ++accepted;
      } else {
        tx_journal.discard();
        spdlog::warn("Block {} tx {} refused: {}", height, index,
                     error_message(outcome.code));
        tx_result = make_rejection(outcome.code, kRegistryCodespace,
                                   std::string{to_string(outcome.code)});
      }
    }

    block_journal_->put(key::make_history_key(height, index),
                        history_entry_t{.height = height,
                                        .index = index,
                                        .code = tx_result.code,
                                        .tx = txs[i]});
    result.tx_results.push_back(std::move(tx_result));
  }
  block_journal_->put(key::make_event_seq_key(), pending_event_seq_);

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::info("Finalized block {}: {}/{} transaction(s) accepted", height,
               accepted, txs.size());
  return result;
}

tessera::schema::commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (!block_journal_->empty()) {
    auto checkpoint = storage_.make_committed_state_entry(
        tessera::storage::committed_state{.height = pending_height_,
                                          .state_root = pending_state_root_});
    block_journal_->put_raw(checkpoint.first, std::move(*checkpoint.second));
    block_journal_->commit();

    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    committed_event_seq_ = pending_event_seq_;
    spdlog::info("Committed height {}", last_committed_height_);
  }

  auto result = tessera::schema::commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

tessera::schema::app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = tessera::schema::app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

tessera::schema::query_result_t engine::query(
    std::string_view path,
    const tessera::schema::bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = tessera::schema::query_result_t{};

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{last_committed_height_,
                                              last_committed_state_root_,
                                              committed_event_seq_});
  } else if (path == "/events/range" || path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      spdlog::warn("Query '{}' rejected: malformed range", path);
      return make_query_error(query_error_code::invalid_key,
                              "expected (from, to) range", data);
    }
    auto [from, to] = *range;
    if (path == "/events/range") {
      result.value = encoder_.encode(
          load_events(storage_, from, std::min(to, committed_event_seq_)));
    } else {
      result.value = encoder_.encode(load_history(
          storage_, from,
          std::min(to, static_cast<uint64_t>(last_committed_height_))));
    }
    result.key = make_bytes(data);
  } else if (path.starts_with("/registry/")) {
    result = query_registry(path, data);
  } else {
    spdlog::warn("Unsupported query path '{}'", path);
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported query path", data);
  }

  result.height = last_committed_height_;
  return result;
}

std::vector<tessera::schema::history_entry_t> engine::history(
    uint64_t from_height,
    uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_history(
      storage_, from_height,
      std::min(to_height, static_cast<uint64_t>(last_committed_height_)));
}

std::vector<tessera::schema::event_record_t> engine::events(
    uint64_t from_id,
    uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_events(storage_, from_id, std::min(to_id, committed_event_seq_));
}

uint64_t engine::next_event_id() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_event_seq_ + 1;
}

operation_result engine::execute_operation(
    const tessera::schema::transaction_t& tx,
    state_journal& journal) {
  auto target = registry{journal};
  const auto& caller = tx.signer;
  return std::visit(
      overloaded{
          [&](const create_collection_t& payload) {
            return target.create_collection(caller, payload);
          },
          [&](const mint_t& payload) {
            return target.mint(caller, payload.to, payload.token_id);
          },
          [&](const burn_t& payload) {
            return target.burn(caller, payload.token_id);
          },
          [&](const approve_t& payload) {
            return target.approve(caller, payload.spender, payload.token_id);
          },
          [&](const set_approval_for_all_t& payload) {
            return target.set_approval_for_all(caller, payload.operator_id,
                                               payload.approved);
          },
          [&](const transfer_from_t& payload) {
            return target.transfer_from(caller, payload.from, payload.to,
                                        payload.token_id);
          },
          [&](const pause_minting_t&) { return target.pause_minting(caller); },
          [&](const unpause_minting_t&) {
            return target.unpause_minting(caller);
          }},
      tx.payload);
}

tessera::schema::query_result_t engine::query_registry(
    std::string_view path,
    const tessera::schema::bytes_view_t& data) {
  auto committed = state_journal{storage_};
  const auto target = registry{committed};

  const auto token_id = [&]() { return encoder_.try_decode<token_id_t>(data); };
  const auto malformed = [&](std::string_view expected) {
    spdlog::warn("Query '{}' rejected: expected {}", path, expected);
    return make_query_error(query_error_code::invalid_key,
                            std::string{"expected "} + std::string{expected},
                            data);
  };

  if (path == "/registry/collection") {
    return make_query_result(target.collection(), data);
  }
  if (path == "/registry/name") {
    return make_query_result(target.name(), data);
  }
  if (path == "/registry/symbol") {
    return make_query_result(target.symbol(), data);
  }
  if (path == "/registry/max_supply") {
    return make_query_result(target.max_supply(), data);
  }
  if (path == "/registry/total_supply") {
    return make_query_result(target.total_supply(), data);
  }
  if (path == "/registry/owner_of") {
    auto id = token_id();
    if (!id) {
      return malformed("token id");
    }
    return make_query_result(target.owner_of(*id), data);
  }
  if (path == "/registry/get_approved") {
    auto id = token_id();
    if (!id) {
      return malformed("token id");
    }
    return make_query_result(target.get_approved(*id), data);
  }
  if (path == "/registry/token_uri") {
    auto id = token_id();
    if (!id) {
      return malformed("token id");
    }
    return make_query_result(target.token_uri(*id), data);
  }
  if (path == "/registry/balance_of") {
    auto owner = encoder_.try_decode<identity_t>(data);
    if (!owner) {
      return malformed("owner identity");
    }
    return make_query_result(target.balance_of(*owner), data);
  }
  if (path == "/registry/is_approved_for_all") {
    auto pair = encoder_.try_decode<std::tuple<identity_t, identity_t>>(data);
    if (!pair) {
      return malformed("(owner, operator) identities");
    }
    return make_query_result(
        lookup_result<bool>{.code = registry_error_code::ok,
                            .value = target.is_approved_for_all(
                                std::get<0>(*pair), std::get<1>(*pair))},
        data);
  }

  spdlog::warn("Unsupported query path '{}'", path);
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
  }
  auto seq_key = key::make_event_seq_key();
  committed_event_seq_ =
      storage_
          .get<encoder_t, uint64_t>(
              encoder_, tessera::schema::bytes_view_t{seq_key.data(),
                                                      seq_key.size()})
          .value_or(0);
  pending_event_seq_ = committed_event_seq_;
}

}  // namespace tessera::execution
