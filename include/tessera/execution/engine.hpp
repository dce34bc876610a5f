#pragma once

#include <tessera/execution/registry.hpp>
#include <tessera/execution/state_journal.hpp>
#include <tessera/schema/app_info.hpp>
#include <tessera/schema/block_result.hpp>
#include <tessera/schema/commit_result.hpp>
#include <tessera/schema/encoding/encoder.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/history_entry.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/query_result.hpp>
#include <tessera/schema/registry_event.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/schema/transaction_result.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace tessera::execution {

/// Deterministic registry host.
///
/// The engine decodes transactions, applies them to the registry one at a
/// time, records history and the notification change log, and exposes the
/// read-only query surface. One mutex serializes every entry point.
class engine final {
 public:
  /// Construct the engine over an open store and restore the last committed
  /// height, state root and change-log sequence.
  explicit engine(
      tessera::schema::encoding::encoder<
          tessera::schema::encoding::scale_encoder_tag>& encoder,
      tessera::storage::storage<tessera::storage::rocksdb_storage_tag>&
          storage);

  /// Admission check: decode and envelope validation only; no state change.
  tessera::schema::transaction_result_t check_transaction(
      const tessera::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state_root.
  ///
  /// Transactions are processed in order; per-tx results are returned even on
  /// failures. A refused transaction leaves no trace in registry state.
  tessera::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<tessera::schema::bytes_t>& txs);

  /// Flush the finalized block (state, change log, history, checkpoint) to
  /// storage in one atomic write.
  tessera::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  tessera::schema::app_info_t info() const;

  /// Execute a read-only query by route over committed state.
  tessera::schema::query_result_t query(
      std::string_view path,
      const tessera::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range.
  std::vector<tessera::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Return committed change-log records in the inclusive id range.
  std::vector<tessera::schema::event_record_t> events(uint64_t from_id,
                                                      uint64_t to_id) const;

  /// Identifier that the next committed notification will receive.
  uint64_t next_event_id() const;

 private:
  /// Dispatch a decoded transaction to the registry against `journal`.
  operation_result execute_operation(const tessera::schema::transaction_t& tx,
                                     state_journal& journal);

  /// Query routes served from a registry bound to committed state.
  tessera::schema::query_result_t query_registry(
      std::string_view path,
      const tessera::schema::bytes_view_t& data);

  /// Load committed checkpoint and change-log sequence at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  tessera::schema::encoding::encoder<
      tessera::schema::encoding::scale_encoder_tag>& encoder_;
  tessera::storage::storage<tessera::storage::rocksdb_storage_tag>& storage_;
  std::unique_ptr<state_journal> block_journal_;
  int64_t last_committed_height_{};
  tessera::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  tessera::schema::hash32_t pending_state_root_{};
  uint64_t committed_event_seq_{};
  uint64_t pending_event_seq_{};
};

}  // namespace tessera::execution
