#pragma once

#include <tessera/common/critical.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <map>
#include <optional>

namespace tessera::execution {

/// Read-through write overlay over committed storage.
///
/// Journals nest: a transaction journal stages over the block journal, which
/// stages over RocksDB. Reads see the closest staged value first. Nothing
/// reaches storage until the root journal commits, and then everything lands
/// in a single write batch.
class state_journal final {
 public:
  using storage_t =
      tessera::storage::storage<tessera::storage::rocksdb_storage_tag>;

  explicit state_journal(const storage_t& storage);
  explicit state_journal(state_journal& parent);

  state_journal(const state_journal&) = delete;
  state_journal& operator=(const state_journal&) = delete;
  state_journal(state_journal&&) = delete;
  state_journal& operator=(state_journal&&) = delete;

  std::optional<tessera::schema::bytes_t> get_raw(
      const tessera::schema::bytes_t& key) const;
  void put_raw(const tessera::schema::bytes_t& key,
               tessera::schema::bytes_t value);
  void erase(const tessera::schema::bytes_t& key);

  /// Decode the visible value at key. Corrupt rows are fatal.
  template <typename T>
  std::optional<T> get(const tessera::schema::bytes_t& key) const;

  template <typename T>
  void put(const tessera::schema::bytes_t& key, const T& value);

  /// Merge staged writes into the parent journal, or flush them to storage
  /// atomically when this is the root journal. The journal is empty after.
  void commit();

  /// Drop every staged write.
  void discard();

  bool empty() const;
  std::size_t size() const;

  /// Staged writes in key order; std::nullopt values are deletions.
  tessera::storage::write_set_t write_set() const;

 private:
  using encoder_t = tessera::schema::encoding::encoder<
      tessera::schema::encoding::scale_encoder_tag>;

  const storage_t* storage_{nullptr};
  state_journal* parent_{nullptr};
  std::map<tessera::schema::bytes_t, std::optional<tessera::schema::bytes_t>>
      writes_;
};

template <typename T>
std::optional<T> state_journal::get(const tessera::schema::bytes_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<T>(
      tessera::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    spdlog::error("Corrupt state row under key {}",
                  tessera::schema::to_hex(
                      tessera::schema::bytes_view_t{key.data(), key.size()}));
    tessera::common::critical("failed to decode persisted state row");
  }
  return decoded;
}

template <typename T>
void state_journal::put(const tessera::schema::bytes_t& key, const T& value) {
  auto encoder = encoder_t{};
  put_raw(key, encoder.encode(value));
}

}  // namespace tessera::execution
