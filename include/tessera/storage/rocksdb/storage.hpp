#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tessera/common/critical.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace tessera::storage {

namespace detail {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline tessera::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tessera::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const tessera::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tessera::schema::bytes_view_t& key,
           const T& value);

  std::optional<tessera::schema::bytes_t> get_raw(
      const tessera::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  write_entry_t make_committed_state_entry(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tessera::schema::bytes_view_t& prefix) const;
  void apply(const write_set_t& writes) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tessera::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      tessera::schema::bytes_view_t{raw->data(), raw->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tessera::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(tessera::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    tessera::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<tessera::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const tessera::schema::bytes_view_t& key) const {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    tessera::common::critical("Failed to get value from RocksDB");
  }
  return tessera::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto committed_raw = get_raw(
      tessera::schema::make_bytes_view(detail::kCommittedHeightKey));
  if (!committed_raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, tessera::schema::hash32_t>>(
          tessera::schema::bytes_view_t{committed_raw->data(),
                                        committed_raw->size()});
  if (!decoded.has_value()) {
    tessera::common::critical("failed to decode committed state");
  }
  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

inline write_entry_t storage<rocksdb_storage_tag>::make_committed_state_entry(
    const committed_state& state) const {
  auto encoder = detail::encoder_t{};
  return write_entry_t{
      tessera::schema::make_bytes(detail::kCommittedHeightKey),
      encoder.encode(std::tuple{state.height, state.state_root})};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  apply(write_set_t{make_committed_state_entry(state)});
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tessera::schema::bytes_view_t& prefix) const {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    tessera::common::critical("failed to iterate RocksDB prefix");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::apply(
    const write_set_t& writes) const {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(
        tessera::schema::bytes_view_t{key.data(), key.size()});
    if (value.has_value()) {
      auto put_status = batch.Put(
          key_slice, detail::to_slice(tessera::schema::bytes_view_t{
                         value->data(), value->size()}));
      if (!put_status.ok()) {
        tessera::common::critical("failed staging put in write batch");
      }
    } else {
      auto delete_status = batch.Delete(key_slice);
      if (!delete_status.ok()) {
        tessera::common::critical("failed staging delete in write batch");
      }
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}",
                  write_status.ToString());
    tessera::common::critical("failed to commit write batch");
  }
}

}  // namespace tessera::storage
