#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tessera::storage {

using key_value_entry_t =
    std::pair<tessera::schema::bytes_t, tessera::schema::bytes_t>;

/// A staged mutation: a value to store, or std::nullopt to delete the key.
using write_entry_t = std::pair<tessera::schema::bytes_t,
                                std::optional<tessera::schema::bytes_t>>;
using write_set_t = std::vector<write_entry_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  tessera::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const tessera::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tessera::schema::bytes_view_t& key,
           const T& value);

  /// Return the undecoded bytes stored at key.
  std::optional<tessera::schema::bytes_t> get_raw(
      const tessera::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Encoded key/value row holding a committed checkpoint, for inclusion in a
  /// write set that must land together with the state it describes.
  write_entry_t make_committed_state_entry(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const tessera::schema::bytes_view_t& prefix) const;

  /// Atomically apply every put and delete in the write set.
  void apply(const write_set_t& writes) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tessera::storage
