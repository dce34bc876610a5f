#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: registry error code.
// Registry workflow: Rejection taxonomy: one stable numeric code per way an
// operation can be refused. Zero is success.
namespace tessera::schema {

enum class registry_error_code : uint32_t {
  ok = 0,
  unauthorized = 1,
  mint_paused = 2,
  invalid_recipient = 3,
  id_out_of_range = 4,
  already_exists = 5,
  supply_exhausted = 6,
  nonexistent_asset = 7,
  owner_mismatch = 8,
  self_operator = 9,
  collection_missing = 20,
  collection_exists = 21,
  invalid_configuration = 22,
  invalid_transaction = 30,
  unsupported_transaction_version = 31,
};

inline constexpr auto kRegistryErrorCodeMappings = std::array{
    std::pair<std::string_view, registry_error_code>{"ok",
                                                     registry_error_code::ok},
    std::pair<std::string_view, registry_error_code>{
        "unauthorized", registry_error_code::unauthorized},
    std::pair<std::string_view, registry_error_code>{
        "mint_paused", registry_error_code::mint_paused},
    std::pair<std::string_view, registry_error_code>{
        "invalid_recipient", registry_error_code::invalid_recipient},
    std::pair<std::string_view, registry_error_code>{
        "id_out_of_range", registry_error_code::id_out_of_range},
    std::pair<std::string_view, registry_error_code>{
        "already_exists", registry_error_code::already_exists},
    std::pair<std::string_view, registry_error_code>{
        "supply_exhausted", registry_error_code::supply_exhausted},
    std::pair<std::string_view, registry_error_code>{
        "nonexistent_asset", registry_error_code::nonexistent_asset},
    std::pair<std::string_view, registry_error_code>{
        "owner_mismatch", registry_error_code::owner_mismatch},
    std::pair<std::string_view, registry_error_code>{
        "self_operator", registry_error_code::self_operator},
    std::pair<std::string_view, registry_error_code>{
        "collection_missing", registry_error_code::collection_missing},
    std::pair<std::string_view, registry_error_code>{
        "collection_exists", registry_error_code::collection_exists},
    std::pair<std::string_view, registry_error_code>{
        "invalid_configuration", registry_error_code::invalid_configuration},
    std::pair<std::string_view, registry_error_code>{
        "invalid_transaction", registry_error_code::invalid_transaction},
    std::pair<std::string_view, registry_error_code>{
        "unsupported_transaction_version",
        registry_error_code::unsupported_transaction_version},
};

template <>
inline std::optional<registry_error_code> try_from_string<registry_error_code>(
    const std::string_view value) {
  return from_string(value, kRegistryErrorCodeMappings);
}

inline constexpr std::string_view to_string(const registry_error_code value) {
  return to_string(value, kRegistryErrorCodeMappings).value_or("unknown");
}

/// User-visible rejection text. Clients match on these strings, keep them
/// stable.
std::string_view error_message(registry_error_code code);

constexpr uint32_t to_code(const registry_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace tessera::schema
