#pragma once

#include <tessera/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Registry workflow: Defines canonical key prefixes and key codecs for registry
// state, history and the change log.
namespace tessera::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kCollectionKey{"SYS|STATE|COLLECTION|"};
inline constexpr std::string_view kTokenKeyPrefix{"SYS|STATE|TOKEN|"};
inline constexpr std::string_view kRetiredKeyPrefix{"SYS|STATE|RETIRED|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kOperatorKeyPrefix{"SYS|STATE|OPERATOR|"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

tessera::schema::bytes_t make_collection_key();
tessera::schema::bytes_t make_token_key(tessera::schema::token_id_t token_id);
tessera::schema::bytes_t make_retired_key(
    tessera::schema::token_id_t token_id);
tessera::schema::bytes_t make_balance_key(
    const tessera::schema::identity_t& owner);
tessera::schema::bytes_t make_operator_key(
    const tessera::schema::identity_t& owner,
    const tessera::schema::identity_t& operator_id);
tessera::schema::bytes_t make_event_seq_key();

/// Numeric parts are written big-endian, so RocksDB's bytewise order is
/// numeric order and a range scan walks ids and heights in sequence.
tessera::schema::bytes_t make_event_key(uint64_t event_id);
tessera::schema::bytes_t make_history_key(uint64_t height, uint32_t index);
tessera::schema::bytes_t make_history_height_prefix(uint64_t height);

}  // namespace tessera::schema::key
