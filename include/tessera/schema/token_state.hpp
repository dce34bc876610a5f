#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: token state.
// Registry workflow: Per-asset row: present only while the asset exists.
namespace tessera::schema {

template <uint16_t Version>
struct token_state;

template <>
struct token_state<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  identity_t owner{};
  identity_t approved{};  // kNoneIdentity when no spender is approved
};

using token_state_t = token_state<1>;

}  // namespace tessera::schema
