#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: approve.
// Registry workflow: Per-asset delegation: names the single identity that may
// move one asset.
namespace tessera::schema {

template <uint16_t Version>
struct approve;

template <>
struct approve<1> final {
  uint16_t version{1};
  identity_t spender{};  // kNoneIdentity revokes
  token_id_t token_id{};
};

using approve_t = approve<1>;

}  // namespace tessera::schema
