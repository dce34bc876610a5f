#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: transfer from.
// Registry workflow: Ownership change: moves an asset from its asserted owner
// to a recipient.
namespace tessera::schema {

template <uint16_t Version>
struct transfer_from;

template <>
struct transfer_from<1> final {
  uint16_t version{1};
  identity_t from{};
  identity_t to{};
  token_id_t token_id{};
};

using transfer_from_t = transfer_from<1>;

}  // namespace tessera::schema
