#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: set approval for all.
// Registry workflow: Blanket delegation: grants or revokes authority over all
// of the caller's assets.
namespace tessera::schema {

template <uint16_t Version>
struct set_approval_for_all;

template <>
struct set_approval_for_all<1> final {
  uint16_t version{1};
  identity_t operator_id{};
  bool approved{};
};

using set_approval_for_all_t = set_approval_for_all<1>;

}  // namespace tessera::schema
