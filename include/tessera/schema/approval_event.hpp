#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: approval event.
// Registry workflow: Per-asset delegation notification emitted by approve.
namespace tessera::schema {

template <uint16_t Version>
struct approval_event;

template <>
struct approval_event<1> final {
  uint16_t version{1};
  identity_t owner{};
  identity_t approved{};
  token_id_t token_id{};
};

using approval_event_t = approval_event<1>;

}  // namespace tessera::schema
