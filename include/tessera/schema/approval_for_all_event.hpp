#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: approval for all event.
// Registry workflow: Blanket delegation notification, emitted on every
// set_approval_for_all even when the flag does not change.
namespace tessera::schema {

template <uint16_t Version>
struct approval_for_all_event;

template <>
struct approval_for_all_event<1> final {
  uint16_t version{1};
  identity_t owner{};
  identity_t operator_id{};
  bool approved{};
};

using approval_for_all_event_t = approval_for_all_event<1>;

}  // namespace tessera::schema
