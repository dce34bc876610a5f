#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: transfer event.
// Registry workflow: Ownership-change notification. Mint reports from = none,
// burn reports to = none.
namespace tessera::schema {

template <uint16_t Version>
struct transfer_event;

template <>
struct transfer_event<1> final {
  uint16_t version{1};
  identity_t from{};
  identity_t to{};
  token_id_t token_id{};
};

using transfer_event_t = transfer_event<1>;

}  // namespace tessera::schema
