#pragma once
#include <tessera/schema/approval_event.hpp>
#include <tessera/schema/approval_for_all_event.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transfer_event.hpp>
#include <cstdint>
#include <string_view>
#include <variant>

// Schema type: registry event.
// Registry workflow: Change-log item: one typed notification per committed
// state change, consumed by downstream indexers.
namespace tessera::schema {

using registry_event_t =
    std::variant<transfer_event_t, approval_event_t, approval_for_all_event_t>;

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  registry_event_t event{};
};

using event_record_t = event_record<1>;

inline constexpr std::string_view event_type(const registry_event_t& event) {
  switch (event.index()) {
    case 0:
      return "transfer";
    case 1:
      return "approval";
    default:
      return "approval_for_all";
  }
}

}  // namespace tessera::schema
