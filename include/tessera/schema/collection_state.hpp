#pragma once
#include <tessera/schema/primitives.hpp>
#include <string>

// Schema type: collection state.
// Registry workflow: Collection singleton: immutable metadata plus the live
// supply counter, the admin and the mint gate.
namespace tessera::schema {

template <uint16_t Version>
struct collection_state;

template <>
struct collection_state<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  std::string base_uri;
  supply_t max_supply{};
  supply_t total_supply{};
  identity_t admin{};
  bool mint_paused{};
};

using collection_state_t = collection_state<1>;

}  // namespace tessera::schema
