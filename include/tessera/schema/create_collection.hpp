#pragma once
#include <tessera/schema/primitives.hpp>
#include <string>

// Schema type: create collection.
// Registry workflow: Deployment: fixes the descriptive metadata and the supply
// ceiling. The submitting caller becomes the collection admin.
namespace tessera::schema {

template <uint16_t Version>
struct create_collection;

template <>
struct create_collection<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  std::string base_uri;
  supply_t max_supply{};  // must be positive
};

using create_collection_t = create_collection<1>;

}  // namespace tessera::schema
