#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: pause minting.
// Registry workflow: Admin control: closes the issuance gate.
namespace tessera::schema {

template <uint16_t Version>
struct pause_minting;

template <>
struct pause_minting<1> final {
  uint16_t version{1};
};

using pause_minting_t = pause_minting<1>;

}  // namespace tessera::schema
