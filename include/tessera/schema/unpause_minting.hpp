#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: unpause minting.
// Registry workflow: Admin control: reopens the issuance gate.
namespace tessera::schema {

template <uint16_t Version>
struct unpause_minting;

template <>
struct unpause_minting<1> final {
  uint16_t version{1};
};

using unpause_minting_t = unpause_minting<1>;

}  // namespace tessera::schema
