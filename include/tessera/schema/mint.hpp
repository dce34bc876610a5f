#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: mint.
// Registry workflow: Issuance: admin-only creation of a new asset for a
// recipient.
namespace tessera::schema {

template <uint16_t Version>
struct mint;

template <>
struct mint<1> final {
  uint16_t version{1};
  identity_t to{};
  token_id_t token_id{};
};

using mint_t = mint<1>;

}  // namespace tessera::schema
