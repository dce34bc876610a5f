#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: burn.
// Registry workflow: Retirement: owner-only destruction of an asset; the id is
// never reissued.
namespace tessera::schema {

template <uint16_t Version>
struct burn;

template <>
struct burn<1> final {
  uint16_t version{1};
  token_id_t token_id{};
};

using burn_t = burn<1>;

}  // namespace tessera::schema
