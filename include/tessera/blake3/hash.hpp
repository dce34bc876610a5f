#pragma once
#include <tessera/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace tessera::blake3 {

tessera::schema::hash32_t hash(const std::string_view& str);
tessera::schema::hash32_t hash(const tessera::schema::bytes_view_t& bytes);

}  // namespace tessera::blake3
