#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using identity_t = hash32_t;  // opaque participant reference
using token_id_t = uint64_t;
using supply_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// Parse a 64 character hex identity (optional 0x prefix); critical on
/// malformed input.
hash32_t make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Standard alphabet with '=' padding.
std::string to_base64(const bytes_view_t& bytes);

/// Minimal base-10 rendering, most significant digit first; 0 renders "0".
std::string to_decimal(uint64_t value);

/// The absent identity ("none") is the all-zero reference.
inline constexpr identity_t kNoneIdentity{};

constexpr bool is_none(const identity_t& identity) {
  return identity == kNoneIdentity;
}

}  // namespace tessera::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
