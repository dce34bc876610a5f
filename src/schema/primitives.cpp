#include <tessera/common/critical.hpp>
#include <tessera/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace tessera::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint8_t> nibble_value(const char c) {
  auto position = kHexDigits.find(static_cast<char>(
      (c >= 'A' && c <= 'F') ? c - 'A' + 'a' : c));
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

hash32_t make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != hash32_t{}.size()) {
    tessera::common::critical("identity must be 64 hex characters");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  auto out = bytes_t{};
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = nibble_value(hex[i]);
    auto low = nibble_value(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return out;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (size_t i = 0; i < bytes.size(); i += 3) {
    auto remaining = std::min<size_t>(3, bytes.size() - i);
    auto group = uint32_t{bytes[i]} << 16u;
    if (remaining > 1) {
      group |= uint32_t{bytes[i + 1]} << 8u;
    }
    if (remaining > 2) {
      group |= uint32_t{bytes[i + 2]};
    }
    out.push_back(kBase64Alphabet[(group >> 18u) & 0x3Fu]);
    out.push_back(kBase64Alphabet[(group >> 12u) & 0x3Fu]);
    out.push_back(remaining > 1 ? kBase64Alphabet[(group >> 6u) & 0x3Fu]
                                : '=');
    out.push_back(remaining > 2 ? kBase64Alphabet[group & 0x3Fu] : '=');
  }
  return out;
}

std::string to_decimal(uint64_t value) {
  auto digits = std::string{};
  do {
    digits.push_back(static_cast<char>('0' + (value % 10)));
    value /= 10;
  } while (value != 0);
  std::reverse(std::begin(digits), std::end(digits));
  return digits;
}

}  // namespace tessera::schema
