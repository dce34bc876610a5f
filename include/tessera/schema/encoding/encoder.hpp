#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tessera::schema::encoding {

// The wire codec is a build-time choice: code names the library through a tag
// (encoder<scale_encoder_tag>) and never the library API directly.
template <typename Library>
struct encoder {
  template <typename T>
  tessera::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tessera::schema::bytes_t& out);

  template <typename T>
  T decode(const tessera::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tessera::schema::bytes_view_t& bytes);
};

}  // namespace tessera::schema::encoding
