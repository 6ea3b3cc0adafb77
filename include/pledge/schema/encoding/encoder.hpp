#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <span>

namespace pledge::schema::encoding {

// Codec selection is a build time choice. Callers name the library tag once,
// e.g. `encoder<scale_encoder_tag>{}`, and everything above this layer stays
// codec agnostic.
template <typename Library>
struct encoder {
  template <typename T>
  pledge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, pledge::schema::bytes_t& out);

  template <typename T>
  T decode(const pledge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const pledge::schema::bytes_view_t& bytes);
};

}  // namespace pledge::schema::encoding
