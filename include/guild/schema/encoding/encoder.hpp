#pragma once
#include <guild/schema/primitives.hpp>
#include <optional>
#include <span>

namespace guild::schema::encoding {

// Encoding is a build time choice: the library tag selects the codec and
// callers stay unaware of it. Hot swapping is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  guild::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, guild::schema::bytes_t& out);

  template <typename T>
  T decode(const guild::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const guild::schema::bytes_view_t& bytes);
};

}  // namespace guild::schema::encoding
