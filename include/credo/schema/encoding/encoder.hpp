#pragma once
#include <credo/schema/primitives.hpp>
#include <optional>
#include <span>

namespace credo::schema::encoding {

// Library selection is a build time setting: code that needs bytes names an
// encoder<Tag> and the tag picks the wire format. Hot swapping is not a
// design goal.
template <typename Library>
struct encoder {
  template <typename T>
  credo::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, credo::schema::bytes_t& out);

  template <typename T>
  T decode(const credo::schema::bytes_view_t& bytes);
};

}  // namespace credo::schema::encoding
