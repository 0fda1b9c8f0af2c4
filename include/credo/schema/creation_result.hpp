#pragma once

#include <credo/schema/error_code.hpp>
#include <credo/schema/event.hpp>
#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: creation result.
// Outcome of deploying a template, an instance, a factory, or a factory
// clone. `address` is only meaningful when `code` is ok.
namespace credo::schema {

template <uint16_t Version>
struct creation_result;

template <>
struct creation_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string log;
  address_t address{};
  std::vector<event_t> events;

  bool ok() const { return code == error_code::ok; }
};

using creation_result_t = creation_result<1>;

}  // namespace credo::schema
