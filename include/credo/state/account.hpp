#pragma once

#include <credo/schema/primitives.hpp>
#include <credo/state/write_set.hpp>

namespace credo::state {

/// Physical storage owned by one deployed address.
///
/// Slots are 32 byte locations; two accounts computing the same slot still
/// address different physical keys.
class account final {
 public:
  account(write_set& writes, const credo::schema::address_t& address);

  const credo::schema::address_t& address() const;

  /// True once anything has been deployed at this address.
  bool exists() const;
  void mark_deployed();

  /// Stored bytes, or empty bytes when the slot was never written.
  credo::schema::bytes_t load(const credo::schema::hash32_t& slot) const;
  void store(const credo::schema::hash32_t& slot,
             const credo::schema::bytes_view_t& value);

 private:
  write_set& writes_;
  credo::schema::address_t address_;
};

}  // namespace credo::state
