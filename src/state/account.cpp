#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/key/account_keys.hpp>
#include <credo/state/account.hpp>

namespace credo::state {

namespace {

using encoder_t = credo::schema::encoding::scale_encoder_t;

}  // namespace

account::account(write_set& writes, const credo::schema::address_t& address)
    : writes_{writes}, address_{address} {}

const credo::schema::address_t& account::address() const {
  return address_;
}

bool account::exists() const {
  auto encoder = encoder_t{};
  return writes_.contains(
      credo::schema::key::make_account_marker_key(encoder, address_));
}

void account::mark_deployed() {
  auto encoder = encoder_t{};
  writes_.put(credo::schema::key::make_account_marker_key(encoder, address_),
              credo::schema::bytes_t{1});
}

credo::schema::bytes_t account::load(
    const credo::schema::hash32_t& slot) const {
  auto encoder = encoder_t{};
  auto value = writes_.get(
      credo::schema::key::make_account_slot_key(encoder, address_, slot));
  if (!value.has_value()) {
    return {};
  }
  return *value;
}

void account::store(const credo::schema::hash32_t& slot,
                    const credo::schema::bytes_view_t& value) {
  auto encoder = encoder_t{};
  writes_.put(
      credo::schema::key::make_account_slot_key(encoder, address_, slot),
      credo::schema::make_bytes(value));
}

}  // namespace credo::state
