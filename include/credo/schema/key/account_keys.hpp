#pragma once

#include <credo/schema/primitives.hpp>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: account keys.
// Canonical physical key layout. Every deployed address owns the keys that
// carry it; logical regions inside an address are told apart by slot.
namespace credo::schema::key {

inline constexpr std::string_view kAccountMarkerPrefix{"SYS|ACCOUNT|MARKER|"};
inline constexpr std::string_view kAccountSlotPrefix{"SYS|ACCOUNT|SLOT|"};

template <typename Encoder, typename T>
credo::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(std::string{prefix});
  encoder.encode(id, key);
  return key;
}

/// Key whose presence means something has been deployed at `address`.
template <typename Encoder>
credo::schema::bytes_t make_account_marker_key(
    Encoder& encoder,
    const credo::schema::address_t& address) {
  return make_prefixed_key(encoder, kAccountMarkerPrefix, address);
}

template <typename Encoder>
credo::schema::bytes_t make_account_slot_key(
    Encoder& encoder,
    const credo::schema::address_t& address,
    const credo::schema::hash32_t& slot) {
  return make_prefixed_key(encoder, kAccountSlotPrefix,
                           std::tuple{address, slot});
}

/// Prefix shared by every slot of one address.
template <typename Encoder>
credo::schema::bytes_t make_account_slots_prefix(
    Encoder& encoder,
    const credo::schema::address_t& address) {
  return make_prefixed_key(encoder, kAccountSlotPrefix, address);
}

}  // namespace credo::schema::key
