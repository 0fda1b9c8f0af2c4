#pragma once

#include <credo/schema/primitives.hpp>
#include <optional>

namespace credo::registry {

/// Capability the authorization gate consumes from an external ownership
/// registry.
///
/// Implementations live outside credo. A lookup that throws is treated by
/// the gate exactly like an unknown subject.
class subject_registry {
 public:
  subject_registry() = default;
  subject_registry(const subject_registry&) = delete;
  subject_registry(subject_registry&&) = delete;
  virtual ~subject_registry() = default;

  subject_registry& operator=(const subject_registry&) = delete;
  subject_registry& operator=(subject_registry&&) = delete;

  /// Current owner of the subject, std::nullopt when the subject is unknown.
  virtual std::optional<credo::schema::address_t> owner_of(
      credo::schema::subject_id_t subject_id) const = 0;

  /// Standing, reusable grant from `owner` to `actor` over all its subjects.
  virtual bool is_operator(const credo::schema::address_t& owner,
                           const credo::schema::address_t& actor) const = 0;

  /// One-time approval of `actor` for exactly `subject_id`; non-zero means
  /// approved. The gate reads it first and only calls consume_allowance
  /// when it is non-zero.
  virtual credo::schema::allowance_t allowance(
      const credo::schema::address_t& owner,
      const credo::schema::address_t& actor,
      credo::schema::subject_id_t subject_id) const = 0;

  /// Test for a live one-time approval and set it back to zero in the same
  /// step. Returns whether an approval was live.
  virtual bool consume_allowance(const credo::schema::address_t& owner,
                                 const credo::schema::address_t& actor,
                                 credo::schema::subject_id_t subject_id) = 0;
};

}  // namespace credo::registry
