#pragma once

#include <cosign/schema/primitives.hpp>
#include <cosign/schema/session.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Signing-order rules. Every function here is a pure function of the
// session snapshot it is given.
namespace cosign::ordering {

enum class field_gate_t : uint8_t {
  actionable = 0,
  unknown_field = 1,
  not_owner = 2,
  unknown_recipient = 3,
  blocked_by_order = 4
};

/// One field as seen by a given recipient.
struct field_projection_t final {
  cosign::schema::field_id_t field_id;
  cosign::schema::recipient_id_t owner_id;
  bool own{};
  /// Own field held back by signing order, or any foreign field.
  bool locked{};
  bool completed{};
};

/// True when every required field owned by the recipient is completed.
bool requirements_met(const cosign::schema::session_t& session,
                      std::string_view recipient_id);

/// True when the signing order lets the recipient act now.
///
/// Parallel sessions never block. In sequential sessions a signer with order
/// k waits until every signer with a lower order has met its requirements;
/// signers sharing an order share a position. Reviewers and CC recipients
/// neither wait nor hold anyone back.
bool recipient_unblocked(const cosign::schema::session_t& session,
                         std::string_view recipient_id);

/// True when a signer positioned after `recipient_id` in a sequential session
/// has completed a field or finished. From then on the recipient's own fields
/// are frozen. Always false for parallel sessions and non-signers.
bool later_signers_started(const cosign::schema::session_t& session,
                           std::string_view recipient_id);

/// Whether `recipient_id` may act on `field_id` right now.
field_gate_t check_field(const cosign::schema::session_t& session,
                         std::string_view recipient_id,
                         std::string_view field_id);

/// Own fields sorted by page then vertical position, stable on declaration
/// order.
std::vector<cosign::schema::field_id_t> navigation_order(
    const cosign::schema::session_t& session,
    std::string_view recipient_id);

std::optional<cosign::schema::field_id_t> first_incomplete_required(
    const cosign::schema::session_t& session,
    std::string_view recipient_id);

/// Field after `current` in navigation order; the first field when `current`
/// is empty or not one of the recipient's fields.
std::optional<cosign::schema::field_id_t> next_field(
    const cosign::schema::session_t& session,
    std::string_view recipient_id,
    std::optional<std::string_view> current);

std::optional<cosign::schema::field_id_t> previous_field(
    const cosign::schema::session_t& session,
    std::string_view recipient_id,
    std::optional<std::string_view> current);

/// Every field of the session annotated for `recipient_id`, in declaration
/// order.
std::vector<field_projection_t> project(
    const cosign::schema::session_t& session,
    std::string_view recipient_id);

/// Recipients whose fields are actionable now, in declaration order.
std::vector<cosign::schema::recipient_id_t> actionable_recipients(
    const cosign::schema::session_t& session);

}  // namespace cosign::ordering
