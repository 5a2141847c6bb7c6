#pragma once

#include <cosign/schema/operation_result.hpp>
#include <cosign/schema/session.hpp>
#include <cosign/schema/session_credentials.hpp>

namespace cosign::session {

inline constexpr auto kMinimumIdLength = std::size_t{3};

/// Shape checks on a signing link before anything is looked up.
cosign::schema::operation_result_t validate_credentials(
    const cosign::schema::session_credentials_t& credentials);

/// Structural checks on a session about to be created.
///
/// Rejects sessions without recipients, duplicate recipient or field ids,
/// fields owned by unknown recipients, geometry outside the page, and, in
/// sequential mode, two signers sharing an order.
cosign::schema::operation_result_t validate_session(
    const cosign::schema::session_t& session);

}  // namespace cosign::session
