#include <algorithm>
#include <cosign/ordering/coordinator.hpp>
#include <iterator>
#include <ranges>

namespace cosign::ordering {

namespace {

const cosign::schema::recipient_t* find_recipient(
    const cosign::schema::session_t& session,
    std::string_view recipient_id) {
  auto it = std::ranges::find(session.recipients, recipient_id,
                              &cosign::schema::recipient_t::id);
  return it == std::end(session.recipients) ? nullptr : &*it;
}

const cosign::schema::field_t* find_field(
    const cosign::schema::session_t& session,
    std::string_view field_id) {
  auto it = std::ranges::find(session.fields, field_id,
                              &cosign::schema::field_t::id);
  return it == std::end(session.fields) ? nullptr : &*it;
}

std::optional<std::size_t> position_of(
    const std::vector<cosign::schema::field_id_t>& order,
    std::optional<std::string_view> current) {
  if (!current.has_value()) {
    return std::nullopt;
  }
  auto it = std::ranges::find(order, *current);
  if (it == std::end(order)) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(std::begin(order), it));
}

}  // namespace

bool requirements_met(const cosign::schema::session_t& session,
                      std::string_view recipient_id) {
  return std::ranges::all_of(session.fields, [&](const auto& field) {
    return field.recipient_id != recipient_id || !field.required ||
           field.completed;
  });
}

bool recipient_unblocked(const cosign::schema::session_t& session,
                         std::string_view recipient_id) {
  const auto* recipient = find_recipient(session, recipient_id);
  if (recipient == nullptr) {
    return false;
  }
  if (session.signing_mode == cosign::schema::signing_mode_t::parallel ||
      recipient->role != cosign::schema::recipient_role_t::signer) {
    return true;
  }
  return std::ranges::all_of(session.recipients, [&](const auto& other) {
    return other.role != cosign::schema::recipient_role_t::signer ||
           other.order >= recipient->order ||
           requirements_met(session, other.id);
  });
}

bool later_signers_started(const cosign::schema::session_t& session,
                           std::string_view recipient_id) {
  const auto* recipient = find_recipient(session, recipient_id);
  if (recipient == nullptr ||
      session.signing_mode == cosign::schema::signing_mode_t::parallel ||
      recipient->role != cosign::schema::recipient_role_t::signer) {
    return false;
  }
  return std::ranges::any_of(session.recipients, [&](const auto& other) {
    if (other.role != cosign::schema::recipient_role_t::signer ||
        other.order <= recipient->order) {
      return false;
    }
    return other.finished_at.has_value() ||
           std::ranges::any_of(session.fields, [&](const auto& field) {
             return field.recipient_id == other.id && field.completed;
           });
  });
}

field_gate_t check_field(const cosign::schema::session_t& session,
                         std::string_view recipient_id,
                         std::string_view field_id) {
  if (find_recipient(session, recipient_id) == nullptr) {
    return field_gate_t::unknown_recipient;
  }
  const auto* field = find_field(session, field_id);
  if (field == nullptr) {
    return field_gate_t::unknown_field;
  }
  if (field->recipient_id != recipient_id) {
    return field_gate_t::not_owner;
  }
  if (!recipient_unblocked(session, recipient_id)) {
    return field_gate_t::blocked_by_order;
  }
  return field_gate_t::actionable;
}

std::vector<cosign::schema::field_id_t> navigation_order(
    const cosign::schema::session_t& session,
    std::string_view recipient_id) {
  auto own = std::vector<const cosign::schema::field_t*>{};
  for (const auto& field : session.fields) {
    if (field.recipient_id == recipient_id) {
      own.push_back(&field);
    }
  }
  std::ranges::stable_sort(own, [](const auto* lhs, const auto* rhs) {
    if (lhs->page != rhs->page) {
      return lhs->page < rhs->page;
    }
    return lhs->rect.y < rhs->rect.y;
  });

  auto order = std::vector<cosign::schema::field_id_t>{};
  order.reserve(own.size());
  std::ranges::transform(own, std::back_inserter(order),
                         [](const auto* field) { return field->id; });
  return order;
}

std::optional<cosign::schema::field_id_t> first_incomplete_required(
    const cosign::schema::session_t& session,
    std::string_view recipient_id) {
  for (const auto& id : navigation_order(session, recipient_id)) {
    const auto* field = find_field(session, id);
    if (field->required && !field->completed) {
      return id;
    }
  }
  return std::nullopt;
}

std::optional<cosign::schema::field_id_t> next_field(
    const cosign::schema::session_t& session,
    std::string_view recipient_id,
    std::optional<std::string_view> current) {
  auto order = navigation_order(session, recipient_id);
  if (order.empty()) {
    return std::nullopt;
  }
  auto position = position_of(order, current);
  if (!position.has_value()) {
    return order.front();
  }
  if (*position + 1 >= order.size()) {
    return std::nullopt;
  }
  return order[*position + 1];
}

std::optional<cosign::schema::field_id_t> previous_field(
    const cosign::schema::session_t& session,
    std::string_view recipient_id,
    std::optional<std::string_view> current) {
  auto order = navigation_order(session, recipient_id);
  if (order.empty()) {
    return std::nullopt;
  }
  auto position = position_of(order, current);
  if (!position.has_value()) {
    return order.back();
  }
  if (*position == 0) {
    return std::nullopt;
  }
  return order[*position - 1];
}

std::vector<field_projection_t> project(
    const cosign::schema::session_t& session,
    std::string_view recipient_id) {
  auto unblocked = recipient_unblocked(session, recipient_id);
  auto projection = std::vector<field_projection_t>{};
  projection.reserve(session.fields.size());
  for (const auto& field : session.fields) {
    auto own = field.recipient_id == recipient_id;
    projection.push_back(field_projection_t{.field_id = field.id,
                                            .owner_id = field.recipient_id,
                                            .own = own,
                                            .locked = !own || !unblocked,
                                            .completed = field.completed});
  }
  return projection;
}

std::vector<cosign::schema::recipient_id_t> actionable_recipients(
    const cosign::schema::session_t& session) {
  auto out = std::vector<cosign::schema::recipient_id_t>{};
  for (const auto& recipient : session.recipients) {
    if (recipient_unblocked(session, recipient.id)) {
      out.push_back(recipient.id);
    }
  }
  return out;
}

}  // namespace cosign::ordering
