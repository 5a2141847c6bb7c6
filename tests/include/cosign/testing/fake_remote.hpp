#pragma once

#include <cosign/schema/session.hpp>
#include <cosign/schema/session_credentials.hpp>
#include <cosign/schema/signed_submission.hpp>
#include <cosign/sync/remote_authority.hpp>

#include <deque>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cosign::testing {

/// Scripted remote authority. Mutations answer from `script` in order and
/// fall back to ok once it is empty; `offline` turns every call into a
/// network error.
class fake_remote final : public cosign::sync::remote_authority {
 public:
  struct call_t final {
    std::string kind;
    cosign::schema::session_id_t session_id;
    cosign::schema::recipient_id_t recipient_id;
    std::optional<cosign::schema::signed_submission_t> submission;
  };

  void serve(const cosign::schema::session_t& session) {
    auto lock = std::scoped_lock{mutex_};
    sessions_[session.id] = session;
  }

  void set_fetch_status(cosign::sync::remote_status_t status) {
    auto lock = std::scoped_lock{mutex_};
    fetch_status_ = status;
  }

  void set_offline(bool offline) {
    auto lock = std::scoped_lock{mutex_};
    offline_ = offline;
  }

  /// The next mutation throws from future::get().
  void throw_next() {
    auto lock = std::scoped_lock{mutex_};
    throw_next_ = true;
  }

  /// Runs once, inside the next mutation, before it answers.
  void on_next_mutation(std::function<void()> hook) {
    auto lock = std::scoped_lock{mutex_};
    hook_ = std::move(hook);
  }

  void push(cosign::sync::remote_response_t response) {
    auto lock = std::scoped_lock{mutex_};
    script_.push_back(std::move(response));
  }

  std::vector<call_t> calls() const {
    auto lock = std::scoped_lock{mutex_};
    return calls_;
  }

  std::size_t count(std::string_view kind) const {
    auto lock = std::scoped_lock{mutex_};
    auto n = std::size_t{};
    for (const auto& call : calls_) {
      n += call.kind == kind ? 1 : 0;
    }
    return n;
  }

  std::future<cosign::sync::fetch_response_t> fetch_session(
      const cosign::schema::session_credentials_t& credentials) override {
    auto lock = std::scoped_lock{mutex_};
    calls_.push_back(call_t{.kind = "fetch",
                            .session_id = credentials.session_id,
                            .recipient_id = credentials.recipient_id,
                            .submission = std::nullopt});
    auto response = cosign::sync::fetch_response_t{};
    if (offline_) {
      response.status = cosign::sync::remote_status_t::network_error;
      response.error = "connection refused";
    } else if (fetch_status_.has_value()) {
      response.status = *fetch_status_;
      if (auto it = sessions_.find(credentials.session_id);
          it != std::end(sessions_) &&
          response.status == cosign::sync::remote_status_t::expired) {
        response.session = it->second;
      }
    } else if (auto it = sessions_.find(credentials.session_id);
               it != std::end(sessions_)) {
      response.session = it->second;
    } else {
      response.status = cosign::sync::remote_status_t::not_found;
    }
    return ready(std::move(response));
  }

  std::future<cosign::sync::remote_response_t> submit_signed(
      const cosign::schema::session_id_t& session_id,
      const cosign::schema::recipient_id_t& recipient_id,
      const cosign::schema::signed_submission_t& submission) override {
    return mutate("signed", session_id, recipient_id, submission);
  }

  std::future<cosign::sync::remote_response_t> record_consent(
      const cosign::schema::session_id_t& session_id,
      const cosign::sync::consent_request_t& request) override {
    return mutate("consent", session_id, request.recipient_id, std::nullopt);
  }

  std::future<cosign::sync::remote_response_t> decline(
      const cosign::schema::session_id_t& session_id,
      const cosign::sync::decline_request_t& request) override {
    return mutate("decline", session_id, request.recipient_id, std::nullopt);
  }

  std::future<cosign::sync::remote_response_t> request_link(
      const cosign::schema::session_id_t& session_id,
      const cosign::schema::recipient_id_t& recipient_id) override {
    return mutate("request_link", session_id, recipient_id, std::nullopt);
  }

 private:
  template <typename T>
  static std::future<T> ready(T value) {
    auto promise = std::promise<T>{};
    promise.set_value(std::move(value));
    return promise.get_future();
  }

  std::future<cosign::sync::remote_response_t> mutate(
      std::string kind,
      const cosign::schema::session_id_t& session_id,
      const cosign::schema::recipient_id_t& recipient_id,
      std::optional<cosign::schema::signed_submission_t> submission) {
    auto hook = std::function<void()>{};
    {
      auto lock = std::scoped_lock{mutex_};
      std::swap(hook, hook_);
    }
    if (hook) {
      hook();
    }
    auto lock = std::scoped_lock{mutex_};
    calls_.push_back(call_t{.kind = std::move(kind),
                            .session_id = session_id,
                            .recipient_id = recipient_id,
                            .submission = std::move(submission)});
    if (throw_next_) {
      throw_next_ = false;
      auto promise = std::promise<cosign::sync::remote_response_t>{};
      promise.set_exception(
          std::make_exception_ptr(std::runtime_error{"socket closed"}));
      return promise.get_future();
    }
    auto response = cosign::sync::remote_response_t{};
    if (offline_) {
      response.status = cosign::sync::remote_status_t::network_error;
      response.error = "connection refused";
    } else if (!script_.empty()) {
      response = std::move(script_.front());
      script_.pop_front();
    }
    return ready(std::move(response));
  }

  mutable std::mutex mutex_;
  std::map<cosign::schema::session_id_t, cosign::schema::session_t> sessions_;
  std::optional<cosign::sync::remote_status_t> fetch_status_;
  std::deque<cosign::sync::remote_response_t> script_;
  std::function<void()> hook_;
  std::vector<call_t> calls_;
  bool offline_{};
  bool throw_next_{};
};

}  // namespace cosign::testing
