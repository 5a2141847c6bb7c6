#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cosign/common/time_source.hpp>
#include <cosign/config/options.hpp>
#include <cosign/ordering/coordinator.hpp>
#include <cosign/session/audit_chain.hpp>
#include <cosign/sync/engine.hpp>
#include <cosign/timestamp/client.hpp>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <variant>

namespace {

// The CLI only inspects local state; it never reaches the authority.
class detached_authority final : public cosign::sync::remote_authority {
 public:
  std::future<cosign::sync::fetch_response_t> fetch_session(
      const cosign::schema::session_credentials_t&) override {
    auto response = cosign::sync::fetch_response_t{};
    response.status = cosign::sync::remote_status_t::network_error;
    response.error = "no remote authority configured";
    return ready(std::move(response));
  }
  std::future<cosign::sync::remote_response_t> submit_signed(
      const cosign::schema::session_id_t&,
      const cosign::schema::recipient_id_t&,
      const cosign::schema::signed_submission_t&) override {
    return unavailable();
  }
  std::future<cosign::sync::remote_response_t> record_consent(
      const cosign::schema::session_id_t&,
      const cosign::sync::consent_request_t&) override {
    return unavailable();
  }
  std::future<cosign::sync::remote_response_t> decline(
      const cosign::schema::session_id_t&,
      const cosign::sync::decline_request_t&) override {
    return unavailable();
  }
  std::future<cosign::sync::remote_response_t> request_link(
      const cosign::schema::session_id_t&,
      const cosign::schema::recipient_id_t&) override {
    return unavailable();
  }

 private:
  template <typename T>
  static std::future<T> ready(T value) {
    auto promise = std::promise<T>{};
    promise.set_value(std::move(value));
    return promise.get_future();
  }
  static std::future<cosign::sync::remote_response_t> unavailable() {
    auto response = cosign::sync::remote_response_t{};
    response.status = cosign::sync::remote_status_t::network_error;
    response.error = "no remote authority configured";
    return ready(std::move(response));
  }
};

std::optional<cosign::schema::bytes_t> read_file(const std::string& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    spdlog::error("Cannot open {}", path);
    return std::nullopt;
  }
  return cosign::schema::bytes_t{std::istreambuf_iterator<char>{in},
                                 std::istreambuf_iterator<char>{}};
}

bool write_file(const std::string& path, const cosign::schema::bytes_t& bytes) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    spdlog::error("Cannot write {}", path);
    return false;
  }
  return true;
}

int tsa_request(const cosign::config::options_t& options) {
  if (options.arguments.size() != 2) {
    std::cerr << "usage: cosign tsa-request <document> <request.der>"
              << std::endl;
    return 2;
  }
  auto document = read_file(options.arguments[0]);
  if (!document) {
    return 1;
  }
  auto request = cosign::timestamp::build_request(
      cosign::schema::make_bytes_view(*document),
      cosign::timestamp::make_nonce());
  if (!write_file(options.arguments[1], request.encoded)) {
    return 1;
  }
  std::cout << "imprint " << cosign::schema::to_hex(request.message_imprint)
            << "\nnonce " << request.nonce << std::endl;
  return 0;
}

int tsa_inspect(const cosign::config::options_t& options) {
  if (options.arguments.empty() || options.arguments.size() == 2 ||
      options.arguments.size() > 4) {
    std::cerr << "usage: cosign tsa-inspect <response.der> "
                 "[<document> <nonce> [<request-time-ms>]]"
              << std::endl;
    return 2;
  }
  auto response = read_file(options.arguments[0]);
  if (!response) {
    return 1;
  }
  auto parsed = cosign::timestamp::parse_response(
      cosign::schema::make_bytes_view(*response));
  if (const auto* error = std::get_if<cosign::timestamp::parse_error_t>(&parsed)) {
    std::cout << "malformed: " << error->reason << std::endl;
    return 1;
  }
  if (const auto* rejection =
          std::get_if<cosign::timestamp::timestamp_rejection_t>(&parsed)) {
    std::cout << "status " << to_string(rejection->status) << "\ntext "
              << rejection->status_text << "\nfailure_info "
              << rejection->failure_info << std::endl;
    return 1;
  }

  const auto& token = std::get<cosign::timestamp::timestamp_token_t>(parsed);
  std::cout << "status " << to_string(token.status) << "\ngen_time "
            << token.gen_time << "\npolicy " << token.policy_oid << "\nserial "
            << token.serial_hex << "\nimprint "
            << cosign::schema::to_hex(
                   cosign::schema::make_bytes_view(token.message_imprint))
            << std::endl;
  if (options.arguments.size() == 1) {
    return 0;
  }

  auto document = read_file(options.arguments[1]);
  if (!document) {
    return 1;
  }
  auto nonce = uint64_t{};
  auto request_time = cosign::common::system_time_milliseconds();
  try {
    nonce = std::stoull(options.arguments[2]);
    if (options.arguments.size() == 4) {
      request_time = std::stoull(options.arguments[3]);
    }
  } catch (const std::exception& e) {
    std::cerr << "invalid number: " << e.what() << std::endl;
    return 2;
  }
  auto request = cosign::timestamp::build_request(
      cosign::schema::make_bytes_view(*document), nonce);
  auto check = cosign::timestamp::validate_token(token, request, request_time,
                                                 options.timestamp_policy);
  if (check.check != cosign::timestamp::token_check_t::ok) {
    std::cout << "invalid: " << check.reason << std::endl;
    return 1;
  }
  std::cout << "valid" << std::endl;
  return 0;
}

int show_queue(cosign::sync::engine& engine) {
  for (const auto& record : engine.pending()) {
    std::cout << record.session_id << " " << record.recipient_id
              << " generation=" << record.generation
              << " attempts=" << record.attempt_count
              << " next=" << record.next_attempt_at;
    if (record.last_error) {
      std::cout << " error=\"" << *record.last_error << "\"";
    }
    std::cout << std::endl;
  }
  auto status = engine.status();
  std::cout << "pending " << status.pending_count << ", offline "
            << (status.offline_mode ? "yes" : "no") << std::endl;
  return 0;
}

int show_audit(const cosign::config::options_t& options,
               cosign::sync::encoder_t& encoder,
               cosign::sync::engine& engine) {
  if (options.arguments.size() != 1) {
    std::cerr << "usage: cosign audit <session-id>" << std::endl;
    return 2;
  }
  auto events = engine.audit_trail(options.arguments[0]);
  for (const auto& event : events) {
    std::cout << event.sequence << " " << event.recorded_at << " "
              << to_string(event.action) << " " << event.recipient_id << " "
              << event.details << std::endl;
  }
  if (auto broken = cosign::session::verify_chain(encoder, events)) {
    std::cout << "chain broken at " << *broken << std::endl;
    return 1;
  }
  std::cout << "chain intact (" << events.size() << " events)" << std::endl;
  return 0;
}

int show_fields(const cosign::config::options_t& options,
                cosign::sync::engine& engine) {
  if (options.arguments.size() != 2) {
    std::cerr << "usage: cosign fields <session-id> <recipient-id>"
              << std::endl;
    return 2;
  }
  const auto& recipient_id = options.arguments[1];
  auto cached = engine.load_session(options.arguments[0], recipient_id);
  if (!cached) {
    std::cerr << "session not cached" << std::endl;
    return 1;
  }
  const auto& session = cached->session;
  auto projection = cosign::ordering::project(session, recipient_id);
  for (const auto& field_id :
       cosign::ordering::navigation_order(session, recipient_id)) {
    auto entry = std::ranges::find(projection, field_id,
                                   &cosign::ordering::field_projection_t::field_id);
    std::cout << field_id << (entry->completed ? " done" : "")
              << (entry->locked ? " locked" : "") << std::endl;
  }
  if (auto missing =
          cosign::ordering::first_incomplete_required(session, recipient_id)) {
    std::cout << "next required " << *missing << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto options = cosign::config::parse_options(argc, argv, error);
  if (!options) {
    std::cerr << error << std::endl;
    return 2;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options->log_level));

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options->log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "cosign", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  if (options->help) {
    std::cout << "usage: cosign [options] <command> [args...]\n"
              << options->usage << std::endl;
    spdlog::shutdown();
    return 0;
  }

  auto result = 2;
  if (options->command == "tsa-request") {
    result = tsa_request(*options);
  } else if (options->command == "tsa-inspect") {
    result = tsa_inspect(*options);
  } else if (options->command == "queue" || options->command == "audit" ||
             options->command == "fields") {
    auto encoder = cosign::sync::encoder_t{};
    auto storage =
        cosign::storage::make_storage<cosign::storage::rocksdb_storage_tag>(
            options->db_path);
    auto authority = detached_authority{};
    auto engine = cosign::sync::engine{encoder, storage, authority,
                                       cosign::common::system_time_milliseconds,
                                       options->sync};
    if (options->command == "queue") {
      result = show_queue(engine);
    } else if (options->command == "audit") {
      result = show_audit(*options, encoder, engine);
    } else {
      result = show_fields(*options, engine);
    }
  } else {
    std::cerr << "unknown command: " << options->command << std::endl;
  }

  spdlog::shutdown();
  return result;
}
