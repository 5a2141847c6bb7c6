#pragma once

#include <cosign/schema/primitives.hpp>
#include <cosign/sync/engine.hpp>
#include <cosign/timestamp/client.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cosign::config {

struct options_t final {
  std::string db_path{"cosign.db"};
  std::string tsa_url;
  std::string log_file{"cosign.log"};
  std::string log_level{"info"};
  cosign::sync::sync_config_t sync;
  cosign::timestamp::validation_policy_t timestamp_policy;
  cosign::schema::duration_milliseconds_t session_ttl{168ull * 60 * 60 * 1000};
  /// Subcommand and its positional arguments.
  std::string command;
  std::vector<std::string> arguments;
  bool help{};
  /// Rendered option descriptions, for --help.
  std::string usage;
};

/// Parse the command line. Returns std::nullopt and sets `error` when the
/// arguments are invalid.
std::optional<options_t> parse_options(int argc,
                                       const char* const argv[],
                                       std::string& error);

}  // namespace cosign::config
