#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "config/count_config.hpp"
#include "core/metrics.hpp"

namespace ccwc {

/// Process exit codes.
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitInterrupted = 130;

/// Parsed command line.  Optional settings override the config file.
struct CliOptions {
  MetricSet metrics;
  std::vector<std::string> files;
  std::string config_file;
  std::optional<std::size_t> buffer_size;
  std::optional<std::string> encoding;
  std::optional<WhitespaceMode> whitespace;
  bool verbose = false;
  bool help = false;
  bool list_configs = false;
  bool list_encodings = false;
};

/// Parse argv.  Throws std::invalid_argument with a user-facing message on
/// unknown arguments or missing option values.
CliOptions parse_cli(int argc, const char* const argv[]);

/// Merge config file (if any) and command-line overrides.
/// Throws std::runtime_error on an unreadable or invalid config file.
CountConfig resolve_config(const CliOptions& opts);

/// One output line: a leading space, the requested values in the order
/// lines, words, chars, bytes, then the name if it is not empty.
std::string format_counts(const CountResult& result, const std::string& name);

/// Run the tool end to end.  Standard input is read from `in` when no file
/// (or "-") is given.  Returns the process exit code.
int run_cli(int argc, const char* const argv[], std::istream& in, std::ostream& out,
            std::ostream& err);

}  // namespace ccwc
