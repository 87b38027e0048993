#pragma once

#include <string>
#include <vector>

#include "config/count_config.hpp"

namespace ccwc {

/// Load counting settings from a YAML file.
///
/// Reads the optional `counting:` section (`buffer_size`, `encoding`,
/// `whitespace`) on top of `base`; missing keys keep their value from
/// `base` and unknown keys are ignored.  Throws std::runtime_error when the
/// file cannot be parsed or a value is invalid.
CountConfig load_count_config(const std::string& path, const CountConfig& base = {});

/// Same as load_count_config, from an in-memory YAML document.
CountConfig parse_count_config(const std::string& yaml_text, const CountConfig& base = {});

/// Sorted file names of the *.yaml / *.yml files in `dir` (empty if missing).
std::vector<std::string> list_config_files(const std::string& dir);

}  // namespace ccwc
