#ifndef MEMO_CONFIG_HPP
#define MEMO_CONFIG_HPP

#include <memo/caching/config.hpp>

// This file defines the configuration of the memo_tool command-line program
// and how it's read from YAML files and the environment.
//
// A config file looks like this (all fields are optional):
//
//   cache:
//     placement: directory    # disabled, directory or in_place
//     directory: /var/cache/memo
//     minimum_elapsed_ms: 100
//   logging:
//     level: info
//
// If a directory is given without a placement, the placement is "directory".

namespace memo {

struct tool_config
{
    memo_config memo;

    // the spdlog level name to log at
    string log_level = "warn";
};

// Parse a tool config from YAML text.
// This throws invalid_memo_config if the YAML is malformed or describes an
// unusable config.
tool_config
parse_tool_config(string const& yaml);

// Read a tool config from a YAML file.
tool_config
read_tool_config_file(file_path const& path);

// Apply overrides from the following environment variables (where set):
//
//   MEMO_CACHE_DIR - use directory placement with this cache root
//   MEMO_IN_PLACE - if "1" or "true", use in-place placement
//   MEMO_MINIMUM_ELAPSED_MS - the minimum initialization time to memoize
//   MEMO_LOG_LEVEL - the log level
//
void
apply_environment_overrides(tool_config& config);

} // namespace memo

#endif
