// Command-line surface of the vargen tool.
#pragma once

#include <vargen/vargen.h>

#include <optional>
#include <string>
#include <string_view>

namespace vargen::tool {

// Options consumed by the tool entry point.
// - options: library configuration built from the flags
// - count_only: print per-template combination counts and write nothing
// - analyze_speed: log the elapsed wall time after the run
// - verbose: enable log_info output
struct CliOptions {
    vargen::Options options;
    bool            count_only    = false;
    bool            analyze_speed = false;
    bool            verbose       = false;
};

// Decode \n, \r, \t and \\ in a value typed on the command line. Any other
// escaped character is kept as written.
std::string decode_escapes(std::string_view value);

// Parse argv. llvm::cl reports malformed flags itself and exits; conflicts it
// cannot see are logged here and yield nullopt.
std::optional<CliOptions> parse_arguments(int argc, const char **argv);

} // namespace vargen::tool
