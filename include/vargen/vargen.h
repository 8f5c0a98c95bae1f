// Public entry point: expand bracket templates into every combination.
//
//   vargen::Options opts;
//   opts.input  = vargen::InputSource::from_text("Hello [world|there]");
//   opts.output = "out.txt";
//   vargen::run(opts); // out.txt: "Hello world\nHello there"
//
// All failures are reported as vargen::error; see error.h for the kinds.
#pragma once

#include "vargen/batch_plan.h"
#include "vargen/combination_space.h"
#include "vargen/error.h"
#include "vargen/generator.h"
#include "vargen/output_sink.h"
#include "vargen/template.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vargen {

inline constexpr std::string_view kDefaultSeparator  = "\n";
inline constexpr std::string_view kDefaultInputPath  = "vargen_source_text.txt";
inline constexpr std::string_view kDefaultOutputPath = "vargen_result_text.txt";

// Where templates come from. Inline text is a single template; a file holds
// one template per line.
struct InputSource {
    enum class Kind {
        Text,
        File,
    };

    Kind        kind = Kind::File;
    std::string value{kDefaultInputPath};

    static InputSource from_text(std::string text) { return InputSource{Kind::Text, std::move(text)}; }
    static InputSource from_file(std::filesystem::path path) { return InputSource{Kind::File, path.string()}; }
};

// Configuration of one invocation. Every field has a usable default.
// - append: add to the destination instead of truncating it
// - separator: inserted between consecutive combinations, across templates too
// - batch_size: indices rendered and written as one unit; must be positive
// - jobs / max_in_flight: worker threads and batches held before writing (0: automatic)
// - max_combinations: per-template limit on the combination count
// - squeeze_spaces: collapse repeated spaces and trim each rendered string
struct Options {
    bool                  append    = false;
    std::string           separator{kDefaultSeparator};
    InputSource           input{};
    std::filesystem::path output{std::string(kDefaultOutputPath)};
    std::int64_t          batch_size       = kDefaultBatchSize;
    std::size_t           jobs             = 0;
    std::size_t           max_in_flight    = 0;
    std::uint64_t         max_combinations = kDefaultMaxCombinations;
    bool                  squeeze_spaces   = false;
};

struct RunSummary {
    std::size_t   templates     = 0;
    std::uint64_t combinations  = 0;
    std::uint64_t batches       = 0;
    std::uint64_t bytes_written = 0;
};

// Throws vargen::error(InvalidConfiguration) for values that cannot work.
void validate_options(const Options &options);

// Read the template texts named by `source`. Throws vargen::error(IOFailure).
std::vector<std::string> load_templates(const InputSource &source);

// Parse every template and size its combination space. When the templates
// are the lines of a file, errors are prefixed with "line N".
std::vector<CombinationSpace> prepare_spaces(const std::vector<std::string> &templates, std::uint64_t max_combinations,
                                             InputSource::Kind origin = InputSource::Kind::Text);

// Per-template combination counts; the output is not touched.
std::vector<std::uint64_t> count_combinations(const Options &options);

// Sum of `totals`, or nullopt when it does not fit in 64 bits.
std::optional<std::uint64_t> sum_combinations(const std::vector<std::uint64_t> &totals);

// Expand everything into `out`, ignoring `options.output` and `options.append`.
RunSummary expand_to_stream(const Options &options, std::ostream &out, bool separator_before_first = false);

// Full invocation: validate, load, parse, then open the destination and write.
// Nothing is opened or truncated unless every template parsed and fits.
RunSummary run(const Options &options);

} // namespace vargen
