#include "vargen/vargen.h"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <utility>

namespace vargen {
namespace {

GeneratorOptions generator_options(const Options &options) {
    return GeneratorOptions{
        .batch_size     = options.batch_size,
        .jobs           = options.jobs,
        .max_in_flight  = options.max_in_flight,
        .squeeze_spaces = options.squeeze_spaces,
    };
}

std::vector<std::string> split_lines(const std::string &content) {
    std::vector<std::string> lines;
    std::size_t              begin = 0;
    while (begin < content.size()) {
        std::size_t end = content.find('\n', begin);
        if (end == std::string::npos)
            end = content.size();
        std::string line = content.substr(begin, end - begin);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
        begin = end + 1;
    }
    return lines;
}

RunSummary write_spaces(const std::vector<CombinationSpace> &spaces, const Options &options, OutputSink &sink) {
    const auto gen = generator_options(options);
    RunSummary summary;
    for (const auto &space : spaces) {
        summary.batches += expand_space(space, gen, sink);
    }
    summary.templates     = spaces.size();
    summary.combinations  = sink.items_written();
    summary.bytes_written = sink.bytes_written();
    return summary;
}

} // namespace

void validate_options(const Options &options) {
    if (options.batch_size <= 0) {
        throw error(ErrorKind::InvalidConfiguration, fmt::format("batch_size must be a positive integer, got {}", options.batch_size));
    }
    if (options.max_combinations == 0) {
        throw error(ErrorKind::InvalidConfiguration, "max_combinations must be positive");
    }
    if (options.input.kind == InputSource::Kind::File && options.input.value.empty()) {
        throw error(ErrorKind::InvalidConfiguration, "input path is empty");
    }
}

std::vector<std::string> load_templates(const InputSource &source) {
    if (source.kind == InputSource::Kind::Text) {
        return {source.value};
    }
    std::ifstream in(source.value, std::ios::binary);
    if (!in) {
        throw error(ErrorKind::IOFailure, fmt::format("cannot open input file '{}'", source.value));
    }
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw error(ErrorKind::IOFailure, fmt::format("failed to read input file '{}'", source.value));
    }
    return split_lines(content);
}

std::vector<CombinationSpace> prepare_spaces(const std::vector<std::string> &templates, std::uint64_t max_combinations,
                                             InputSource::Kind origin) {
    std::vector<CombinationSpace> spaces;
    spaces.reserve(templates.size());
    for (std::size_t i = 0; i < templates.size(); ++i) {
        try {
            auto tpl = std::make_shared<const Template>(parse_template(templates[i]));
            spaces.emplace_back(std::move(tpl), max_combinations);
        } catch (const error &e) {
            if (origin != InputSource::Kind::File)
                throw;
            rethrow_with_context(e, fmt::format("line {}", i + 1));
        }
    }
    return spaces;
}

std::vector<std::uint64_t> count_combinations(const Options &options) {
    validate_options(options);
    std::vector<std::uint64_t> totals;
    for (const auto &space : prepare_spaces(load_templates(options.input), options.max_combinations, options.input.kind)) {
        totals.push_back(space.total());
    }
    return totals;
}

std::optional<std::uint64_t> sum_combinations(const std::vector<std::uint64_t> &totals) {
    std::uint64_t sum = 0;
    for (const auto total : totals) {
        if (total > std::numeric_limits<std::uint64_t>::max() - sum) {
            return std::nullopt;
        }
        sum += total;
    }
    return sum;
}

RunSummary expand_to_stream(const Options &options, std::ostream &out, bool separator_before_first) {
    validate_options(options);
    const auto spaces = prepare_spaces(load_templates(options.input), options.max_combinations, options.input.kind);

    OutputSink sink(out, options.separator, separator_before_first);
    return write_spaces(spaces, options, sink);
}

RunSummary run(const Options &options) {
    validate_options(options);
    if (options.output.empty()) {
        throw error(ErrorKind::InvalidConfiguration, "output path is empty");
    }
    const auto spaces = prepare_spaces(load_templates(options.input), options.max_combinations, options.input.kind);

    const bool    leading = options.append && append_needs_separator(options.output, options.separator);
    std::ofstream file    = open_output_file(options.output, options.append);

    OutputSink sink(file, options.separator, leading);
    const auto summary = write_spaces(spaces, options, sink);
    file.close();
    if (!file) {
        throw error(ErrorKind::IOFailure, fmt::format("failed to close output file '{}'", options.output.string()));
    }
    return summary;
}

} // namespace vargen
