#include "cli.hpp"

#include "log.hpp"

#include <llvm/Support/CommandLine.h>

#include <string>
#include <vector>

namespace vargen::tool {

std::string decode_escapes(std::string_view value) {
    std::string decoded;
    decoded.reserve(value.size());
    bool escape = false;
    for (const char ch : value) {
        if (escape) {
            switch (ch) {
            case '\\': decoded.push_back('\\'); break;
            case 'n': decoded.push_back('\n'); break;
            case 'r': decoded.push_back('\r'); break;
            case 't': decoded.push_back('\t'); break;
            default:
                decoded.push_back('\\');
                decoded.push_back(ch);
                break;
            }
            escape = false;
        } else if (ch == '\\') {
            escape = true;
        } else {
            decoded.push_back(ch);
        }
    }
    if (escape) {
        decoded.push_back('\\');
    }
    return decoded;
}

std::optional<CliOptions> parse_arguments(int argc, const char **argv) {
    static llvm::cl::OptionCategory   category{"vargen"};
    static llvm::cl::opt<std::string> text_option{"text", llvm::cl::desc("Expand this template instead of reading an input file"),
                                                  llvm::cl::value_desc("template"), llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> input_option{"input", llvm::cl::desc("File with one template per line"),
                                                   llvm::cl::value_desc("path"), llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> output_option{"output", llvm::cl::desc("File receiving the combinations"),
                                                    llvm::cl::value_desc("path"), llvm::cl::init(""), llvm::cl::cat(category)};
    static llvm::cl::opt<bool>        append_option{"append", llvm::cl::desc("Append to the output file instead of overwriting it"),
                                                    llvm::cl::init(false), llvm::cl::cat(category)};
    static llvm::cl::opt<std::string> separator_option{"separator",
                                                       llvm::cl::desc("Text between consecutive combinations (\\n, \\t, \\r, \\\\ decoded)"),
                                                       llvm::cl::init("\\n"), llvm::cl::cat(category)};
    static llvm::cl::opt<long long>   batch_size_option{"batch-size", llvm::cl::desc("Combinations rendered and written per batch"),
                                                        llvm::cl::init(vargen::kDefaultBatchSize), llvm::cl::cat(category)};
    static llvm::cl::opt<unsigned>    jobs_option{"jobs", llvm::cl::desc("Worker threads (0: hardware concurrency)"), llvm::cl::init(0),
                                                  llvm::cl::cat(category)};
    static llvm::cl::opt<unsigned>    in_flight_option{"max-in-flight",
                                                       llvm::cl::desc("Batches rendered ahead of the writer (0: twice the jobs)"),
                                                       llvm::cl::init(0), llvm::cl::cat(category)};
    static llvm::cl::opt<unsigned long long> max_option{"max-combinations", llvm::cl::desc("Refuse templates with more combinations"),
                                                        llvm::cl::init(vargen::kDefaultMaxCombinations), llvm::cl::cat(category)};
    static llvm::cl::opt<bool> squeeze_option{"squeeze-spaces", llvm::cl::desc("Collapse repeated spaces and trim every combination"),
                                              llvm::cl::init(false), llvm::cl::cat(category)};
    static llvm::cl::opt<bool> count_option{"count", llvm::cl::desc("Print combination counts only"), llvm::cl::init(false),
                                            llvm::cl::cat(category)};
    static llvm::cl::opt<bool> speed_option{"analyze-speed", llvm::cl::desc("Report the elapsed time"), llvm::cl::init(false),
                                            llvm::cl::cat(category)};
    static llvm::cl::opt<bool> verbose_option{"verbose", llvm::cl::desc("Log progress to stderr"), llvm::cl::init(false),
                                              llvm::cl::cat(category)};
    static llvm::cl::list<std::string> positional_option{llvm::cl::Positional, llvm::cl::desc("[input] [output]"),
                                                         llvm::cl::ZeroOrMore, llvm::cl::cat(category)};

    llvm::cl::HideUnrelatedOptions(category);
    llvm::cl::ParseCommandLineOptions(argc, argv, "vargen: expand [a|b] templates into every combination\n");

    const std::vector<std::string> positionals(positional_option.begin(), positional_option.end());
    if (positionals.size() > 2) {
        log_err("vargen: expected at most two positional arguments ([input] [output]), got {}\n", positionals.size());
        return std::nullopt;
    }

    std::string input  = input_option.getValue();
    std::string output = output_option.getValue();
    if (!positionals.empty()) {
        if (!input.empty()) {
            log_err("vargen: input given both as --input and as a positional argument\n");
            return std::nullopt;
        }
        input = positionals[0];
    }
    if (positionals.size() > 1) {
        if (!output.empty()) {
            log_err("vargen: output given both as --output and as a positional argument\n");
            return std::nullopt;
        }
        output = positionals[1];
    }

    const bool has_text = text_option.getNumOccurrences() > 0;
    if (has_text && !input.empty()) {
        log_err("vargen: --text and an input file are mutually exclusive\n");
        return std::nullopt;
    }

    CliOptions cli;
    cli.count_only    = count_option.getValue();
    cli.analyze_speed = speed_option.getValue();
    cli.verbose       = verbose_option.getValue();

    auto &opts = cli.options;
    if (has_text) {
        opts.input = vargen::InputSource::from_text(text_option.getValue());
    } else if (!input.empty()) {
        opts.input = vargen::InputSource::from_file(input);
    }
    if (!output.empty()) {
        opts.output = output;
    }
    opts.append           = append_option.getValue();
    opts.separator        = decode_escapes(separator_option.getValue());
    opts.batch_size       = static_cast<std::int64_t>(batch_size_option.getValue());
    opts.jobs             = jobs_option.getValue();
    opts.max_in_flight    = in_flight_option.getValue();
    opts.max_combinations = max_option.getValue();
    opts.squeeze_spaces   = squeeze_option.getValue();
    return cli;
}

} // namespace vargen::tool
