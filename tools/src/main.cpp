#include "cli.hpp"
#include "log.hpp"

#include <vargen/vargen.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <limits>
#include <fmt/core.h>

int main(int argc, const char **argv) {
    using vargen::tool::log_err;
    using vargen::tool::log_info;

    const auto cli = vargen::tool::parse_arguments(argc, argv);
    if (!cli) {
        return EXIT_FAILURE;
    }
    vargen::tool::set_verbose(cli->verbose);
    const auto &options = cli->options;

    const auto started = std::chrono::steady_clock::now();
    try {
        if (cli->count_only) {
            const auto totals = vargen::count_combinations(options);
            for (const auto total : totals) {
                fmt::print("{}\n", total);
            }
            if (const auto sum = vargen::sum_combinations(totals)) {
                log_info("vargen: {} combinations in total\n", *sum);
            } else {
                log_info("vargen: more than {} combinations in total\n", std::numeric_limits<std::uint64_t>::max());
            }
        } else {
            log_info("vargen: writing to '{}' ({}), batch size {}\n", options.output.string(),
                     options.append ? "append" : "overwrite", options.batch_size);
            const auto summary = vargen::run(options);
            log_info("vargen: {} templates, {} combinations, {} batches, {} bytes\n", summary.templates, summary.combinations,
                     summary.batches, summary.bytes_written);
        }
    } catch (const vargen::error &e) {
        log_err("vargen: error[{}]: {}\n", vargen::kind_name(e.kind()), e.what());
        return EXIT_FAILURE;
    } catch (const std::exception &e) {
        log_err("vargen: unexpected error: {}\n", e.what());
        return EXIT_FAILURE;
    }

    if (cli->analyze_speed) {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
        log_err("vargen: execution time: {:.6f} seconds\n", elapsed.count());
    }
    return EXIT_SUCCESS;
}
