#pragma once

#include "common/types.h"
#include "sdk/buffer_client.h"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace chadbuffer {
namespace tools {

using namespace chadbuffer::common;

struct CliOptions {
    ProgramConfig config;
    size_t size = 4096;
    uint64_t seed = 1;
    sdk::ComputeBudget budget;
    std::vector<std::string> positional;
};

void print_usage(std::ostream &out);

/**
 * Parse everything after the command word. Unknown options, missing or
 * malformed values and a compute unit limit above u32 range are errors.
 */
Result<CliOptions> parse_options(const std::vector<std::string> &args);

int run_layout(std::ostream &out);
int run_simulate(const CliOptions &options, std::ostream &out, std::ostream &err);
int run_decode(const CliOptions &options, std::ostream &out, std::ostream &err);

/// Full command line dispatch; returns the process exit code
int run_cli(const std::vector<std::string> &argv, std::ostream &out, std::ostream &err);

} // namespace tools
} // namespace chadbuffer
