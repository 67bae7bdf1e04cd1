#pragma once

#include <optional>
#include <string>
#include <vector>

#include "civil_date.hpp"

struct CliArgs {
    CivilDate                start;
    std::optional<CivilDate> end;

    bool reverse    = false;  // -r, --reverse
    bool reciprocal = false;  // --reciprocal
    bool json       = false;  // --json
    bool help       = false;  // -h, --help

    std::string configPath = "";  // -c, --config
};

/**
 * @brief Parse command-line arguments (without the program name).
 * @param args  Arguments in order
 * @param out   Filled on success
 * @param error Reason on failure
 * @return false on malformed input; when --help is given, true with out.help set
 */
[[nodiscard]] bool parseArgs(const std::vector<std::string>& args, CliArgs& out, std::string& error);

/**
 * @brief Usage text for the usdcad executable.
 */
[[nodiscard]] std::string usage(const std::string& program);
