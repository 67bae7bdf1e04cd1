#include "cli_args.hpp"

bool parseArgs(const std::vector<std::string>& args, CliArgs& out, std::string& error) {
    CliArgs                  parsed;
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            parsed.help = true;
            out         = parsed;
            return true;
        } else if (arg == "-r" || arg == "--reverse") {
            parsed.reverse = true;
        } else if (arg == "--reciprocal") {
            parsed.reciprocal = true;
        } else if (arg == "--json") {
            parsed.json = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                error = "option " + arg + " requires a file argument";
                return false;
            }
            parsed.configPath = args[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "unknown option " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        error = "missing DATE";
        return false;
    }
    if (positional.size() > 2) {
        error = "unexpected argument " + positional[2];
        return false;
    }

    const auto start = CivilDate::parse(positional[0]);
    if (!start) {
        error = "invalid date \"" + positional[0] + "\" (expected YYYY-MM-DD)";
        return false;
    }
    parsed.start = *start;

    if (positional.size() == 2) {
        const auto end = CivilDate::parse(positional[1]);
        if (!end) {
            error = "invalid date \"" + positional[1] + "\" (expected YYYY-MM-DD)";
            return false;
        }
        if (*end < *start) {
            error = "end date " + end->toString() + " is before start date " + start->toString();
            return false;
        }
        parsed.end = *end;
    }

    if (parsed.reciprocal && !parsed.reverse) {
        error = "--reciprocal only applies together with --reverse";
        return false;
    }

    out = parsed;
    return true;
}

std::string usage(const std::string& program) {
    return "Get the USD to CAD exchange rate from the Bank of Canada for a single date, or a range.\n"
           "Returns the preceding business day if the selected date has no published rate.\n"
           "\n"
           "Usage: " +
           program +
           " [options] DATE [END_DATE]\n"
           "\n"
           "Arguments:\n"
           "  DATE                 A single date, or start date of the range (YYYY-MM-DD)\n"
           "  END_DATE             End date of the range (YYYY-MM-DD)\n"
           "\n"
           "Options:\n"
           "  -r, --reverse        Provide the exchange rate from CAD to USD\n"
           "      --reciprocal     With --reverse, invert the USD/CAD rate instead of fetching CAD/USD\n"
           "      --json           Print the result as JSON\n"
           "  -c, --config FILE    Load settings from a JSON file\n"
           "  -h, --help           Print this help\n"
           "\n"
           "Environment:\n"
           "  BOCFX_BASE_URL       Valet service root (default https://www.bankofcanada.ca/valet)\n"
           "  BOCFX_LOOKBACK_DAYS  Days fetched before DATE to find a prior business day (1-366, default 10)\n"
           "  BOCFX_TIMEOUT        Request timeout in seconds (1-3600, default 30)\n";
}
