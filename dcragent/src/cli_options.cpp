
#include "cli_options.hpp"
#include <stdexcept>

CliOptions parse_cli(int argc, const char* const* argv) {
    CliOptions options;

    auto value_of = [&](int& i, const std::string& flag) {
        if (i + 1 >= argc) {
            throw std::invalid_argument("option " + flag + " requires a value");
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            options.config_path = value_of(i, arg);
        } else if (arg == "-r" || arg == "--report") {
            options.report_path = value_of(i, arg);
        } else if (arg == "-l" || arg == "--log-level") {
            options.log_level = value_of(i, arg);
        } else if (arg == "-n" || arg == "--no-report") {
            options.no_report = true;
        } else if (arg == "--no-load") {
            options.no_load = true;
        } else if (arg == "--no-dump") {
            options.no_dump = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return options;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  -c, --config <file>      configuration file\n"
           "  -r, --report <file>      report file, overrides file.path\n"
           "  -l, --log-level <level>  trace|debug|info|warn|error|critical\n"
           "  -n, --no-report          do not write the report file\n"
           "      --no-load            start with an empty dedup cache\n"
           "      --no-dump            do not persist the dedup cache on exit\n"
           "  -h, --help               show this help\n";
}
