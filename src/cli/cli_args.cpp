#include "cli_args.h"

#include <iostream>
#include <stdexcept>
#include <string>

namespace covtable {
namespace cli {

void print_version() {
    std::cout << kToolName << " " << kToolVersion << "\n";
}

void print_usage(const char* program_name) {
    std::cout << kToolName << " v" << kToolVersion
              << " - signal table of tracks over genomic regions\n\n";
    std::cout << "Usage: " << program_name
              << " -p <peaks> -d <track> [<track> ...] [options]\n\n";
    std::cout << "Input:\n";
    std::cout << "  -p, --peakfile <file>    Regions (BED, plain or gzipped)\n";
    std::cout << "  -d, --datafiles <files>  Tracks: .bam, .cram, .bed, .bedGraph\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -w, --window <int>       Window around region center (default: 200)\n";
    std::cout << "  -l, --logtransform       Apply log(1 + x)\n";
    std::cout << "  -s, --scale              Standardize every track (mean 0, sd 1)\n";
    std::cout << "  -t, --top <int>          Keep only the top N regions (default: 0, all)\n";
    std::cout << "  -T, --topmethod <name>   var, std, mean or random (default: var)\n";
    std::cout << "  -D, --keep-dup           Keep duplicate reads\n";
    std::cout << "  -R, --keep-repeats       Keep reads with mapping quality 0\n";
    std::cout << "  -j, --threads <int>      Worker threads for loading (default: 12)\n";
    std::cout << "  --seed <int>             Seed for random selection (default: 42)\n";
    std::cout << "  -q, --quiet              No progress messages\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name
              << " -p peaks.bed -d h3k27ac.bam atac.bam -w 500 -l -s > table.tsv\n";
}

CoverageTableConfig parse_args(int argc, char* argv[]) {
    CoverageTableConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_long = [&](const std::string& flag, const std::string& value) -> long long {
            try {
                size_t idx = 0;
                long long parsed = std::stoll(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const std::invalid_argument&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            } catch (const std::out_of_range&) {
                throw ParseArgsExit(1, "Error: Integer out of range for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-p" || arg == "--peakfile") {
            config.peak_file = require_value(arg);
        } else if (arg == "-d" || arg == "--datafiles") {
            // consume values up to the next option
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                config.data_files.emplace_back(argv[++i]);
            }
            if (config.data_files.empty()) {
                throw ParseArgsExit(1, "Error: Missing value for " + arg);
            }
        } else if (arg == "-w" || arg == "--window") {
            const long long window = parse_long(arg, require_value(arg));
            if (window < 1 || window > 100000000) {
                throw ParseArgsExit(1, "Error: --window must be between 1 and 100000000");
            }
            config.window = static_cast<int32_t>(window);
        } else if (arg == "-l" || arg == "--logtransform") {
            config.log_transform = true;
        } else if (arg == "-s" || arg == "--scale") {
            config.scale = true;
        } else if (arg == "-t" || arg == "--top") {
            const long long top = parse_long(arg, require_value(arg));
            if (top < 0) {
                throw ParseArgsExit(1, "Error: --top must be >= 0");
            }
            config.top = static_cast<size_t>(top);
        } else if (arg == "-T" || arg == "--topmethod") {
            config.top_method = require_value(arg);
        } else if (arg == "-D" || arg == "--keep-dup") {
            config.remove_duplicates = false;
        } else if (arg == "-R" || arg == "--keep-repeats") {
            config.remove_low_quality = false;
        } else if (arg == "-j" || arg == "--threads") {
            const long long threads = parse_long(arg, require_value(arg));
            if (threads < 1 || threads > 1024) {
                throw ParseArgsExit(1, "Error: --threads must be between 1 and 1024");
            }
            config.num_workers = static_cast<int>(threads);
        } else if (arg == "--seed") {
            const long long seed = parse_long(arg, require_value(arg));
            if (seed < 0) {
                throw ParseArgsExit(1, "Error: --seed must be >= 0");
            }
            config.seed = static_cast<uint64_t>(seed);
        } else if (arg == "-q" || arg == "--quiet") {
            config.verbose = false;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (config.peak_file.empty()) {
        throw ParseArgsExit(1, "Error: No peak file specified (-p)");
    }
    if (config.data_files.empty()) {
        throw ParseArgsExit(1, "Error: No data files specified (-d)");
    }

    return config;
}

}  // namespace cli
}  // namespace covtable
