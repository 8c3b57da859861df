/**
 * covtable - signal table of sequencing tracks over genomic regions
 *
 * Phases:
 * 1. Validation (parameters, input files, track formats)
 * 2. Index preparation (missing BAM/CRAM indexes are built)
 * 3. Loading (one extraction per track on a worker pool, sequential fallback)
 * 4. Assembly (regions x tracks table)
 * 5. Normalization (log1p, per-track standardization)
 * 6. Region selection (top N by var/std/mean, or random)
 *
 * Output: tab-separated table with a '#' metadata header on stdout
 */

#include <exception>
#include <iostream>
#include <sstream>

#include "cli_args.h"
#include "coverage_table.h"
#include "errors.h"
#include "table_writer.h"

using namespace covtable;

int main(int argc, char* argv[]) {
    CoverageTableConfig config;
    try {
        config = cli::parse_args(argc, argv);
    } catch (const cli::ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << std::endl;
            std::cerr << "Run " << argv[0] << " --help for usage" << std::endl;
        }
        return e.exit_code();
    }

    if (config.verbose) {
        std::cerr << "=== " << kToolName << " v" << kToolVersion << " ===" << std::endl;
        std::cerr << "Peak file:  " << config.peak_file << std::endl;
        std::cerr << "Data files: " << config.data_files.size() << std::endl;
        std::cerr << "Window:     " << config.window << std::endl;
    }

    // render fully before writing so a failure never leaves partial output
    std::ostringstream rendered;
    try {
        CoverageTableResult result = build_coverage_table(config);
        write_metadata_header(rendered, config);
        write_table(rendered, result.table);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Run " << argv[0] << " --help for usage" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << rendered.str();
    std::cout.flush();
    if (!std::cout) {
        std::cerr << "Error: failed to write table to standard output" << std::endl;
        return 1;
    }
    return 0;
}
