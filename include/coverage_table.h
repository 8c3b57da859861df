#ifndef COVTABLE_COVERAGE_TABLE_H
#define COVTABLE_COVERAGE_TABLE_H

#include "parallel_loader.h"
#include "region_selector.h"
#include "signal_extractor.h"
#include "signal_table.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace covtable {

constexpr const char* kToolName = "covtable";
constexpr const char* kToolVersion = "0.3.0";

// ============================================================================
// Pipeline Configuration
// ============================================================================

struct CoverageTableConfig {
    // Inputs
    std::string peak_file;
    std::vector<std::string> data_files;

    // Extraction
    int32_t window = 200;
    bool remove_duplicates = true;
    bool remove_low_quality = true;

    // Normalization
    bool log_transform = false;
    bool scale = false;

    // Region selection
    size_t top = 0;
    std::string top_method = "var";
    uint64_t seed = kDefaultSelectionSeed;

    // Loader
    int num_workers = kDefaultLoadWorkers;
    bool verbose = true;
};

struct CoverageTableResult {
    SignalTable table;
    size_t total_regions = 0;
    bool used_fallback = false;
    std::vector<std::string> indexed_files;  // alignment indexes created this run
};

/**
 * Check parameters and input files before any extraction.
 * Throws ConfigError / InputError.
 */
void validate_config(const CoverageTableConfig& config);

/**
 * Create missing BAM/CRAM indexes next to the data files.
 * @return paths whose index was created
 */
std::vector<std::string> prepare_alignment_indexes(const std::vector<std::string>& data_files);

/**
 * Full pipeline: validate, index, load, assemble, normalize, select.
 * The factory replaces the file-based extractors in tests.
 */
CoverageTableResult build_coverage_table(
    const CoverageTableConfig& config,
    const ExtractorFactory& factory = make_signal_extractor);

// Same, with an explicit loader (strategy injection)
CoverageTableResult build_coverage_table(const CoverageTableConfig& config,
                                         TrackLoader& loader);

}  // namespace covtable

#endif  // COVTABLE_COVERAGE_TABLE_H
