#include "coverage_table.h"

#include "bam_io.h"
#include "errors.h"
#include "normalizer.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace covtable {
namespace {

double elapsed_seconds(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

void validate_config(const CoverageTableConfig& config) {
    if (config.window <= 0) {
        throw ConfigError("window must be positive, got " + std::to_string(config.window));
    }
    if (config.num_workers < 1) {
        throw ConfigError("number of workers must be positive, got " +
                          std::to_string(config.num_workers));
    }
    if (config.data_files.empty()) {
        throw ConfigError("No data files given");
    }
    parse_top_method(config.top_method);

    if (!std::filesystem::is_regular_file(config.peak_file)) {
        throw InputError("Peak file '" + config.peak_file + "' does not exist");
    }
    for (const auto& path : config.data_files) {
        if (!std::filesystem::is_regular_file(path)) {
            throw InputError("Data file '" + path + "' does not exist");
        }
        detect_track_format(path);
    }
}

std::vector<std::string> prepare_alignment_indexes(const std::vector<std::string>& data_files) {
    std::vector<std::string> created;
    for (const auto& path : data_files) {
        if (detect_track_format(path) != TrackFormat::kAlignment) continue;
        if (ensure_alignment_index(path)) {
            created.push_back(path);
        }
    }
    return created;
}

CoverageTableResult build_coverage_table(const CoverageTableConfig& config,
                                         const ExtractorFactory& factory) {
    TrackLoader loader = make_track_loader(config.num_workers, factory, config.verbose);
    return build_coverage_table(config, loader);
}

CoverageTableResult build_coverage_table(const CoverageTableConfig& config,
                                         TrackLoader& loader) {
    validate_config(config);
    const TopMethod method = parse_top_method(config.top_method);

    CoverageTableResult result;
    const auto start_time = std::chrono::steady_clock::now();

    result.indexed_files = prepare_alignment_indexes(config.data_files);

    if (config.verbose) {
        std::cerr << "[Pipeline] Loading data" << std::endl;
    }
    LoadRequest request;
    request.region_path = config.peak_file;
    request.track_paths = config.data_files;
    request.options.window = config.window;
    request.options.remove_duplicates = config.remove_duplicates;
    request.options.remove_low_quality = config.remove_low_quality;

    LoadResult loaded = loader.load(request);
    result.used_fallback = loaded.used_fallback;
    result.total_regions = loaded.regions.size();

    result.table = assemble_table(loaded.regions, std::move(loaded.tracks));
    if (config.verbose) {
        std::cerr << "[Pipeline] Table: " << result.table.num_rows() << " regions x "
                  << result.table.num_columns() << " tracks" << std::endl;
    }

    NormalizeParams norm;
    norm.log_transform = config.log_transform;
    norm.scale = config.scale;
    normalize(result.table, norm);

    SelectParams select;
    select.top = config.top;
    select.method = method;
    select.seed = config.seed;
    select_regions(result.table, select);

    if (config.verbose) {
        if (config.top > 0) {
            std::cerr << "[Pipeline] Selected " << result.table.num_rows()
                      << " regions using " << top_method_name(method) << std::endl;
        }
        std::cerr << "[Pipeline] Done in " << elapsed_seconds(start_time) << " s" << std::endl;
    }
    return result;
}

}  // namespace covtable
