#ifndef COVTABLE_SIGNAL_EXTRACTOR_H
#define COVTABLE_SIGNAL_EXTRACTOR_H

#include "region.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace covtable {

enum class TrackFormat {
    kAlignment,  // BAM / CRAM
    kIntervals,  // BED
    kSignal      // bedGraph
};

struct ExtractionOptions {
    int32_t window = 200;
    bool remove_duplicates = true;
    bool remove_low_quality = true;
};

/**
 * TrackProfile: result of one per-track extraction.
 * values[i] belongs to regions[i].
 */
struct TrackProfile {
    std::string track_path;
    std::vector<Region> regions;
    std::vector<double> values;
};

/**
 * SignalExtractor: summarizes one track over a list of regions.
 * One instance per track; instances are never shared between threads.
 */
class SignalExtractor {
public:
    virtual ~SignalExtractor() = default;

    virtual const std::string& track_path() const = 0;

    // One value per region, same order. Throws ExtractionError.
    virtual std::vector<double> extract(const std::vector<Region>& regions) = 0;
};

using ExtractorFactory = std::function<std::unique_ptr<SignalExtractor>(
    const std::string& track_path, const ExtractionOptions& options)>;

// Throws InputError for unsupported extensions
TrackFormat detect_track_format(const std::string& path);

const char* track_format_name(TrackFormat format);

// Path with the final extension stripped: "data/h3k27ac.bam" -> "data/h3k27ac"
std::string derive_track_name(const std::string& path);

// Picks the htslib, BED or bedGraph extractor by extension
std::unique_ptr<SignalExtractor> make_signal_extractor(
    const std::string& track_path,
    const ExtractionOptions& options);

/**
 * Full per-track invocation: reads the region file, builds the extractor
 * through the factory and extracts one value per region.
 */
TrackProfile extract_track(const std::string& region_path,
                           const std::string& track_path,
                           const ExtractionOptions& options,
                           const ExtractorFactory& factory = make_signal_extractor);

}  // namespace covtable

#endif  // COVTABLE_SIGNAL_EXTRACTOR_H
