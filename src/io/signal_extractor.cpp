#include "signal_extractor.h"

#include "bam_io.h"
#include "errors.h"
#include "interval_track.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace covtable {
namespace {

std::string lower_case(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

TrackFormat detect_track_format(const std::string& path) {
    std::string name = lower_case(std::filesystem::path(path).filename().string());
    if (ends_with(name, ".bam") || ends_with(name, ".cram")) {
        return TrackFormat::kAlignment;
    }

    if (ends_with(name, ".gz")) {
        name.resize(name.size() - 3);
    }
    if (ends_with(name, ".bed")) {
        return TrackFormat::kIntervals;
    }
    if (ends_with(name, ".bedgraph") || ends_with(name, ".bdg") || ends_with(name, ".bg")) {
        return TrackFormat::kSignal;
    }

    throw InputError("Unsupported track format: " + path +
                     " (expected .bam, .cram, .bed or .bedGraph)");
}

const char* track_format_name(TrackFormat format) {
    switch (format) {
        case TrackFormat::kAlignment: return "alignment";
        case TrackFormat::kIntervals: return "intervals";
        case TrackFormat::kSignal: return "signal";
    }
    return "unknown";
}

std::string derive_track_name(const std::string& path) {
    std::filesystem::path p(path);
    p.replace_extension();
    return p.string();
}

std::unique_ptr<SignalExtractor> make_signal_extractor(
    const std::string& track_path,
    const ExtractionOptions& options) {
    switch (detect_track_format(track_path)) {
        case TrackFormat::kAlignment:
            return make_bam_signal_extractor(track_path, options);
        case TrackFormat::kIntervals:
            return make_interval_signal_extractor(track_path, options);
        case TrackFormat::kSignal:
            return make_bedgraph_signal_extractor(track_path, options);
    }
    throw InputError("Unsupported track format: " + track_path);
}

TrackProfile extract_track(const std::string& region_path,
                           const std::string& track_path,
                           const ExtractionOptions& options,
                           const ExtractorFactory& factory) {
    TrackProfile profile;
    profile.track_path = track_path;
    profile.regions = load_regions(region_path);

    auto extractor = factory(track_path, options);
    if (!extractor) {
        throw ExtractionError("No extractor available for track: " + track_path);
    }
    profile.values = extractor->extract(profile.regions);

    if (profile.values.size() != profile.regions.size()) {
        throw ExtractionError("Track " + track_path + " returned " +
                              std::to_string(profile.values.size()) + " values for " +
                              std::to_string(profile.regions.size()) + " regions");
    }
    return profile;
}

}  // namespace covtable
