#ifndef COVTABLE_PARALLEL_LOADER_H
#define COVTABLE_PARALLEL_LOADER_H

#include "region.h"
#include "signal_extractor.h"
#include "signal_table.h"

#include <memory>
#include <string>
#include <vector>

namespace covtable {

constexpr int kDefaultLoadWorkers = 12;

struct LoadRequest {
    std::string region_path;
    std::vector<std::string> track_paths;
    ExtractionOptions options;
};

struct LoadResult {
    std::vector<Region> regions;      // canonical order, from the first track
    std::vector<TrackSignal> tracks;  // same order as LoadRequest::track_paths
    bool used_fallback = false;
};

/**
 * LoadStrategy: runs one extraction per track.
 * Profiles come back in track-list order.
 */
class LoadStrategy {
public:
    virtual ~LoadStrategy() = default;

    virtual const char* name() const = 0;
    virtual std::vector<TrackProfile> run(const LoadRequest& request) = 0;
};

class SequentialLoadStrategy final : public LoadStrategy {
public:
    explicit SequentialLoadStrategy(ExtractorFactory factory = make_signal_extractor,
                                    bool verbose = false);

    const char* name() const override { return "sequential"; }
    std::vector<TrackProfile> run(const LoadRequest& request) override;

private:
    ExtractorFactory factory_;
    bool verbose_;
};

/**
 * ParallelLoadStrategy: one task per track on a TaskQueue of at most
 * num_workers threads. Throws WorkerPoolError when the pool cannot be set
 * up or refuses a task; a failing track rethrows its own error.
 */
class ParallelLoadStrategy final : public LoadStrategy {
public:
    explicit ParallelLoadStrategy(int num_workers = kDefaultLoadWorkers,
                                  ExtractorFactory factory = make_signal_extractor,
                                  bool verbose = false);

    const char* name() const override { return "parallel"; }
    std::vector<TrackProfile> run(const LoadRequest& request) override;

private:
    int num_workers_;
    ExtractorFactory factory_;
    bool verbose_;
};

/**
 * TrackLoader: primary strategy with a whole-run fallback.
 * Only WorkerPoolError from the primary switches to the fallback, which
 * re-runs every track. Any other error propagates.
 */
class TrackLoader {
public:
    TrackLoader(std::unique_ptr<LoadStrategy> primary,
                std::unique_ptr<LoadStrategy> fallback,
                bool verbose = false);

    LoadResult load(const LoadRequest& request);

private:
    std::unique_ptr<LoadStrategy> primary_;
    std::unique_ptr<LoadStrategy> fallback_;
    bool verbose_;
};

// Parallel with sequential fallback
TrackLoader make_track_loader(int num_workers,
                              const ExtractorFactory& factory = make_signal_extractor,
                              bool verbose = false);

/**
 * Turn per-track profiles into named signals plus the canonical regions.
 * Throws ExtractionError if any track disagrees with the first on regions.
 */
LoadResult merge_profiles(std::vector<TrackProfile> profiles);

}  // namespace covtable

#endif  // COVTABLE_PARALLEL_LOADER_H
