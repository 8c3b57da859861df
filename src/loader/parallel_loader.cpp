#include "parallel_loader.h"

#include "errors.h"
#include "task_queue.h"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace covtable {
namespace {

std::mutex g_log_mutex;

void log_track_done(const std::string& path, size_t done, size_t total) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[Loader]   " << path << " (" << done << "/" << total << ")" << std::endl;
}

class ExtractionTask final : public Task {
public:
    ExtractionTask(const LoadRequest& request, size_t index, TrackProfile& slot,
                   const ExtractorFactory& factory, std::atomic<size_t>& done, bool verbose)
        : Task(request.track_paths[index]),
          request_(request),
          slot_(slot),
          factory_(factory),
          done_(done),
          verbose_(verbose) {}

    void execute() override {
        slot_ = extract_track(request_.region_path, get_task_id(),
                              request_.options, factory_);
        const size_t finished = ++done_;
        if (verbose_) {
            log_track_done(get_task_id(), finished, request_.track_paths.size());
        }
    }

private:
    const LoadRequest& request_;
    TrackProfile& slot_;
    const ExtractorFactory& factory_;
    std::atomic<size_t>& done_;
    bool verbose_;
};

}  // namespace

// ============= SequentialLoadStrategy =============

SequentialLoadStrategy::SequentialLoadStrategy(ExtractorFactory factory, bool verbose)
    : factory_(std::move(factory)), verbose_(verbose) {}

std::vector<TrackProfile> SequentialLoadStrategy::run(const LoadRequest& request) {
    std::vector<TrackProfile> profiles;
    profiles.reserve(request.track_paths.size());
    for (size_t i = 0; i < request.track_paths.size(); ++i) {
        profiles.push_back(extract_track(request.region_path, request.track_paths[i],
                                         request.options, factory_));
        if (verbose_) {
            log_track_done(request.track_paths[i], i + 1, request.track_paths.size());
        }
    }
    return profiles;
}

// ============= ParallelLoadStrategy =============

ParallelLoadStrategy::ParallelLoadStrategy(int num_workers, ExtractorFactory factory,
                                           bool verbose)
    : num_workers_(num_workers), factory_(std::move(factory)), verbose_(verbose) {}

std::vector<TrackProfile> ParallelLoadStrategy::run(const LoadRequest& request) {
    std::vector<TrackProfile> profiles(request.track_paths.size());
    if (profiles.empty()) {
        return profiles;
    }

    // never start more threads than there are tracks
    int workers = num_workers_;
    if (workers > 0) {
        workers = std::min(workers, static_cast<int>(request.track_paths.size()));
    }

    std::atomic<size_t> done{0};
    TaskQueue pool(workers);
    for (size_t i = 0; i < request.track_paths.size(); ++i) {
        auto task = std::make_unique<ExtractionTask>(request, i, profiles[i], factory_,
                                                     done, verbose_);
        if (!pool.submit(std::move(task))) {
            throw WorkerPoolError("Worker pool refused task for " + request.track_paths[i]);
        }
    }

    // rethrows the first per-track failure
    pool.wait();
    return profiles;
}

// ============= TrackLoader =============

TrackLoader::TrackLoader(std::unique_ptr<LoadStrategy> primary,
                         std::unique_ptr<LoadStrategy> fallback,
                         bool verbose)
    : primary_(std::move(primary)), fallback_(std::move(fallback)), verbose_(verbose) {}

LoadResult TrackLoader::load(const LoadRequest& request) {
    if (request.track_paths.empty()) {
        throw ConfigError("No data files given");
    }

    if (verbose_) {
        std::cerr << "[Loader] Loading " << request.track_paths.size()
                  << " tracks (" << primary_->name() << ")" << std::endl;
    }

    std::vector<TrackProfile> profiles;
    bool used_fallback = false;
    try {
        profiles = primary_->run(request);
    } catch (const WorkerPoolError& e) {
        if (!fallback_) {
            throw;
        }
        std::cerr << "[Loader] Error loading data in " << primary_->name()
                  << ", trying " << fallback_->name() << std::endl;
        std::cerr << "[Loader] Error: " << e.what() << std::endl;
        profiles = fallback_->run(request);
        used_fallback = true;
    }

    LoadResult result = merge_profiles(std::move(profiles));
    result.used_fallback = used_fallback;
    return result;
}

TrackLoader make_track_loader(int num_workers, const ExtractorFactory& factory, bool verbose) {
    return TrackLoader(std::make_unique<ParallelLoadStrategy>(num_workers, factory, verbose),
                       std::make_unique<SequentialLoadStrategy>(factory, verbose),
                       verbose);
}

LoadResult merge_profiles(std::vector<TrackProfile> profiles) {
    LoadResult result;
    if (profiles.empty()) {
        return result;
    }

    result.regions = profiles.front().regions;
    result.tracks.reserve(profiles.size());
    for (auto& profile : profiles) {
        if (profile.regions.size() != result.regions.size()) {
            throw ExtractionError("Track " + profile.track_path + " reports " +
                                  std::to_string(profile.regions.size()) +
                                  " regions, expected " +
                                  std::to_string(result.regions.size()));
        }
        for (size_t i = 0; i < result.regions.size(); ++i) {
            if (profile.regions[i].label() != result.regions[i].label()) {
                throw ExtractionError("Track " + profile.track_path +
                                      " disagrees on region " + std::to_string(i) + ": " +
                                      profile.regions[i].label() + " vs " +
                                      result.regions[i].label());
            }
        }

        TrackSignal signal;
        signal.name = derive_track_name(profile.track_path);
        signal.path = std::move(profile.track_path);
        signal.values = std::move(profile.values);
        result.tracks.push_back(std::move(signal));
    }
    return result;
}

}  // namespace covtable
