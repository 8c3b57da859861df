#ifndef COVTABLE_INTERVAL_TRACK_H
#define COVTABLE_INTERVAL_TRACK_H

#include "signal_extractor.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace covtable {

struct TrackInterval {
    int64_t start = 0;
    int64_t end = 0;
    double value = 1.0;
    char strand = '.';
};

/**
 * IntervalIndex: per-chromosome sorted intervals with half-open overlap
 * queries. Built once per track, read-only afterwards.
 */
class IntervalIndex {
public:
    void add(const std::string& chrom, const TrackInterval& interval);

    // Sorts every chromosome; call once after the last add()
    void finalize(bool collapse_duplicates);

    size_t size() const { return total_; }

    int64_t count_overlaps(const std::string& chrom, int64_t start, int64_t end) const;

    // sum(value * overlapping bp) over [start, end)
    double weighted_sum(const std::string& chrom, int64_t start, int64_t end) const;

private:
    struct ChromIntervals {
        std::vector<TrackInterval> intervals;
        int64_t max_length = 0;
    };

    template <typename Visitor>
    void visit_overlaps(const std::string& chrom, int64_t start, int64_t end,
                        Visitor&& visitor) const;

    std::unordered_map<std::string, ChromIntervals> chroms_;
    size_t total_ = 0;
};

/**
 * Load a BED or bedGraph file (plain or compressed) into an index.
 * bedGraph takes its value from column 4; BED intervals count 1 and keep
 * the strand from column 6 when present.
 */
IntervalIndex load_interval_index(const std::string& path, bool is_bedgraph,
                                  bool collapse_duplicates);

std::unique_ptr<SignalExtractor> make_interval_signal_extractor(
    const std::string& bed_path,
    const ExtractionOptions& options);

std::unique_ptr<SignalExtractor> make_bedgraph_signal_extractor(
    const std::string& bedgraph_path,
    const ExtractionOptions& options);

}  // namespace covtable

#endif  // COVTABLE_INTERVAL_TRACK_H
