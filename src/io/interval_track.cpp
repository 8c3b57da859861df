#include "interval_track.h"
#include "errors.h"
#include "hts_handles.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include <htslib/hts.h>
#include <htslib/kstring.h>

namespace covtable {
namespace {

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> fields;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == '\t' || line[i] == ' ' || line[i] == '\r')) ++i;
        if (i >= line.size()) break;
        size_t j = i;
        while (j < line.size() && line[j] != '\t' && line[j] != ' ' && line[j] != '\r') ++j;
        fields.push_back(line.substr(i, j - i));
        i = j;
    }
    return fields;
}

bool parse_int(const std::string& s, int64_t& value) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    value = static_cast<int64_t>(v);
    return true;
}

bool parse_double(const std::string& s, double& value) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    value = v;
    return true;
}

bool is_header_line(const std::string& line) {
    return line.empty() || line[0] == '#' ||
           line.rfind("track", 0) == 0 || line.rfind("browser", 0) == 0;
}

class IndexedIntervalExtractor final : public SignalExtractor {
public:
    IndexedIntervalExtractor(std::string path, ExtractionOptions options, bool is_bedgraph)
        : path_(std::move(path)), options_(options), is_bedgraph_(is_bedgraph) {
        index_ = load_interval_index(path_, is_bedgraph_,
                                     !is_bedgraph_ && options_.remove_duplicates);
    }

    const std::string& track_path() const override { return path_; }

    std::vector<double> extract(const std::vector<Region>& regions) override {
        std::vector<double> values;
        values.reserve(regions.size());
        for (const auto& region : regions) {
            const int64_t start = region.window_start(options_.window);
            const int64_t end = region.window_end(options_.window);
            if (!is_bedgraph_) {
                values.push_back(static_cast<double>(
                    index_.count_overlaps(region.chrom, start, end)));
                continue;
            }
            const int64_t width = end - start;
            values.push_back(width > 0
                ? index_.weighted_sum(region.chrom, start, end) / static_cast<double>(width)
                : 0.0);
        }
        return values;
    }

private:
    std::string path_;
    ExtractionOptions options_;
    bool is_bedgraph_ = false;
    IntervalIndex index_;
};

}  // namespace

void IntervalIndex::add(const std::string& chrom, const TrackInterval& interval) {
    chroms_[chrom].intervals.push_back(interval);
    ++total_;
}

void IntervalIndex::finalize(bool collapse_duplicates) {
    total_ = 0;
    for (auto& entry : chroms_) {
        auto& intervals = entry.second.intervals;
        std::sort(intervals.begin(), intervals.end(),
            [](const TrackInterval& a, const TrackInterval& b) {
                if (a.start != b.start) return a.start < b.start;
                if (a.end != b.end) return a.end < b.end;
                return a.strand < b.strand;
            });

        if (collapse_duplicates) {
            intervals.erase(std::unique(intervals.begin(), intervals.end(),
                [](const TrackInterval& a, const TrackInterval& b) {
                    return a.start == b.start && a.end == b.end && a.strand == b.strand;
                }), intervals.end());
        }

        int64_t max_length = 0;
        for (const auto& iv : intervals) {
            max_length = std::max(max_length, iv.end - iv.start);
        }
        entry.second.max_length = max_length;
        total_ += intervals.size();
    }
}

template <typename Visitor>
void IntervalIndex::visit_overlaps(const std::string& chrom, int64_t start, int64_t end,
                                   Visitor&& visitor) const {
    if (end <= start) return;
    auto it = chroms_.find(chrom);
    if (it == chroms_.end()) return;

    const auto& intervals = it->second.intervals;
    const int64_t reach = it->second.max_length;

    // first interval starting at or after `end` can no longer overlap
    auto upper = std::lower_bound(intervals.begin(), intervals.end(), end,
        [](const TrackInterval& iv, int64_t pos) { return iv.start < pos; });

    while (upper != intervals.begin()) {
        --upper;
        if (upper->start + reach <= start) break;
        // empty [s, s) records overlap nothing
        if (upper->end > start && upper->end > upper->start) {
            visitor(*upper);
        }
    }
}

int64_t IntervalIndex::count_overlaps(const std::string& chrom, int64_t start,
                                      int64_t end) const {
    int64_t count = 0;
    visit_overlaps(chrom, start, end, [&count](const TrackInterval&) { ++count; });
    return count;
}

double IntervalIndex::weighted_sum(const std::string& chrom, int64_t start,
                                   int64_t end) const {
    double sum = 0.0;
    visit_overlaps(chrom, start, end, [&](const TrackInterval& iv) {
        const int64_t overlap = std::min(end, iv.end) - std::max(start, iv.start);
        sum += iv.value * static_cast<double>(overlap);
    });
    return sum;
}

IntervalIndex load_interval_index(const std::string& path, bool is_bedgraph,
                                  bool collapse_duplicates) {
    HtsFilePtr fp(hts_open(path.c_str(), "r"));
    if (!fp) {
        throw ExtractionError("Failed to open track: " + path);
    }

    IntervalIndex index;
    KStringBuffer str;
    int64_t line_no = 0;
    int ret;
    while ((ret = hts_getline(fp.get(), KS_SEP_LINE, str.get())) >= 0) {
        ++line_no;
        const std::string line(str.data(), str.size());
        if (is_header_line(line)) continue;

        const auto fields = split_whitespace(line);
        if (fields.empty()) continue;

        TrackInterval iv;
        const size_t required = is_bedgraph ? 4 : 3;
        bool ok = fields.size() >= required &&
                  parse_int(fields[1], iv.start) &&
                  parse_int(fields[2], iv.end) &&
                  iv.start >= 0 && iv.end >= iv.start;
        if (ok && is_bedgraph) {
            ok = parse_double(fields[3], iv.value);
        }
        if (!ok) {
            throw ExtractionError("Malformed record at " + path + ":" +
                                  std::to_string(line_no));
        }
        if (!is_bedgraph && fields.size() >= 6 && fields[5].size() == 1) {
            iv.strand = fields[5][0];
        }
        index.add(fields[0], iv);
    }
    if (ret < -1) {
        throw ExtractionError("Read error in track: " + path);
    }

    index.finalize(collapse_duplicates);
    return index;
}

std::unique_ptr<SignalExtractor> make_interval_signal_extractor(
    const std::string& bed_path,
    const ExtractionOptions& options) {
    return std::make_unique<IndexedIntervalExtractor>(bed_path, options, false);
}

std::unique_ptr<SignalExtractor> make_bedgraph_signal_extractor(
    const std::string& bedgraph_path,
    const ExtractionOptions& options) {
    return std::make_unique<IndexedIntervalExtractor>(bedgraph_path, options, true);
}

}  // namespace covtable
