#include "bam_io.h"
#include "errors.h"
#include "hts_handles.h"

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <htslib/hts.h>
#include <htslib/sam.h>

namespace covtable {
namespace {

struct HeaderDeleter {
    void operator()(sam_hdr_t* h) const {
        if (h != nullptr) {
            sam_hdr_destroy(h);
        }
    }
};

struct IndexDeleter {
    void operator()(hts_idx_t* idx) const {
        if (idx != nullptr) {
            hts_idx_destroy(idx);
        }
    }
};

struct IteratorDeleter {
    void operator()(hts_itr_t* itr) const {
        if (itr != nullptr) {
            hts_itr_destroy(itr);
        }
    }
};

using HeaderPtr = std::unique_ptr<sam_hdr_t, HeaderDeleter>;
using IndexPtr = std::unique_ptr<hts_idx_t, IndexDeleter>;
using IteratorPtr = std::unique_ptr<hts_itr_t, IteratorDeleter>;

class HtslibBamSignalExtractor final : public SignalExtractor {
public:
    HtslibBamSignalExtractor(std::string bam_path, ExtractionOptions options)
        : bam_path_(std::move(bam_path)), options_(options) {
        file_.reset(hts_open(bam_path_.c_str(), "r"));
        if (!file_) {
            throw ExtractionError("Failed to open alignment file: " + bam_path_);
        }

        header_.reset(sam_hdr_read(file_.get()));
        if (!header_) {
            throw ExtractionError("Failed to read alignment header: " + bam_path_);
        }

        index_.reset(sam_index_load(file_.get(), bam_path_.c_str()));
        if (!index_) {
            throw ExtractionError("Failed to load index for: " + bam_path_);
        }
    }

    const std::string& track_path() const override { return bam_path_; }

    std::vector<double> extract(const std::vector<Region>& regions) override {
        std::vector<double> values;
        values.reserve(regions.size());

        BamRecordPtr record(bam_init1());
        if (!record) {
            throw ExtractionError("Failed to allocate BAM record");
        }

        for (const auto& region : regions) {
            values.push_back(static_cast<double>(count_reads(region, record.get())));
        }
        return values;
    }

private:
    int64_t count_reads(const Region& region, bam1_t* record) {
        const int tid = sam_hdr_name2tid(header_.get(), region.chrom.c_str());
        if (tid == -2) {
            throw ExtractionError("Corrupt header in " + bam_path_);
        }
        if (tid < 0) {
            // contig absent from this track: no coverage
            return 0;
        }

        const hts_pos_t beg = region.window_start(options_.window);
        const hts_pos_t end = region.window_end(options_.window);
        IteratorPtr itr(sam_itr_queryi(index_.get(), tid, beg, end));
        if (!itr) {
            throw ExtractionError("Failed to query " + region.label() + " in " + bam_path_);
        }

        // (5' position, strand) of reads already counted in this window
        std::set<std::pair<int64_t, bool>> seen;
        int64_t count = 0;
        int ret;
        while ((ret = sam_itr_next(file_.get(), itr.get(), record)) >= 0) {
            const ReadView read(record);
            if (!passes_read_filters(read, options_)) {
                continue;
            }
            if (options_.remove_duplicates &&
                !seen.emplace(read.five_prime(), read.is_reverse()).second) {
                continue;
            }
            ++count;
        }

        if (ret < -1) {
            throw ExtractionError("Truncated or corrupt alignment data in " + bam_path_ +
                                  " at " + region.label());
        }
        return count;
    }

    std::string bam_path_;
    ExtractionOptions options_;
    HtsFilePtr file_;
    HeaderPtr header_;
    IndexPtr index_;
};

}  // namespace

int32_t ReadView::tid() const {
    return record_ ? record_->core.tid : -1;
}

int64_t ReadView::pos() const {
    return record_ ? record_->core.pos : -1;
}

int64_t ReadView::end_pos() const {
    return record_ ? bam_endpos(record_) : -1;
}

int32_t ReadView::mapq() const {
    return record_ ? record_->core.qual : 0;
}

uint16_t ReadView::flag() const {
    return record_ ? record_->core.flag : 0;
}

bool ReadView::is_reverse() const {
    return record_ && bam_is_rev(record_);
}

int64_t ReadView::five_prime() const {
    return is_reverse() ? end_pos() : pos();
}

bool passes_read_filters(const ReadView& read, const ExtractionOptions& options) {
    const uint16_t flag = read.flag();
    if (flag & (BAM_FUNMAP | BAM_FSECONDARY)) {
        return false;
    }
    if (options.remove_duplicates && (flag & BAM_FDUP)) {
        return false;
    }
    if (options.remove_low_quality) {
        if (flag & BAM_FQCFAIL) return false;
        if (read.mapq() == 0) return false;
    }
    return true;
}

bool has_alignment_index(const std::string& path) {
    HtsFilePtr fp(hts_open(path.c_str(), "r"));
    if (!fp) {
        return false;
    }
    IndexPtr idx(sam_index_load(fp.get(), path.c_str()));
    return idx != nullptr;
}

bool ensure_alignment_index(const std::string& path) {
    if (has_alignment_index(path)) {
        return false;
    }

    std::cerr << "[BAM_IO] Data file '" << path
              << "' does not have an index file. Creating an index file for "
              << path << '\n';
    const int rc = sam_index_build(path.c_str(), 0);
    if (rc != 0) {
        throw InputError("Failed to create index for " + path +
                         " (htslib error " + std::to_string(rc) + ")");
    }
    return true;
}

std::unique_ptr<SignalExtractor> make_bam_signal_extractor(
    const std::string& bam_path,
    const ExtractionOptions& options) {
    return std::make_unique<HtslibBamSignalExtractor>(bam_path, options);
}

}  // namespace covtable
