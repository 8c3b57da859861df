#ifndef COVTABLE_BAM_IO_H
#define COVTABLE_BAM_IO_H

#include "signal_extractor.h"

#include <cstdint>
#include <memory>
#include <string>

#include <htslib/sam.h>

namespace covtable {

struct BamRecordDeleter {
    void operator()(bam1_t* b) const {
        if (b != nullptr) {
            bam_destroy1(b);
        }
    }
};

using BamRecordPtr = std::unique_ptr<bam1_t, BamRecordDeleter>;

class ReadView {
public:
    explicit ReadView(const bam1_t* record) : record_(record) {}

    const bam1_t* raw() const { return record_; }

    int32_t tid() const;
    int64_t pos() const;
    int64_t end_pos() const;
    int32_t mapq() const;
    uint16_t flag() const;
    bool is_reverse() const;

    // Reference coordinate of the read's 5' end
    int64_t five_prime() const;

private:
    const bam1_t* record_ = nullptr;
};

// Unmapped and secondary reads never count; the rest depends on options.
bool passes_read_filters(const ReadView& read, const ExtractionOptions& options);

// True when htslib can load an index (.bai/.csi/.crai) for the file.
bool has_alignment_index(const std::string& path);

/**
 * Build the index next to the alignment file when it is missing.
 * @return true if an index was created, false if one already existed
 * Throws InputError when htslib cannot build it.
 */
bool ensure_alignment_index(const std::string& path);

std::unique_ptr<SignalExtractor> make_bam_signal_extractor(
    const std::string& bam_path,
    const ExtractionOptions& options);

}  // namespace covtable

#endif  // COVTABLE_BAM_IO_H
