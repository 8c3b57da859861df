#include <cassert>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <htslib/kstring.h>
#include <htslib/sam.h>

#include "bam_io.h"
#include "errors.h"
#include "signal_extractor.h"
#include "test_path_utils.h"

using namespace covtable;

namespace {

const char* kHeader =
    "@HD\tVN:1.6\tSO:coordinate\n"
    "@SQ\tSN:chr1\tLN:10000\n";

// Coordinate-sorted. Region chr1:100-200 with window 200 covers [50, 250).
const std::vector<std::string> kRecords = {
    "r1\t0\tchr1\t101\t60\t10M\t*\t0\t0\tACGTACGTAC\t*",
    "r2\t0\tchr1\t101\t60\t10M\t*\t0\t0\tACGTACGTAC\t*",     // same 5' end as r1
    "r3\t16\tchr1\t121\t60\t10M\t*\t0\t0\tACGTACGTAC\t*",    // reverse strand
    "r4\t1024\tchr1\t141\t60\t10M\t*\t0\t0\tACGTACGTAC\t*",  // duplicate flag
    "r5\t0\tchr1\t161\t0\t10M\t*\t0\t0\tACGTACGTAC\t*",      // mapq 0
    "r6\t512\tchr1\t171\t60\t10M\t*\t0\t0\tACGTACGTAC\t*",   // QC fail
    "r7\t256\tchr1\t181\t60\t10M\t*\t0\t0\tACGTACGTAC\t*",   // secondary
    "r8\t4\tchr1\t191\t0\t*\t*\t0\t0\tACGTACGTAC\t*",        // unmapped
    "r9\t0\tchr1\t1001\t60\t10M\t*\t0\t0\tACGTACGTAC\t*",
};

bool write_test_bam(const std::string& path) {
    sam_hdr_t* hdr = sam_hdr_parse(std::string(kHeader).size(), kHeader);
    if (!hdr) return false;

    htsFile* out = hts_open(path.c_str(), "wb");
    if (!out) {
        sam_hdr_destroy(hdr);
        return false;
    }

    bool ok = sam_hdr_write(out, hdr) == 0;
    bam1_t* b = bam_init1();
    kstring_t line = {0, 0, nullptr};
    for (const auto& record : kRecords) {
        if (!ok) break;
        line.l = 0;
        kputs(record.c_str(), &line);
        ok = sam_parse1(&line, hdr, b) >= 0 && sam_write1(out, hdr, b) >= 0;
    }
    free(line.s);
    bam_destroy1(b);
    sam_hdr_destroy(hdr);
    return hts_close(out) == 0 && ok;
}

std::vector<Region> test_regions() {
    std::vector<Region> regions(3);
    regions[0].chrom = "chr1"; regions[0].start = 100; regions[0].end = 200;
    regions[1].chrom = "chr1"; regions[1].start = 1000; regions[1].end = 1010;
    regions[2].chrom = "chr2"; regions[2].start = 100; regions[2].end = 200;  // not in header
    return regions;
}

std::vector<double> extract_with(const std::string& bam, bool rmdup, bool rmlowq) {
    ExtractionOptions options;
    options.window = 200;
    options.remove_duplicates = rmdup;
    options.remove_low_quality = rmlowq;
    auto extractor = make_signal_extractor(bam, options);
    return extractor->extract(test_regions());
}

}  // namespace

void test_index_creation(const std::string& bam) {
    std::cout << "Testing index creation..." << std::endl;

    assert(!has_alignment_index(bam));

    bool threw = false;
    try {
        make_bam_signal_extractor(bam, ExtractionOptions());
    } catch (const ExtractionError&) {
        threw = true;
    }
    assert(threw);

    assert(ensure_alignment_index(bam));
    assert(std::filesystem::exists(bam + ".bai"));
    assert(has_alignment_index(bam));
    // second call finds the existing index
    assert(!ensure_alignment_index(bam));

    std::cout << "  Index creation tests passed!" << std::endl;
}

void test_read_filters(const std::string& bam) {
    std::cout << "Testing read filters..." << std::endl;

    auto values = extract_with(bam, true, true);
    assert(values.size() == 3);
    std::cout << "  default counts: " << values[0] << ", " << values[1]
              << ", " << values[2] << std::endl;
    assert(values[0] == 2.0);  // r1, r3
    assert(values[1] == 1.0);  // r9
    assert(values[2] == 0.0);

    values = extract_with(bam, false, true);
    assert(values[0] == 4.0);  // r1, r2, r3, r4

    values = extract_with(bam, true, false);
    assert(values[0] == 4.0);  // r1, r3, r5, r6

    values = extract_with(bam, false, false);
    assert(values[0] == 6.0);

    std::cout << "  Read filter tests passed!" << std::endl;
}

void test_read_view() {
    std::cout << "Testing ReadView..." << std::endl;

    const ReadView empty(nullptr);
    assert(empty.tid() == -1);
    assert(empty.flag() == 0);
    assert(!empty.is_reverse());

    sam_hdr_t* hdr = sam_hdr_parse(std::string(kHeader).size(), kHeader);
    assert(hdr != nullptr);
    BamRecordPtr b(bam_init1());
    kstring_t line = {0, 0, nullptr};
    kputs(kRecords[2].c_str(), &line);
    assert(sam_parse1(&line, hdr, b.get()) >= 0);
    free(line.s);
    sam_hdr_destroy(hdr);

    const ReadView read(b.get());
    assert(read.tid() == 0);
    assert(read.pos() == 120);
    assert(read.end_pos() == 130);
    assert(read.is_reverse());
    assert(read.five_prime() == 130);
    assert(read.mapq() == 60);

    ExtractionOptions options;
    assert(passes_read_filters(read, options));

    std::cout << "  ReadView tests passed!" << std::endl;
}

int main() {
    std::cout << "=== BAM I/O Tests ===" << std::endl;

    try {
        const auto dir = covtable_test::make_temp_dir("covtable_test_bam");
        const std::string bam = dir + "/reads.bam";
        if (!write_test_bam(bam)) {
            std::cerr << "Test failed: cannot write " << bam << std::endl;
            return 1;
        }

        test_index_creation(bam);
        test_read_filters(bam);
        test_read_view();

        std::cout << "\n=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
