#ifndef COVTABLE_REGION_H
#define COVTABLE_REGION_H

#include <cstdint>
#include <string>
#include <vector>

namespace covtable {

/**
 * Region: one peak from the region file.
 * Coordinates are kept exactly as written (0-based, half-open BED).
 */
struct Region {
    std::string chrom;
    int64_t start = 0;
    int64_t end = 0;

    std::string label() const;

    int64_t center() const { return (start + end) / 2; }

    // Extraction window [center - half, center + half), clamped at 0
    int64_t window_start(int32_t window) const;
    int64_t window_end(int32_t window) const;
};

/**
 * Parse a BED-like region file (plain or gzip/bgzip).
 * Skips blank, '#', "track" and "browser" lines.
 * Throws InputError on a missing file, a malformed line or an empty set.
 */
std::vector<Region> load_regions(const std::string& path);

// Parse one data line; returns false on malformed input.
bool parse_region_line(const std::string& line, Region& region);

}  // namespace covtable

#endif  // COVTABLE_REGION_H
