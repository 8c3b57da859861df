#include "region.h"
#include "errors.h"
#include "hts_handles.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <htslib/hts.h>
#include <htslib/kstring.h>

namespace covtable {
namespace {

bool parse_coordinate(const std::string& field, int64_t& value) {
    if (field.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(field.c_str(), &end, 10);
    if (errno != 0 || end == field.c_str() || *end != '\0') {
        return false;
    }
    value = static_cast<int64_t>(parsed);
    return true;
}

bool is_skippable(const std::string& line) {
    if (line.empty() || line[0] == '#') return true;
    if (line.rfind("track", 0) == 0 || line.rfind("browser", 0) == 0) return true;
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

std::string Region::label() const {
    return chrom + ":" + std::to_string(start) + "-" + std::to_string(end);
}

int64_t Region::window_start(int32_t window) const {
    const int64_t s = center() - window / 2;
    return s < 0 ? 0 : s;
}

int64_t Region::window_end(int32_t window) const {
    return center() + window / 2;
}

bool parse_region_line(const std::string& line, Region& region) {
    std::string fields[3];
    size_t field = 0;
    size_t begin = 0;
    while (field < 3) {
        const size_t tab = line.find('\t', begin);
        fields[field++] = line.substr(begin, tab == std::string::npos ? std::string::npos
                                                                      : tab - begin);
        if (tab == std::string::npos) break;
        begin = tab + 1;
    }
    if (field < 3 || fields[0].empty()) return false;

    // strip a trailing '\r' from files written on Windows
    if (!fields[2].empty() && fields[2].back() == '\r') fields[2].pop_back();

    int64_t start = 0;
    int64_t end = 0;
    if (!parse_coordinate(fields[1], start) || !parse_coordinate(fields[2], end)) {
        return false;
    }
    if (start < 0 || end <= start) return false;

    region.chrom = fields[0];
    region.start = start;
    region.end = end;
    return true;
}

std::vector<Region> load_regions(const std::string& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw InputError("Region file '" + path + "' does not exist");
    }

    HtsFilePtr fp(hts_open(path.c_str(), "r"));
    if (!fp) {
        throw InputError("Failed to open region file: " + path);
    }

    std::vector<Region> regions;
    KStringBuffer str;
    int64_t line_no = 0;
    int ret;
    while ((ret = hts_getline(fp.get(), KS_SEP_LINE, str.get())) >= 0) {
        ++line_no;
        const std::string line(str.data(), str.size());
        if (is_skippable(line)) continue;

        Region region;
        if (!parse_region_line(line, region)) {
            throw InputError("Malformed region at " + path + ":" +
                             std::to_string(line_no) + ": '" + line + "'");
        }
        regions.push_back(std::move(region));
    }
    if (ret < -1) {
        throw InputError("Read error in region file: " + path);
    }
    if (regions.empty()) {
        throw InputError("Region file '" + path + "' contains no regions");
    }
    return regions;
}

}  // namespace covtable
