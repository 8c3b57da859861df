#include <cassert>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "signal_table.h"
#include "table_writer.h"

using namespace covtable;

namespace {

SignalTable scenario_table() {
    std::vector<Region> regions(2);
    regions[0].chrom = "chr1"; regions[0].start = 10; regions[0].end = 20;
    regions[1].chrom = "chr2"; regions[1].start = 30; regions[1].end = 40;

    std::vector<TrackSignal> tracks(2);
    tracks[0].name = "data/a";
    tracks[0].values = {1.0, 2.123456789};
    tracks[1].name = "data/b";
    tracks[1].values = {-0.5, 1e-7};
    return assemble_table(regions, std::move(tracks));
}

}  // namespace

void test_metadata_header() {
    std::cout << "Testing metadata header..." << std::endl;

    CoverageTableConfig config;
    config.peak_file = "peaks.bed";
    config.data_files = {"data/a.bam", "data/b.bam"};
    config.window = 500;
    config.log_transform = true;
    config.remove_low_quality = false;

    std::ostringstream out;
    write_metadata_header(out, config);
    const std::string text = out.str();

    assert(text.rfind("# Table created by covtable", 0) == 0);
    assert(text.find("# peakfile: peaks.bed\n") != std::string::npos);
    assert(text.find("# datafile: data/a.bam\n# datafile: data/b.bam\n") != std::string::npos);
    assert(text.find("# window: 500\n") != std::string::npos);
    assert(text.find("# duplicates: removed\n") != std::string::npos);
    assert(text.find("# repeats: included\n") != std::string::npos);
    assert(text.find("# log transform: yes\n") != std::string::npos);
    assert(text.find("# scale: no\n") != std::string::npos);
    assert(text.find("selected top") == std::string::npos);

    config.top = 1000;
    config.top_method = "std";
    std::ostringstream with_top;
    write_metadata_header(with_top, config);
    assert(with_top.str().find("# selected top 1000 regions using std\n") != std::string::npos);

    std::cout << "  Metadata header tests passed!" << std::endl;
}

void test_write_table() {
    std::cout << "Testing write_table..." << std::endl;

    std::ostringstream out;
    write_table(out, scenario_table());
    const std::string expected =
        "\tdata/a\tdata/b\n"
        "chr1:10-20\t1.00000\t-0.50000\n"
        "chr2:30-40\t2.12346\t0.00000\n";
    assert(out.str() == expected);

    // stream formatting is restored
    out << 0.25;
    assert(out.str().substr(expected.size()) == "0.25");

    std::cout << "  write_table tests passed!" << std::endl;
}

int main() {
    std::cout << "=== TableWriter Tests ===" << std::endl;

    try {
        test_metadata_header();
        test_write_table();

        std::cout << "\n=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
