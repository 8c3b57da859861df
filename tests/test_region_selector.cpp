#include <algorithm>
#include <cassert>
#include <cmath>
#include <exception>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "region_selector.h"
#include "signal_table.h"
#include "test_path_utils.h"

using namespace covtable;
using covtable_test::near;

namespace {

// rows given row-major for readability
SignalTable make_table(const std::vector<std::vector<double>>& rows) {
    std::vector<Region> regions(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        regions[i].chrom = "chr1";
        regions[i].start = static_cast<int64_t>(i * 100);
        regions[i].end = static_cast<int64_t>(i * 100 + 50);
    }
    std::vector<TrackSignal> tracks(rows.front().size());
    for (size_t c = 0; c < tracks.size(); ++c) {
        tracks[c].name = "track" + std::to_string(c + 1);
        for (const auto& row : rows) {
            tracks[c].values.push_back(row[c]);
        }
    }
    return assemble_table(regions, std::move(tracks));
}

}  // namespace

void test_parse_method() {
    std::cout << "Testing parse_top_method..." << std::endl;

    assert(parse_top_method("var") == TopMethod::kVar);
    assert(parse_top_method("std") == TopMethod::kStd);
    assert(parse_top_method("mean") == TopMethod::kMean);
    assert(parse_top_method("random") == TopMethod::kRandom);
    assert(std::string(top_method_name(TopMethod::kStd)) == "std");

    bool threw = false;
    try {
        parse_top_method("bogus");
    } catch (const ConfigError& e) {
        threw = std::string(e.what()).find("bogus") != std::string::npos;
    }
    assert(threw);

    std::cout << "  parse_top_method tests passed!" << std::endl;
}

void test_top_mean() {
    std::cout << "Testing top by mean..." << std::endl;

    // track1 [1,2,3], track2 [4,5,6]: row means 2.5, 3.5, 4.5
    auto table = make_table({{1, 4}, {2, 5}, {3, 6}});
    SelectParams params;
    params.top = 1;
    params.method = TopMethod::kMean;
    select_regions(table, params);

    assert(table.num_rows() == 1);
    assert(table.row_labels()[0] == "chr1:200-250");
    assert(table.at(0, 0) == 3 && table.at(0, 1) == 6);

    std::cout << "  Top by mean tests passed!" << std::endl;
}

void test_top_var_and_std() {
    std::cout << "Testing top by var/std..." << std::endl;

    const std::vector<std::vector<double>> rows = {
        {0, 10}, {5, 5}, {1, 3}, {0, 20}, {2, 2},
    };
    const auto table = make_table(rows);

    const auto var = row_statistic(table, TopMethod::kVar);
    assert(near(var[0], 50.0));   // sample variance of {0, 10}
    assert(near(var[1], 0.0));
    const auto sd = row_statistic(table, TopMethod::kStd);
    assert(near(sd[2], std::sqrt(2.0)));

    for (TopMethod method : {TopMethod::kVar, TopMethod::kStd}) {
        SelectParams params;
        params.top = 2;
        params.method = method;
        const auto keep = select_top_rows(table, params);
        assert(keep.size() == 2);
        // ascending key order, highest last
        assert(keep[0] == 0);
        assert(keep[1] == 3);

        // every kept key >= every dropped key
        const auto keys = row_statistic(table, method);
        double min_kept = keys[keep[0]];
        for (size_t k : keep) min_kept = std::min(min_kept, keys[k]);
        for (size_t r = 0; r < keys.size(); ++r) {
            if (std::find(keep.begin(), keep.end(), r) == keep.end()) {
                assert(keys[r] <= min_kept);
            }
        }
    }

    std::cout << "  Top by var/std tests passed!" << std::endl;
}

void test_ties_keep_source_order() {
    std::cout << "Testing tie handling..." << std::endl;

    // rows 1, 2 and 3 share the highest mean
    const auto table = make_table({{0, 0}, {1, 1}, {2, 0}, {0, 2}});
    SelectParams params;
    params.top = 2;
    params.method = TopMethod::kMean;
    const auto keep = select_top_rows(table, params);
    // stable ascending sort puts tied rows in source order; the tail is 2, 3
    assert(keep.size() == 2);
    assert(keep[0] == 2);
    assert(keep[1] == 3);

    std::cout << "  Tie handling tests passed!" << std::endl;
}

void test_top_larger_than_table() {
    std::cout << "Testing top larger than table..." << std::endl;

    auto table = make_table({{1, 2}, {3, 4}});
    SelectParams params;
    params.top = 10;
    params.method = TopMethod::kVar;
    select_regions(table, params);
    assert(table.num_rows() == 2);

    auto sampled = make_table({{1, 2}, {3, 4}});
    params.method = TopMethod::kRandom;
    bool threw = false;
    try {
        select_regions(sampled, params);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Oversized top tests passed!" << std::endl;
}

void test_random() {
    std::cout << "Testing random selection..." << std::endl;

    std::vector<std::vector<double>> rows;
    for (int i = 0; i < 50; ++i) {
        rows.push_back({static_cast<double>(i), static_cast<double>(100 + i)});
    }
    const auto original = make_table(rows);

    SelectParams params;
    params.top = 10;
    params.method = TopMethod::kRandom;
    params.seed = 7;

    auto table = original;
    select_regions(table, params);
    assert(table.num_rows() == 10);

    // distinct rows, values copied from the source row
    std::set<std::string> labels(table.row_labels().begin(), table.row_labels().end());
    assert(labels.size() == 10);
    for (size_t r = 0; r < table.num_rows(); ++r) {
        const double v = table.at(r, 0);
        const size_t src = static_cast<size_t>(v);
        assert(original.row_labels()[src] == table.row_labels()[r]);
        assert(table.at(r, 1) == 100 + v);
    }

    // same seed, same sample
    auto again = original;
    select_regions(again, params);
    assert(again.row_labels() == table.row_labels());

    std::cout << "  Random selection tests passed!" << std::endl;
}

void test_disabled() {
    std::cout << "Testing top = 0..." << std::endl;

    auto table = make_table({{1, 2}, {3, 4}, {5, 6}});
    SelectParams params;
    params.method = TopMethod::kRandom;
    select_regions(table, params);
    assert(table.num_rows() == 3);
    assert(table.row_labels()[0] == "chr1:0-50");

    std::cout << "  top = 0 tests passed!" << std::endl;
}

int main() {
    std::cout << "=== RegionSelector Tests ===" << std::endl;

    try {
        test_parse_method();
        test_top_mean();
        test_top_var_and_std();
        test_ties_keep_source_order();
        test_top_larger_than_table();
        test_random();
        test_disabled();

        std::cout << "\n=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
