#include "region_selector.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace covtable {
namespace {

double sample_variance(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) /
                        static_cast<double>(n);
    double ss = 0.0;
    for (double v : values) ss += (v - mean) * (v - mean);
    return ss / static_cast<double>(n - 1);
}

double row_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

// NaN sorts before every number
bool key_less(double a, double b) {
    if (std::isnan(a)) return !std::isnan(b);
    if (std::isnan(b)) return false;
    return a < b;
}

}  // namespace

TopMethod parse_top_method(const std::string& name) {
    if (name == "var") return TopMethod::kVar;
    if (name == "std") return TopMethod::kStd;
    if (name == "mean") return TopMethod::kMean;
    if (name == "random") return TopMethod::kRandom;
    throw ConfigError("unknown method " + name + " for selecting regions");
}

const char* top_method_name(TopMethod method) {
    switch (method) {
        case TopMethod::kVar: return "var";
        case TopMethod::kStd: return "std";
        case TopMethod::kMean: return "mean";
        case TopMethod::kRandom: return "random";
    }
    return "unknown";
}

std::vector<double> row_statistic(const SignalTable& table, TopMethod method) {
    std::vector<double> keys;
    keys.reserve(table.num_rows());
    for (size_t r = 0; r < table.num_rows(); ++r) {
        const auto values = table.row_values(r);
        switch (method) {
            case TopMethod::kVar:
                keys.push_back(sample_variance(values));
                break;
            case TopMethod::kStd:
                keys.push_back(std::sqrt(sample_variance(values)));
                break;
            case TopMethod::kMean:
                keys.push_back(row_mean(values));
                break;
            case TopMethod::kRandom:
                throw ConfigError("random selection has no row statistic");
        }
    }
    return keys;
}

std::vector<size_t> select_top_rows(const SignalTable& table, const SelectParams& params) {
    const size_t n = table.num_rows();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);

    if (params.method == TopMethod::kRandom) {
        if (params.top > n) {
            throw ConfigError("cannot sample " + std::to_string(params.top) +
                              " regions from a table of " + std::to_string(n));
        }
        // partial Fisher-Yates: the first `top` slots are the sample
        std::mt19937_64 rng(params.seed);
        for (size_t i = 0; i < params.top; ++i) {
            std::uniform_int_distribution<size_t> dist(i, n - 1);
            std::swap(order[i], order[dist(rng)]);
        }
        order.resize(params.top);
        return order;
    }

    const auto keys = row_statistic(table, params.method);
    std::stable_sort(order.begin(), order.end(),
        [&keys](size_t a, size_t b) { return key_less(keys[a], keys[b]); });

    const size_t keep = std::min(params.top, n);
    return std::vector<size_t>(order.end() - static_cast<std::ptrdiff_t>(keep), order.end());
}

void select_regions(SignalTable& table, const SelectParams& params) {
    if (params.top == 0) {
        return;
    }
    table.keep_rows(select_top_rows(table, params));
}

}  // namespace covtable
