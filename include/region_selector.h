#ifndef COVTABLE_REGION_SELECTOR_H
#define COVTABLE_REGION_SELECTOR_H

#include "signal_table.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace covtable {

enum class TopMethod {
    kVar,
    kStd,
    kMean,
    kRandom
};

constexpr uint64_t kDefaultSelectionSeed = 42;

struct SelectParams {
    size_t top = 0;  // 0 keeps every row
    TopMethod method = TopMethod::kVar;
    uint64_t seed = kDefaultSelectionSeed;
};

// "var", "std", "mean" or "random"; anything else throws ConfigError
TopMethod parse_top_method(const std::string& name);

const char* top_method_name(TopMethod method);

/**
 * Per-row ranking key. var/std use the sample estimator (n - 1) and give
 * NaN for tables with fewer than two columns.
 */
std::vector<double> row_statistic(const SignalTable& table, TopMethod method);

/**
 * Rows to keep, in output order.
 * Ranking methods: stable ascending sort on the key, last `top` rows
 * (ties keep source order, NaN ranks lowest).
 * Random: `top` distinct rows drawn with std::mt19937_64(seed); throws
 * ConfigError when `top` exceeds the row count.
 */
std::vector<size_t> select_top_rows(const SignalTable& table, const SelectParams& params);

// Applies select_top_rows in place; no-op when params.top == 0
void select_regions(SignalTable& table, const SelectParams& params);

}  // namespace covtable

#endif  // COVTABLE_REGION_SELECTOR_H
