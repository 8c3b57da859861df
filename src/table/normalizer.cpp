#include "normalizer.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace covtable {

void log_transform(SignalTable& table) {
    for (size_t c = 0; c < table.num_columns(); ++c) {
        auto& col = table.column(c);
        for (size_t r = 0; r < col.size(); ++r) {
            const double v = col[r];
            if (!(v > -1.0) || !std::isfinite(v)) {
                std::ostringstream oss;
                oss << "log transform undefined for value " << v << " in column '"
                    << table.column_names()[c] << "', row " << table.row_labels()[r];
                throw std::domain_error(oss.str());
            }
            col[r] = std::log1p(v);
        }
    }
}

void standardize_columns(SignalTable& table) {
    for (size_t c = 0; c < table.num_columns(); ++c) {
        auto& col = table.column(c);
        if (col.empty()) continue;

        // a constant column can still leave rounding noise in sd
        const double first = col.front();
        const bool constant = std::all_of(col.begin(), col.end(),
                                          [first](double v) { return v == first; });

        const double n = static_cast<double>(col.size());
        double sum = 0.0;
        for (double v : col) sum += v;
        const double mean = sum / n;

        double ss = 0.0;
        for (double v : col) ss += (v - mean) * (v - mean);
        const double sd = std::sqrt(ss / n);

        if (constant || !(sd > 0.0) || !std::isfinite(sd)) {
            throw std::domain_error("cannot scale column '" + table.column_names()[c] +
                                    "': zero variance");
        }

        for (double& v : col) {
            v = (v - mean) / sd;
        }
    }
}

void normalize(SignalTable& table, const NormalizeParams& params) {
    if (params.log_transform) {
        log_transform(table);
    }
    if (params.scale) {
        standardize_columns(table);
    }
}

}  // namespace covtable
