#ifndef COVTABLE_NORMALIZER_H
#define COVTABLE_NORMALIZER_H

#include "signal_table.h"

namespace covtable {

struct NormalizeParams {
    bool log_transform = false;
    bool scale = false;
};

// v -> log(1 + v) for every cell. Throws std::domain_error for v <= -1 or
// a non-finite v.
void log_transform(SignalTable& table);

/**
 * Per-column standardization: (v - mean) / sd, population sd.
 * Throws std::domain_error for a zero-variance column.
 */
void standardize_columns(SignalTable& table);

// Log transform first, then scaling
void normalize(SignalTable& table, const NormalizeParams& params);

}  // namespace covtable

#endif  // COVTABLE_NORMALIZER_H
