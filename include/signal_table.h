#ifndef COVTABLE_SIGNAL_TABLE_H
#define COVTABLE_SIGNAL_TABLE_H

#include "region.h"

#include <cstddef>
#include <string>
#include <vector>

namespace covtable {

// One column of the table before assembly
struct TrackSignal {
    std::string name;
    std::string path;
    std::vector<double> values;
};

/**
 * SignalTable: regions x tracks matrix, stored column-major.
 * Rows keep the region order they were assembled with until a selection
 * reorders them.
 */
class SignalTable {
public:
    SignalTable() = default;

    size_t num_rows() const { return row_labels_.size(); }
    size_t num_columns() const { return column_names_.size(); }

    const std::vector<std::string>& row_labels() const { return row_labels_; }
    const std::vector<std::string>& column_names() const { return column_names_; }

    double at(size_t row, size_t col) const { return columns_[col][row]; }
    double& at(size_t row, size_t col) { return columns_[col][row]; }

    const std::vector<double>& column(size_t col) const { return columns_[col]; }
    std::vector<double>& column(size_t col) { return columns_[col]; }

    std::vector<double> row_values(size_t row) const;

    // Index of the named column, or -1
    int find_column(const std::string& name) const;

    // Keep only `rows`, in the given order
    void keep_rows(const std::vector<size_t>& rows);

private:
    friend SignalTable assemble_table(const std::vector<Region>& regions,
                                      std::vector<TrackSignal> tracks);

    std::vector<std::string> row_labels_;
    std::vector<std::string> column_names_;
    std::vector<std::vector<double>> columns_;
};

/**
 * Build the table: one column per track, one row per region.
 * Throws TableError on duplicate track names or a vector whose length
 * differs from the region count.
 */
SignalTable assemble_table(const std::vector<Region>& regions,
                           std::vector<TrackSignal> tracks);

}  // namespace covtable

#endif  // COVTABLE_SIGNAL_TABLE_H
