#include "signal_table.h"
#include "errors.h"

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace covtable {

std::vector<double> SignalTable::row_values(size_t row) const {
    std::vector<double> values;
    values.reserve(columns_.size());
    for (const auto& col : columns_) {
        values.push_back(col[row]);
    }
    return values;
}

int SignalTable::find_column(const std::string& name) const {
    for (size_t i = 0; i < column_names_.size(); ++i) {
        if (column_names_[i] == name) return static_cast<int>(i);
    }
    return -1;
}

void SignalTable::keep_rows(const std::vector<size_t>& rows) {
    std::vector<std::string> labels;
    labels.reserve(rows.size());
    for (size_t r : rows) {
        labels.push_back(row_labels_.at(r));
    }

    for (auto& col : columns_) {
        std::vector<double> kept;
        kept.reserve(rows.size());
        for (size_t r : rows) {
            kept.push_back(col[r]);
        }
        col.swap(kept);
    }
    row_labels_.swap(labels);
}

SignalTable assemble_table(const std::vector<Region>& regions,
                           std::vector<TrackSignal> tracks) {
    std::unordered_set<std::string> seen;
    for (const auto& track : tracks) {
        if (!seen.insert(track.name).second) {
            throw TableError("Duplicate track name '" + track.name +
                             "' (from " + track.path + "); rename one of the files");
        }
        if (track.values.size() != regions.size()) {
            throw TableError("Track '" + track.name + "' has " +
                             std::to_string(track.values.size()) + " values, expected " +
                             std::to_string(regions.size()));
        }
    }

    SignalTable table;
    table.row_labels_.reserve(regions.size());
    for (const auto& region : regions) {
        table.row_labels_.push_back(region.label());
    }

    table.column_names_.reserve(tracks.size());
    table.columns_.reserve(tracks.size());
    for (auto& track : tracks) {
        table.column_names_.push_back(std::move(track.name));
        table.columns_.push_back(std::move(track.values));
    }
    return table;
}

}  // namespace covtable
