#include "table_writer.h"

#include <iomanip>
#include <ostream>

namespace covtable {

void write_metadata_header(std::ostream& out, const CoverageTableConfig& config) {
    out << "# Table created by " << kToolName << " (version " << kToolVersion << ")\n";
    out << "# Input data\n";
    out << "# peakfile: " << config.peak_file << "\n";
    for (const auto& path : config.data_files) {
        out << "# datafile: " << path << "\n";
    }
    out << "# window: " << config.window << "\n";
    out << "# duplicates: " << (config.remove_duplicates ? "removed" : "included") << "\n";
    out << "# repeats: " << (config.remove_low_quality ? "removed" : "included") << "\n";
    out << "# log transform: " << (config.log_transform ? "yes" : "no") << "\n";
    out << "# scale: " << (config.scale ? "yes" : "no") << "\n";
    if (config.top > 0) {
        out << "# selected top " << config.top << " regions using "
            << config.top_method << "\n";
    }
}

void write_table(std::ostream& out, const SignalTable& table) {
    for (const auto& name : table.column_names()) {
        out << '\t' << name;
    }
    out << '\n';

    const auto flags = out.flags();
    const auto precision = out.precision();
    out << std::fixed << std::setprecision(kValuePrecision);
    for (size_t r = 0; r < table.num_rows(); ++r) {
        out << table.row_labels()[r];
        for (size_t c = 0; c < table.num_columns(); ++c) {
            out << '\t' << table.at(r, c);
        }
        out << '\n';
    }
    out.flags(flags);
    out.precision(precision);
}

}  // namespace covtable
