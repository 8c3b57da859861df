#ifndef COVTABLE_TABLE_WRITER_H
#define COVTABLE_TABLE_WRITER_H

#include "coverage_table.h"
#include "signal_table.h"

#include <ostream>

namespace covtable {

constexpr int kValuePrecision = 5;

// '#'-prefixed description of the run, one setting per line
void write_metadata_header(std::ostream& out, const CoverageTableConfig& config);

// Header row of track names, then one tab-separated row per region
void write_table(std::ostream& out, const SignalTable& table);

}  // namespace covtable

#endif  // COVTABLE_TABLE_WRITER_H
