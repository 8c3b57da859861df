#ifndef COVTABLE_CLI_ARGS_H
#define COVTABLE_CLI_ARGS_H

#include "coverage_table.h"

#include <stdexcept>
#include <string>

namespace covtable {
namespace cli {

/**
 * ParseArgsExit: parsing stopped and the process should exit.
 * exit_code 0 after --help/--version, 1 for usage errors.
 */
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

void print_version();

void print_usage(const char* program_name);

// Fill a CoverageTableConfig from argv; throws ParseArgsExit
CoverageTableConfig parse_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace covtable

#endif  // COVTABLE_CLI_ARGS_H
