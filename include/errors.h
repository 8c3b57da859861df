#ifndef COVTABLE_ERRORS_H
#define COVTABLE_ERRORS_H

#include <stdexcept>
#include <string>

namespace covtable {

// Bad parameter values (unknown top method, window <= 0, ...)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or unusable input files
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

// Track content could not be read, or tracks disagree on regions
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& what) : std::runtime_error(what) {}
};

// Track names or vector lengths inconsistent at assembly time
class TableError : public std::runtime_error {
public:
    explicit TableError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * WorkerPoolError: the worker pool itself could not be set up or could not
 * accept work. Never raised for a failing track.
 */
class WorkerPoolError : public std::runtime_error {
public:
    explicit WorkerPoolError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace covtable

#endif  // COVTABLE_ERRORS_H
