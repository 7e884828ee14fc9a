#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Unrecoverable failure: the host must not keep calling into the affected
// partition (protocol violations, failed recovery, conflicting archive state)
class ArchiverError : public std::runtime_error {
public:
    explicit ArchiverError(const std::string& message) : std::runtime_error(message) {}
};

// Transient failure: committed state is untouched and the same call may be retried
class RetriableError : public ArchiverError {
public:
    explicit RetriableError(const std::string& message) : ArchiverError(message) {}
};

#endif // ERRORS_HPP
