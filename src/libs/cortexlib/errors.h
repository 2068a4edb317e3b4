#ifndef CORTEXLIB_ERRORS_H
#define CORTEXLIB_ERRORS_H

#include <stdexcept>
#include <string>
#include <cstddef>
#include "types.h"

namespace cortexlib {

class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

class IntakeError : public std::runtime_error {
public:
    explicit IntakeError(const std::string& message) : std::runtime_error(message) {}
};

class StorageExhausted : public std::runtime_error {
public:
    StorageExhausted(const std::string& message, size_t capacity)
        : std::runtime_error(message), capacity_(capacity) {}

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
};

class SynaptogenesisError : public std::runtime_error {
public:
    SynaptogenesisError(const std::string& source_area, const std::string& destination_area,
                        const Position& offending, const std::string& message)
        : std::runtime_error(message),
          source_area_(source_area),
          destination_area_(destination_area),
          offending_(offending) {}

    const std::string& source_area() const { return source_area_; }
    const std::string& destination_area() const { return destination_area_; }
    const Position& offending_position() const { return offending_; }

private:
    std::string source_area_;
    std::string destination_area_;
    Position offending_;
};

enum class BurstErrorKind {
    INTAKE,
    SYNAPTOGENESIS,
    STORAGE_EXHAUSTED
};

// Non-fatal error collected into a burst report
struct BurstError {
    BurstErrorKind kind;
    std::string message;

    BurstError(BurstErrorKind k, const std::string& msg) : kind(k), message(msg) {}
};

inline const char* burst_error_kind_name(BurstErrorKind kind) {
    switch (kind) {
        case BurstErrorKind::INTAKE: return "intake";
        case BurstErrorKind::SYNAPTOGENESIS: return "synaptogenesis";
        case BurstErrorKind::STORAGE_EXHAUSTED: return "storage_exhausted";
    }
    return "unknown";
}

} // namespace cortexlib

#endif // CORTEXLIB_ERRORS_H
