#ifndef SHARDROOT_INTEGRITY_ERROR_HPP
#define SHARDROOT_INTEGRITY_ERROR_HPP

#include <stdexcept>
#include <string>

namespace shardroot::integrity {

enum class ErrorKind {
    MISSING_INPUT,
    CONFIG_UNAVAILABLE,
    INVALID_CONFIG,
    READ_ERROR,
    CANCELLED,
    TOO_FEW_SHARDS,
    SHARD_SIZE_MISMATCH
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MISSING_INPUT: return "Missing input";
        case ErrorKind::CONFIG_UNAVAILABLE: return "Config unavailable";
        case ErrorKind::INVALID_CONFIG: return "Invalid config";
        case ErrorKind::READ_ERROR: return "Read error";
        case ErrorKind::CANCELLED: return "Cancelled";
        case ErrorKind::TOO_FEW_SHARDS: return "Too few shards";
        case ErrorKind::SHARD_SIZE_MISMATCH: return "Shard size mismatch";
        default: return "Undefined error";
    }
}

class IntegrityError : public std::runtime_error {
public:
    IntegrityError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class MissingInputError : public IntegrityError {
public:
    explicit MissingInputError(const std::string& message)
        : IntegrityError(ErrorKind::MISSING_INPUT, message) {}
};

class ConfigUnavailableError : public IntegrityError {
public:
    explicit ConfigUnavailableError(const std::string& message)
        : IntegrityError(ErrorKind::CONFIG_UNAVAILABLE, message) {}
};

class InvalidConfigError : public IntegrityError {
public:
    explicit InvalidConfigError(const std::string& message)
        : IntegrityError(ErrorKind::INVALID_CONFIG, message) {}
};

class ReadError : public IntegrityError {
public:
    explicit ReadError(const std::string& message)
        : IntegrityError(ErrorKind::READ_ERROR, message) {}
};

class CancelledError : public IntegrityError {
public:
    explicit CancelledError(const std::string& message)
        : IntegrityError(ErrorKind::CANCELLED, message) {}
};

class TooFewShardsError : public IntegrityError {
public:
    explicit TooFewShardsError(const std::string& message)
        : IntegrityError(ErrorKind::TOO_FEW_SHARDS, message) {}
};

class ShardSizeMismatchError : public IntegrityError {
public:
    explicit ShardSizeMismatchError(const std::string& message)
        : IntegrityError(ErrorKind::SHARD_SIZE_MISMATCH, message) {}
};

} // namespace shardroot::integrity

#endif // SHARDROOT_INTEGRITY_ERROR_HPP
