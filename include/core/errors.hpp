#pragma once
#include <stdexcept>
#include <string>

namespace core {

enum class ErrorKind {
    Network,          // transport failure, retryable
    Provider,         // well-formed error response, not retryable
    DataIntegrity,    // candle failed validation (warning)
    CacheCorruption,  // malformed persisted row (warning)
    InsufficientData, // too few examples to train
    Busy,             // key already in use
    Cancelled,
    Config,
    Store,            // cache file i/o
    Internal
};

const char* to_string(ErrorKind k);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
private:
    ErrorKind kind_;
};

struct NetworkError : Error {
    explicit NetworkError(const std::string& m) : Error(ErrorKind::Network, m) {}
};
struct ProviderError : Error {
    explicit ProviderError(const std::string& m) : Error(ErrorKind::Provider, m) {}
};
struct InsufficientDataError : Error {
    explicit InsufficientDataError(const std::string& m) : Error(ErrorKind::InsufficientData, m) {}
};
struct BusyError : Error {
    explicit BusyError(const std::string& m) : Error(ErrorKind::Busy, m) {}
};
struct CancelledError : Error {
    explicit CancelledError(const std::string& m) : Error(ErrorKind::Cancelled, m) {}
};
struct ConfigError : Error {
    explicit ConfigError(const std::string& m) : Error(ErrorKind::Config, m) {}
};
struct StoreError : Error {
    explicit StoreError(const std::string& m) : Error(ErrorKind::Store, m) {}
};

// Non-fatal issue: logged, counted and handed back to the caller.
struct Warning {
    ErrorKind kind{ErrorKind::DataIntegrity};
    std::string message;
};

} // namespace core
