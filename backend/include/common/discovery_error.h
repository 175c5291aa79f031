#pragma once

#include <stdexcept>
#include <string>

/**
 * Error kinds surfaced by the content-discovery layer.
 */
enum class ErrorKind {
    SpecifierParse,
    Connection,
    Encoding,
    Decoding,
    ResponseTooLarge,
    Config,
    Usage,
};

/// Short lowercase name of an error kind, used in log lines.
const char* to_string(ErrorKind kind);

/**
 * Single tagged error type for every failure of this layer.
 * Callers switch on kind() to decide retry or reporting policy.
 */
class DiscoveryError : public std::runtime_error {
public:
    DiscoveryError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};
