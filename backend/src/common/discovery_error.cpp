#include "common/discovery_error.h"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpecifierParse:   return "specifier-parse";
        case ErrorKind::Connection:       return "connection";
        case ErrorKind::Encoding:         return "encoding";
        case ErrorKind::Decoding:         return "decoding";
        case ErrorKind::ResponseTooLarge: return "response-too-large";
        case ErrorKind::Config:           return "config";
        case ErrorKind::Usage:            return "usage";
    }
    return "unknown";
}

DiscoveryError::DiscoveryError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}
