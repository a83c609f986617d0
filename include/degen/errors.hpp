#pragma once

#include <stdexcept>
#include <string>

namespace degen {

enum class ErrorKind {
    INVALID_CODON_LENGTH,       // input is not exactly 3 symbols
    INVALID_CODE,               // unrecognised IUPAC symbol
    EMPTY_TARGET,               // no standard amino acid left after filtering
    CANNOT_REMOVE_LAST_POSITION,
    UNKNOWN_POSITION,
    UNKNOWN_STRATEGY,
    INPUT_FORMAT                // malformed position list
};

const char* error_kind_to_string(ErrorKind kind);

// User-facing error. Every operation that throws it leaves no partial state.
class DegenError : public std::runtime_error {
public:
    DegenError(ErrorKind kind, const std::string& message, char symbol = '\0')
        : std::runtime_error(message), kind_(kind), symbol_(symbol) {}

    ErrorKind kind() const noexcept { return kind_; }

    // Offending character for INVALID_CODE, '\0' otherwise
    char symbol() const noexcept { return symbol_; }

private:
    ErrorKind kind_;
    char symbol_;
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_CODON_LENGTH: return "InvalidCodonLength";
        case ErrorKind::INVALID_CODE: return "InvalidCode";
        case ErrorKind::EMPTY_TARGET: return "EmptyTarget";
        case ErrorKind::CANNOT_REMOVE_LAST_POSITION: return "CannotRemoveLastPosition";
        case ErrorKind::UNKNOWN_POSITION: return "UnknownPosition";
        case ErrorKind::UNKNOWN_STRATEGY: return "UnknownStrategy";
        default: return "InputFormat";
    }
}

}  // namespace degen
