#pragma once

#include <stdexcept>
#include <string>

namespace drawio_model {

enum class ErrorKind {
    Structural,     // document does not have the expected shape
    Vocabulary,     // class or property name not in RiC-O
    Resolution,     // arrow source/target could not be determined
    Sanitisation,   // identifier cannot be made legal with the configured rules
    Configuration   // malformed option values
};

const char* to_string(ErrorKind kind);

// Base of every error the conversion raises. All of them are fatal: the
// conversion aborts and produces no output.
class ConversionError : public std::runtime_error {
public:
    ConversionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class StructuralError : public ConversionError {
public:
    explicit StructuralError(const std::string& message)
        : ConversionError(ErrorKind::Structural, message) {}
};

// The document is well formed but holds no graph.
class NothingToParseError : public StructuralError {
public:
    NothingToParseError()
        : StructuralError("The draw.io XML graph passed in appears to be empty") {}
};

class VocabularyError : public ConversionError {
public:
    explicit VocabularyError(const std::string& message)
        : ConversionError(ErrorKind::Vocabulary, message) {}
};

class ResolutionError : public ConversionError {
public:
    explicit ResolutionError(const std::string& message)
        : ConversionError(ErrorKind::Resolution, message) {}
};

class SanitisationError : public ConversionError {
public:
    explicit SanitisationError(const std::string& message)
        : ConversionError(ErrorKind::Sanitisation, message) {}
};

class ConfigurationError : public ConversionError {
public:
    explicit ConfigurationError(const std::string& message)
        : ConversionError(ErrorKind::Configuration, message) {}
};

} // namespace drawio_model
