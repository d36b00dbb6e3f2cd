#pragma once

#include <stdexcept>
#include <string>

namespace cellalign {

enum class ErrorKind {
    CONFIGURATION,
    NUMERICAL,
    DATA_SHAPE
};

std::string errorKindName(ErrorKind kind);

class AlignmentError : public std::runtime_error {
public:
    AlignmentError(ErrorKind kind, const std::string& message, const std::string& stage = "");

    ErrorKind kind() const { return errorKind; }
    const std::string& stage() const { return stageLabel; }
    const std::string& message() const { return detail; }

private:
    ErrorKind errorKind;
    std::string stageLabel;
    std::string detail;
};

// Empty or invalid gene universe, contradictory parameters, unreadable inputs
class ConfigurationError : public AlignmentError {
public:
    explicit ConfigurationError(const std::string& message, const std::string& stage = "")
        : AlignmentError(ErrorKind::CONFIGURATION, message, stage) {}
};

// Rank deficiency, failed decomposition, degenerate variance
class NumericalError : public AlignmentError {
public:
    explicit NumericalError(const std::string& message, const std::string& stage = "")
        : AlignmentError(ErrorKind::NUMERICAL, message, stage) {}
};

// Mismatched sample or gene indices at a stage boundary
class DataShapeError : public AlignmentError {
public:
    explicit DataShapeError(const std::string& message, const std::string& stage = "")
        : AlignmentError(ErrorKind::DATA_SHAPE, message, stage) {}
};

}
