#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ms2pred {

/// @brief Kind of a per-peptide or startup failure, as reported in batch results.
enum class ErrorKind {
    InvalidResidue,
    InvalidModification,
    Length,
    InvalidCharge,
    UnsupportedMethod,
    ModelNotFound,
    ModelMismatch,
    ModelLoad,
    Cancelled,
    Internal
};

std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Base of every error raised by the prediction pipeline.
 *
 * Validation, encoding and prediction errors are scoped to a single peptide:
 * the batch orchestrator catches them and stores them as that peptide's
 * result. ModelLoadError is the only one that is fatal for the process.
 */
class Error : public std::runtime_error {
public:
    Error(const ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidResidueError : public Error {
public:
    explicit InvalidResidueError(const std::string& what) : Error(ErrorKind::InvalidResidue, what) {}
};

class InvalidModificationError : public Error {
public:
    explicit InvalidModificationError(const std::string& what) : Error(ErrorKind::InvalidModification, what) {}
};

class LengthError : public Error {
public:
    explicit LengthError(const std::string& what) : Error(ErrorKind::Length, what) {}
};

class InvalidChargeError : public Error {
public:
    explicit InvalidChargeError(const std::string& what) : Error(ErrorKind::InvalidCharge, what) {}
};

class UnsupportedMethodError : public Error {
public:
    explicit UnsupportedMethodError(const std::string& what) : Error(ErrorKind::UnsupportedMethod, what) {}
};

class ModelNotFoundError : public Error {
public:
    explicit ModelNotFoundError(const std::string& what) : Error(ErrorKind::ModelNotFound, what) {}
};

class ModelMismatchError : public Error {
public:
    explicit ModelMismatchError(const std::string& what) : Error(ErrorKind::ModelMismatch, what) {}
};

class ModelLoadError : public Error {
public:
    explicit ModelLoadError(const std::string& what) : Error(ErrorKind::ModelLoad, what) {}
};

} // namespace ms2pred
