// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * exceptions.hpp
 *
 * Exception hierarchy for input validation errors.
 *
 * Exception hierarchy:
 *   ValidationError (base, std::invalid_argument)
 *   ├── InvalidInputError     - Non-vector input to vector geometry
 *   ├── InvalidImageError     - Image rank/shape not usable
 *   ├── InvalidAxisOrderError - Axis order is not a permutation of "xyz"
 *   └── EmptyImageError       - Image carries no mass
 *
 * All errors are thrown at the boundary of the offending call, before any
 * output is produced.
 */

#ifndef VOLALIGN_EXCEPTIONS_HPP
#define VOLALIGN_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace volalign {

/**
 * @brief Base exception for rejected inputs.
 */
class ValidationError : public std::invalid_argument {
 public:
  ValidationError(const std::string& operation, const std::string& message)
      : std::invalid_argument("[" + operation + "] " + message),
        operation_(operation),
        message_(message) {}

  const std::string& getOperation() const { return operation_; }
  const std::string& getMessage() const { return message_; }

 private:
  std::string operation_;
  std::string message_;
};

/// Vector geometry given something that is not a 1-D vector.
class InvalidInputError : public ValidationError {
 public:
  InvalidInputError(const std::string& operation, const std::string& message)
      : ValidationError(operation, message) {}
};

/// Image rank not in {3, 4, 5}, empty spatial extents, or bad storage.
class InvalidImageError : public ValidationError {
 public:
  InvalidImageError(const std::string& operation, const std::string& message)
      : ValidationError(operation, message) {}
};

/// Axis order that is not exactly a permutation of {x, y, z}.
class InvalidAxisOrderError : public ValidationError {
 public:
  InvalidAxisOrderError(const std::string& operation,
                        const std::string& message)
      : ValidationError(operation, message) {}
};

/// Image with zero total mass (principal axes undefined).
class EmptyImageError : public ValidationError {
 public:
  EmptyImageError(const std::string& operation, const std::string& message)
      : ValidationError(operation, message) {}
};

}  // namespace volalign

#endif  // VOLALIGN_EXCEPTIONS_HPP
