#pragma once

// C++ Includes
#include <iostream>
#include <string>
#include <stdexcept>
#include <utility>

// NuMCMC Includes
#include "Manager/NuMCMCLogger.h"

/// @brief Custom exception class for NuMCMCTools errors.
class NuMCMCException : public std::exception {
public:
  /// @brief Constructs a NuMCMCException object with the specified error message.
  /// @param File The name of the file where the exception occurred.
  /// @param Line The line number where the exception occurred.
  /// @param Message The error message describing the exception (optional).
  explicit NuMCMCException(std::string File, int Line, std::string Message = "")
  {
    size_t lastSlashPos = File.find_last_of('/');
    std::string fileName = (lastSlashPos != std::string::npos) ? File.substr(lastSlashPos + 1) : File;

    errorMessage = ((Message.empty()) ? "Terminating NuMCMCTools" : Message);
    // Set logger format where we only have "information type", line would be confusing
    spdlog::set_pattern("[%^%l%$] %v");
    NUMCMCLOG_ERROR("Find me here: {}::{}", fileName, Line);
  }

  /// @brief Returns the error message associated with this exception.
  /// @return A pointer to the error message string.
  const char* what() const noexcept override {
    return errorMessage.c_str();
  }

private:
  /// The error message associated with this exception.
  std::string errorMessage;
};

/// @brief Prior family arguments are malformed, detected when the prior is built
class InvalidPriorParameters : public NuMCMCException {
public:
  explicit InvalidPriorParameters(std::string File, int Line, std::string Message = "Invalid prior parameters")
  : NuMCMCException(std::move(File), Line, std::move(Message)) {}
};

/// @brief Transform tag is not part of the transform catalog
class UnsupportedTransform : public NuMCMCException {
public:
  explicit UnsupportedTransform(std::string File, int Line, std::string Message = "Unsupported transform")
  : NuMCMCException(std::move(File), Line, std::move(Message)) {}
};

/// @brief Original prior density vanishes, importance weight is undefined
class DegeneratePrior : public NuMCMCException {
public:
  explicit DegeneratePrior(std::string File, int Line, std::string Message = "Degenerate prior")
  : NuMCMCException(std::move(File), Line, std::move(Message)) {}
};

/// @brief Histogram holds no weight and cannot be normalised
class EmptyHistogram : public NuMCMCException {
public:
  explicit EmptyHistogram(std::string File, int Line, std::string Message = "Empty histogram")
  : NuMCMCException(std::move(File), Line, std::move(Message)) {}
};

/// @brief Prior replacement requested for more than one dimension
class DimensionalityError : public NuMCMCException {
public:
  explicit DimensionalityError(std::string File, int Line, std::string Message = "Unsupported dimensionality")
  : NuMCMCException(std::move(File), Line, std::move(Message)) {}
};

/// @brief Credible level outside of (0, 1)
class InvalidCredibleLevel : public NuMCMCException {
public:
  explicit InvalidCredibleLevel(std::string File, int Line, std::string Message = "Invalid credible level")
  : NuMCMCException(std::move(File), Line, std::move(Message)) {}
};
