#ifndef BLOCKFUSE_EXCEPTIONS_H
#define BLOCKFUSE_EXCEPTIONS_H

#include <array>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file BlockFuseExceptions.h
 * @brief Exception hierarchy for BlockFuse
 *
 * Separates fatal construction and reduction errors from the per-block
 * failures that are converted into FAILURE results at the task boundary.
 */

namespace blockfuse {

/**
 * @brief Base exception class for all BlockFuse errors
 *
 * Provides detailed error information including context, timestamp,
 * and potential recovery strategies.
 */
class BlockFuseException : public std::exception {
public:
  enum class Severity {
    Info,     // Informational, processing can continue
    Warning,  // Warning, might affect results
    Error,    // Error, current operation failed
    Critical, // Critical, no result can be produced
  };

  enum class Category {
    InputOutput,   // Image source and file access errors
    Registration,  // Block pair registration errors
    Fusion,        // Transform blending and reduction errors
    Configuration, // Configuration and parameter errors
    Validation,    // Data validation and integrity errors
    System         // System-level errors
  };

protected:
  std::string m_message;
  std::string m_component;
  std::string m_function;
  Severity m_severity;
  Category m_category;
  std::chrono::system_clock::time_point m_timestamp;
  std::vector<std::string> m_recovery_suggestions;
  std::string m_detailed_context;

public:
  explicit BlockFuseException(const std::string &message,
                              const std::string &component = "Unknown",
                              const std::string &function = "Unknown",
                              Severity severity = Severity::Error,
                              Category category = Category::System)
      : m_message(message), m_component(component), m_function(function),
        m_severity(severity), m_category(category),
        m_timestamp(std::chrono::system_clock::now()) {}

  // Standard exception interface
  const char *what() const noexcept override { return m_message.c_str(); }

  // Extended error information
  const std::string &GetMessage() const { return m_message; }
  const std::string &GetComponent() const { return m_component; }
  const std::string &GetFunction() const { return m_function; }
  Severity GetSeverity() const { return m_severity; }
  Category GetCategory() const { return m_category; }

  std::string GetTimestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(m_timestamp);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
  }

  // Recovery suggestions
  void AddRecoverySuggestion(const std::string &suggestion) {
    m_recovery_suggestions.push_back(suggestion);
  }

  const std::vector<std::string> &GetRecoverySuggestions() const {
    return m_recovery_suggestions;
  }

  // Detailed context
  void SetDetailedContext(const std::string &context) {
    m_detailed_context = context;
  }

  const std::string &GetDetailedContext() const { return m_detailed_context; }

  // Formatted error report
  std::string GetFormattedReport() const {
    std::stringstream ss;
    ss << "=== BlockFuse Error Report ===" << std::endl;
    ss << "Timestamp: " << GetTimestamp() << std::endl;
    ss << "Severity: " << SeverityToString(m_severity) << std::endl;
    ss << "Category: " << CategoryToString(m_category) << std::endl;
    ss << "Component: " << m_component << std::endl;
    ss << "Function: " << m_function << std::endl;
    ss << "Message: " << m_message << std::endl;

    if (!m_detailed_context.empty()) {
      ss << "Context: " << m_detailed_context << std::endl;
    }

    if (!m_recovery_suggestions.empty()) {
      ss << "Recovery Suggestions:" << std::endl;
      for (size_t i = 0; i < m_recovery_suggestions.size(); ++i) {
        ss << "  " << (i + 1) << ". " << m_recovery_suggestions[i] << std::endl;
      }
    }

    return ss.str();
  }

  // Helper methods
  static std::string SeverityToString(Severity severity) {
    switch (severity) {
    case Severity::Info:
      return "INFO";
    case Severity::Warning:
      return "WARNING";
    case Severity::Error:
      return "ERROR";
    case Severity::Critical:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }

  static std::string CategoryToString(Category category) {
    switch (category) {
    case Category::InputOutput:
      return "INPUT_OUTPUT";
    case Category::Registration:
      return "REGISTRATION";
    case Category::Fusion:
      return "FUSION";
    case Category::Configuration:
      return "CONFIGURATION";
    case Category::Validation:
      return "VALIDATION";
    case Category::System:
      return "SYSTEM";
    default:
      return "UNKNOWN";
    }
  }
};

/**
 * @brief Malformed inputs and broken data invariants
 *
 * Fatal to the operation that raised it.
 */
class ValidationException : public BlockFuseException {
public:
  explicit ValidationException(const std::string &component,
                               const std::string &problem_description,
                               const std::string &function = "Validate")
      : BlockFuseException("Validation error in " + component + ": " +
                               problem_description,
                           component, function, Severity::Error,
                           Category::Validation) {}
};

/**
 * @brief Image source and file access exceptions
 */
class ImageSourceException : public BlockFuseException {
public:
  explicit ImageSourceException(const std::string &source,
                                const std::string &operation,
                                const std::string &details = "")
      : BlockFuseException("Image source error during " + operation +
                               " of '" + source + "'" +
                               (details.empty() ? "" : ": " + details),
                           "ImageSource", operation, Severity::Error,
                           Category::InputOutput) {
    AddRecoverySuggestion("Check that the image exists and is readable");
    AddRecoverySuggestion("Use an absolute path or a remote URL");
    AddRecoverySuggestion(
        "Verify that the format supports streamed region reads");
  }
};

/**
 * @brief Recoverable failure of a single block pair
 *
 * Never propagates past the block task boundary; the task logs it and
 * substitutes a FAILURE result.
 */
class BlockRegistrationException : public BlockFuseException {
public:
  enum class FailureReason {
    FixedRegionOutsideImage,
    MovingRegionOutsideImage,
    NoMovingSignal,
    MethodFailure,
    InvalidResult
  };

private:
  FailureReason m_failure_reason;
  std::string m_block;

public:
  explicit BlockRegistrationException(FailureReason reason,
                                      const std::string &block,
                                      const std::string &additional_details = "")
      : BlockFuseException(
            "Block " + block + " failed: " + ReasonToString(reason) +
                (additional_details.empty() ? "" : " - " + additional_details),
            "BlockPairTask", "Run", Severity::Warning,
            Category::Registration),
        m_failure_reason(reason), m_block(block) {
    SetDetailedContext("Failure reason: " + ReasonToString(reason));
  }

  FailureReason GetFailureReason() const { return m_failure_reason; }
  const std::string &GetBlock() const { return m_block; }

  static std::string ReasonToString(FailureReason reason) {
    switch (reason) {
    case FailureReason::FixedRegionOutsideImage:
      return "Padded fixed region lies outside the fixed image";
    case FailureReason::MovingRegionOutsideImage:
      return "Moving region lies outside the moving image";
    case FailureReason::NoMovingSignal:
      return "No signal observed in moving block";
    case FailureReason::MethodFailure:
      return "Block registration method raised an error";
    case FailureReason::InvalidResult:
      return "Block registration method returned an invalid result";
    default:
      return "Unknown failure";
    }
  }
};

/**
 * @brief A point was queried outside every transform domain
 */
class CoverageException : public BlockFuseException {
private:
  std::array<double, 3> m_point;

public:
  explicit CoverageException(const std::array<double, 3> &point)
      : BlockFuseException("No candidates found: point " +
                               PointToString(point) +
                               " lies outside all transform domains",
                           "TransformCollection", "TransformPoint",
                           Severity::Warning, Category::Fusion),
        m_point(point) {}

  const std::array<double, 3> &GetPoint() const { return m_point; }

private:
  static std::string PointToString(const std::array<double, 3> &point) {
    std::stringstream ss;
    ss << "[" << point[0] << "," << point[1] << "," << point[2] << "]";
    return ss.str();
  }
};

/**
 * @brief Block results could not be reduced into a transform
 */
class ReductionException : public BlockFuseException {
public:
  explicit ReductionException(const std::string &method,
                              const std::string &problem_description,
                              size_t successful_blocks = 0)
      : BlockFuseException(method + " reduction failed: " +
                               problem_description,
                           "Reduction", method, Severity::Critical,
                           Category::Fusion) {
    std::stringstream context;
    context << "Successful blocks available: " << successful_blocks;
    SetDetailedContext(context.str());

    AddRecoverySuggestion("Inspect the status grid for failed blocks");
    AddRecoverySuggestion("Increase overlap factors or block size");
    AddRecoverySuggestion("Verify the initial transform aligns the volumes");
  }
};

/**
 * @brief Configuration and parameter validation exceptions
 */
class ConfigurationException : public BlockFuseException {
public:
  explicit ConfigurationException(const std::string &parameter_name,
                                  const std::string &invalid_value,
                                  const std::string &expected_format = "")
      : BlockFuseException(
            "Invalid configuration parameter '" + parameter_name +
                "' with value '" + invalid_value + "'" +
                (expected_format.empty()
                     ? ""
                     : " (expected: " + expected_format + ")"),
            "Configuration", "Parameter Validation", Severity::Error,
            Category::Configuration) {
    AddRecoverySuggestion("Check parameter documentation for valid ranges");
    AddRecoverySuggestion("Use default parameter values as starting point");
    AddRecoverySuggestion("Match the number of per-axis values to the image");
  }
};

} // namespace blockfuse

#endif // BLOCKFUSE_EXCEPTIONS_H
