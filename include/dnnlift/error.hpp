#pragma once

#include <exception>
#include <sstream>
#include <string>
#include <vector>

namespace dnnlift {

// ============================================================================
// Base dnnlift Exception
// ============================================================================

class DnnliftError : public std::exception {
  public:
    explicit DnnliftError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override { return message_.c_str(); }

    const std::string &message() const { return message_; }

  protected:
    std::string message_;
};

// ============================================================================
// Shape-related errors
// ============================================================================

class ShapeError : public DnnliftError {
  public:
    explicit ShapeError(const std::string &message)
        : DnnliftError("ShapeError: " + message) {}

    template <typename Container>
    static ShapeError mismatch(const Container &expected,
                               const Container &got) {
        std::ostringstream oss;
        oss << "expected shape [";
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << expected[i];
        }
        oss << "] but got [";
        for (size_t i = 0; i < got.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << got[i];
        }
        oss << "]";
        return ShapeError(oss.str());
    }

    static ShapeError rank_mismatch(const std::string &what, size_t expected,
                                    size_t got) {
        return ShapeError(what + " expects rank " + std::to_string(expected) +
                          " but got rank " + std::to_string(got));
    }

    static ShapeError unsupported_rank(const std::string &what, size_t got) {
        return ShapeError(what + " requires rank 4 or 5 tensors, got rank " +
                          std::to_string(got));
    }

    static ShapeError invalid_axis(int axis, size_t ndim) {
        return ShapeError("axis " + std::to_string(axis) +
                          " out of bounds for tensor with " +
                          std::to_string(ndim) + " dimensions");
    }
};

// ============================================================================
// Type-related errors
// ============================================================================

class TypeError : public DnnliftError {
  public:
    explicit TypeError(const std::string &message)
        : DnnliftError("TypeError: " + message) {}

    static TypeError unsupported_dtype(const std::string &dtype,
                                       const std::string &operation) {
        return TypeError("unsupported dtype '" + dtype + "' for " + operation);
    }

    static TypeError dtype_mismatch(const std::string &expected,
                                    const std::string &got) {
        return TypeError("expected dtype " + expected + " but got " + got);
    }

    static TypeError kind_mismatch(const std::string &what,
                                   const std::string &expected,
                                   const std::string &got) {
        return TypeError(what + " must be " + expected + ", got " + got);
    }

    static TypeError arity(const std::string &op, size_t expected,
                           size_t got) {
        return TypeError(op + " takes " + std::to_string(expected) +
                         " inputs but " + std::to_string(got) + " were given");
    }
};

// ============================================================================
// Configuration errors (malformed padding/stride/window tuples, bad
// algorithm names, invalid settings)
// ============================================================================

class ConfigurationError : public DnnliftError {
  public:
    explicit ConfigurationError(const std::string &message)
        : DnnliftError("ConfigurationError: " + message) {}

    static ConfigurationError invalid_value(const std::string &parameter,
                                            const std::string &value,
                                            const std::string &expected) {
        return ConfigurationError("invalid value '" + value + "' for " +
                                  parameter + ": expected " + expected);
    }

    static ConfigurationError length_mismatch(const std::string &parameter,
                                              size_t expected, size_t got) {
        return ConfigurationError(
            parameter + " must have length " + std::to_string(expected) +
            " to match the stride tuple, got length " + std::to_string(got));
    }

    static ConfigurationError spatial_rank(const std::string &parameter,
                                           size_t got) {
        return ConfigurationError(parameter +
                                  " must describe 2 or 3 spatial dimensions, "
                                  "got " +
                                  std::to_string(got));
    }
};

// ============================================================================
// Backend availability errors
// ============================================================================

class UnavailableError : public DnnliftError {
  public:
    explicit UnavailableError(const std::string &reason)
        : DnnliftError("UnavailableError: accelerated backend unavailable: " +
                       reason),
          reason_(reason) {}

    const std::string &reason() const { return reason_; }

  private:
    std::string reason_;
};

class FeatureUnsupportedError : public DnnliftError {
  public:
    FeatureUnsupportedError(const std::string &feature, int required,
                            int detected)
        : DnnliftError("FeatureUnsupportedError: " + feature +
                       " requires backend version " +
                       std::to_string(required) + " but detected version " +
                       std::to_string(detected)),
          feature_(feature), required_(required), detected_(detected) {}

    const std::string &feature() const { return feature_; }
    int required_version() const { return required_; }
    int detected_version() const { return detected_; }

  private:
    std::string feature_;
    int required_;
    int detected_;
};

// ============================================================================
// Optimization errors
// ============================================================================

// Raised by the hard-fail pass when acceleration was requested explicitly
// but the availability gate reports the backend as unusable.
class OptimizationAbortedError : public DnnliftError {
  public:
    explicit OptimizationAbortedError(const std::string &message)
        : DnnliftError("OptimizationAbortedError: " + message) {}
};

// ============================================================================
// Runtime errors
// ============================================================================

class RuntimeError : public DnnliftError {
  public:
    explicit RuntimeError(const std::string &message)
        : DnnliftError("RuntimeError: " + message) {}

    static RuntimeError not_implemented(const std::string &feature) {
        return RuntimeError(feature + " is not implemented");
    }

    static RuntimeError internal(const std::string &details) {
        return RuntimeError("internal error: " + details);
    }
};

} // namespace dnnlift
