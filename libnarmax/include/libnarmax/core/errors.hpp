#pragma once

#include <stdexcept>
#include <string>

namespace libnarmax {
namespace core {

/**
 * Error kinds raised by the identification engine
 *
 * Configuration and data problems derive from std::invalid_argument,
 * numerical failures from std::runtime_error, so callers that only care
 * about the broad category can keep catching the standard types.
 *
 * Non-convergence of Extended Least Squares is not an error: it is reported
 * through EstimationResult::converged.
 */

/// Bad lag/degree/model configuration, rejected before any computation
class InvalidRegressorSpecError : public std::invalid_argument {
public:
	explicit InvalidRegressorSpecError(const std::string &message)
	    : std::invalid_argument("Invalid regressor specification: " + message) {
	}
};

/// Fewer samples than the lag history requires
class InsufficientDataError : public std::invalid_argument {
public:
	explicit InsufficientDataError(const std::string &message)
	    : std::invalid_argument("Insufficient data: " + message) {
	}
};

/// No remaining candidate is linearly independent of the selected set
class DegenerateRegressorError : public std::runtime_error {
public:
	explicit DegenerateRegressorError(const std::string &message)
	    : std::runtime_error("Degenerate regressor set: " + message) {
	}
};

/// Parameter estimation system is rank deficient
class SingularMatrixError : public std::runtime_error {
public:
	explicit SingularMatrixError(const std::string &message)
	    : std::runtime_error("Singular matrix: " + message) {
	}
};

} // namespace core
} // namespace libnarmax
