#pragma once

#include "libnarmax/core/errors.hpp"
#include "residue_correlation.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace libnarmax {
namespace diagnostics {

// Implementation of ResidueCorrelation methods

inline size_t CorrelationResult::CountOutsideBand(size_t first_lag) const {
	size_t count = 0;
	for (Eigen::Index i = static_cast<Eigen::Index>(first_lag); i < values.size(); i++) {
		if (std::isfinite(values(i)) && std::abs(values(i)) > confidence_bound) {
			count++;
		}
	}
	return count;
}

inline CorrelationResult ResidueCorrelation::Correlate(const Eigen::VectorXd &lead, const Eigen::VectorXd &lagged,
                                                       size_t max_lag) {
	const auto n = static_cast<size_t>(lagged.size());
	if (max_lag >= n) {
		throw core::InsufficientDataError("correlation up to lag " + std::to_string(max_lag) + " needs more than " +
		                                  std::to_string(max_lag) + " samples (got " + std::to_string(n) + ")");
	}

	const Eigen::VectorXd a = lead.array() - lead.mean();
	const Eigen::VectorXd b = lagged.array() - lagged.mean();
	const double denominator = std::sqrt(a.squaredNorm() * b.squaredNorm());

	CorrelationResult result;
	result.confidence_bound = kConfidenceZ / std::sqrt(static_cast<double>(n));
	result.values.resize(static_cast<Eigen::Index>(max_lag + 1));

	for (size_t lag = 0; lag <= max_lag; lag++) {
		result.lags.push_back(lag);
		const auto len = static_cast<Eigen::Index>(n - lag);
		const auto t = static_cast<Eigen::Index>(lag);
		if (!(denominator > 0.0)) {
			// Zero variance: correlation undefined
			result.values(t) = std::numeric_limits<double>::quiet_NaN();
			continue;
		}
		result.values(t) = a.head(len).dot(b.segment(t, len)) / denominator;
	}

	return result;
}

inline CorrelationResult ResidueCorrelation::Autocorrelation(const Eigen::VectorXd &residuals, size_t max_lag) {
	return Correlate(residuals, residuals, max_lag);
}

inline CorrelationResult ResidueCorrelation::CrossCorrelation(const Eigen::VectorXd &residuals,
                                                              const Eigen::VectorXd &signal, size_t max_lag) {
	if (residuals.size() != signal.size()) {
		throw std::invalid_argument("residuals and signal must have the same length (got " +
		                            std::to_string(residuals.size()) + " and " + std::to_string(signal.size()) + ")");
	}
	return Correlate(signal, residuals, max_lag);
}

} // namespace diagnostics
} // namespace libnarmax
