#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace libnarmax {
namespace diagnostics {

/**
 * Fit-quality metrics for measured vs. predicted or simulated outputs
 *
 * Stateless design (all methods are static).
 */
class Metrics {
public:
	/**
	 * Root relative squared error
	 *
	 * RRSE = sqrt( sum (y - y_hat)^2 / sum (y - y_bar)^2 )
	 *
	 * 0 is a perfect fit, 1 is no better than predicting the mean. NaN when
	 * y has zero variance.
	 *
	 * @throws std::invalid_argument if the lengths differ or are zero
	 */
	static double RootRelativeSquaredError(const Eigen::VectorXd &y, const Eigen::VectorXd &y_hat) {
		CheckSizes(y, y_hat);
		const double denominator = (y.array() - y.mean()).square().sum();
		if (!(denominator > 0.0)) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		return std::sqrt((y - y_hat).squaredNorm() / denominator);
	}

	static double RootMeanSquaredError(const Eigen::VectorXd &y, const Eigen::VectorXd &y_hat) {
		CheckSizes(y, y_hat);
		return std::sqrt((y - y_hat).squaredNorm() / static_cast<double>(y.size()));
	}

	static double MeanAbsoluteError(const Eigen::VectorXd &y, const Eigen::VectorXd &y_hat) {
		CheckSizes(y, y_hat);
		return (y - y_hat).cwiseAbs().mean();
	}

	/// 1 - SSE/SST, NaN when y has zero variance
	static double RSquared(const Eigen::VectorXd &y, const Eigen::VectorXd &y_hat) {
		CheckSizes(y, y_hat);
		const double ss_tot = (y.array() - y.mean()).square().sum();
		if (!(ss_tot > 0.0)) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		return 1.0 - (y - y_hat).squaredNorm() / ss_tot;
	}

private:
	static void CheckSizes(const Eigen::VectorXd &y, const Eigen::VectorXd &y_hat) {
		if (y.size() != y_hat.size()) {
			throw std::invalid_argument("measured and predicted lengths differ (" + std::to_string(y.size()) + " vs " +
			                            std::to_string(y_hat.size()) + ")");
		}
		if (y.size() == 0) {
			throw std::invalid_argument("metrics need at least one sample");
		}
	}
};

/// Free-function form of Metrics::RootRelativeSquaredError
inline double RootRelativeSquaredError(const Eigen::VectorXd &y, const Eigen::VectorXd &y_hat) {
	return Metrics::RootRelativeSquaredError(y, y_hat);
}

} // namespace diagnostics
} // namespace libnarmax
