#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <vector>

namespace libnarmax {
namespace core {

/**
 * Output of one estimator call on a restricted information matrix
 *
 * coefficients follow the column order of the matrix handed to the
 * estimator. residuals cover the valid samples only. Coefficients are
 * finite: a rank-deficient system throws SingularMatrixError unless the
 * minimum-norm policy is active. std_errors is filled only when
 * has_std_errors is set.
 */
struct EstimationResult {
	// --- solution ---

	Eigen::VectorXd coefficients;
	/// y minus the fitted values, one per valid sample
	Eigen::VectorXd residuals;
	size_t rank;
	size_t n_params;
	size_t n_obs;
	/// Per column: true when pivoted QR judged it a linear combination of others
	std::vector<bool> is_aliased;
	bool used_least_norm = false;
	/// Pivot threshold handed to the QR (negative: Eigen default)
	double tolerance_used = -1.0;

	// --- goodness of fit ---

	double r_squared = std::numeric_limits<double>::quiet_NaN();
	/// rss / df_residual()
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	double rss = std::numeric_limits<double>::quiet_NaN();

	Eigen::VectorXd std_errors;
	bool has_std_errors = false;

	// --- extended least squares ---

	/// 1 for a single least squares solve
	size_t iterations = 1;
	/// Cleared when the iteration cap was hit before the coefficients settled
	bool converged = true;
	/// Lagged-residual coefficients of the final iterate, not part of the model
	Eigen::VectorXd noise_coefficients;

	EstimationResult() : rank(0), n_params(0), n_obs(0) {
	}

	EstimationResult(size_t obs, size_t params, size_t numerical_rank)
	    : rank(numerical_rank), n_params(params), n_obs(obs) {
		coefficients = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(params));
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(obs));
		is_aliased.assign(params, false);
	}

	size_t df_residual() const {
		return n_obs > rank ? n_obs - rank : 0;
	}

	bool is_full_rank() const {
		return rank == n_params;
	}
};

} // namespace core
} // namespace libnarmax
