#pragma once

#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/estimation_result.hpp"
#include "libnarmax/core/identification_options.hpp"
#include "libnarmax/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libnarmax {
namespace solvers {

/**
 * Least Squares solver for the selected regressors
 *
 * Uses Eigen's ColPivHouseholderQR decomposition on the original (not
 * orthogonalized) columns. The intercept, when selected, is an ordinary
 * all-ones column, so no centering is done.
 *
 * Algorithm:
 * 1. QR decomposition with column pivoting: Psi*P = Q*R
 * 2. Rank = number of |R_ii| above the pivot threshold
 * 3. Full rank: solve R*theta = Q'y and undo the permutation
 * 4. Rank deficient: throw SingularMatrixError, or (LEAST_NORM policy)
 *    return the minimum-norm solution of a CompleteOrthogonalDecomposition
 * 5. Compute residuals and fit statistics
 *
 * Stateless design (all methods are static).
 */
class LeastSquaresSolver {
public:
	/**
	 * @param y Target vector (length n)
	 * @param psi Regressor matrix (n x p)
	 * @param options Singular policy and QR tolerance
	 *
	 * @throws std::invalid_argument if dimensions do not match
	 * @throws SingularMatrixError if psi is rank deficient under the THROW policy
	 */
	static core::EstimationResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                                  const core::IdentificationOptions &options = core::IdentificationOptions());

	/**
	 * Fit with standard errors SE_j = sqrt(MSE * (Psi'Psi)^-1_jj)
	 *
	 * A rank-deficient (least-norm) fit gets NaN standard errors.
	 */
	static core::EstimationResult
	FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                 const core::IdentificationOptions &options = core::IdentificationOptions());

	/**
	 * True when pivoted QR finds no dependent column in psi
	 *
	 * @param tolerance Pivot threshold, non-positive keeps the Eigen default
	 */
	static bool IsFullRank(const Eigen::MatrixXd &psi, double tolerance = -1.0);

	/**
	 * Compute fit quality statistics (R², MSE, RMSE, RSS) from residuals
	 */
	static void ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals, size_t rank, size_t n,
	                              core::EstimationResult &result);

private:
	static void ComputeStandardErrors(const Eigen::MatrixXd &psi, double mse, core::EstimationResult &result);

	static std::string AliasedColumns(const std::vector<bool> &is_aliased);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::string LeastSquaresSolver::AliasedColumns(const std::vector<bool> &is_aliased) {
	std::string list;
	for (size_t j = 0; j < is_aliased.size(); j++) {
		if (is_aliased[j]) {
			list += (list.empty() ? "" : ", ") + std::to_string(j);
		}
	}
	return list;
}

inline core::EstimationResult LeastSquaresSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
                                                      const core::IdentificationOptions &options) {
	if (psi.rows() != y.size()) {
		throw std::invalid_argument("regressor matrix has " + std::to_string(psi.rows()) + " rows but the target has " +
		                            std::to_string(y.size()) + " samples");
	}

	const size_t n = static_cast<size_t>(psi.rows());
	const size_t p = static_cast<size_t>(psi.cols());

	core::EstimationResult result(n, p, 0);

	if (p == 0) {
		result.residuals = y;
		ComputeStatistics(y, result.residuals, 0, n, result);
		return result;
	}

	// Step 1: QR decomposition with column pivoting
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(psi);
	if (options.qr_tolerance > 0.0) {
		qr.setThreshold(options.qr_tolerance);
	}
	result.tolerance_used = qr.threshold();

	// Step 2: numerical rank; pivoted columns past the rank are dependent
	result.rank = static_cast<size_t>(qr.rank());
	const auto &P = qr.colsPermutation();
	for (size_t i = result.rank; i < p; i++) {
		result.is_aliased[static_cast<size_t>(P.indices()[static_cast<Eigen::Index>(i)])] = true;
	}

	// Step 3/4: solve
	if (result.rank == p) {
		result.coefficients = qr.solve(y);
	} else if (options.singular_policy == core::SingularPolicy::THROW) {
		throw core::SingularMatrixError("regressor matrix has rank " + std::to_string(result.rank) + " < " +
		                                std::to_string(p) + " columns (dependent columns: " +
		                                AliasedColumns(result.is_aliased) + ")");
	} else {
		NARMAX_WARN("Regressor matrix has rank " << result.rank << " < " << p
		                                         << " columns, using the minimum-norm solution");
		Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(psi);
		if (options.qr_tolerance > 0.0) {
			cod.setThreshold(options.qr_tolerance);
		}
		result.coefficients = cod.solve(y);
		result.used_least_norm = true;
	}

	// Step 5: residuals and statistics
	result.residuals = y - psi * result.coefficients;
	ComputeStatistics(y, result.residuals, result.rank, n, result);

	return result;
}

inline core::EstimationResult LeastSquaresSolver::FitWithStdErrors(const Eigen::VectorXd &y,
                                                                   const Eigen::MatrixXd &psi,
                                                                   const core::IdentificationOptions &options) {
	auto result = Fit(y, psi, options);

	result.std_errors =
	    Eigen::VectorXd::Constant(static_cast<Eigen::Index>(result.n_params), std::numeric_limits<double>::quiet_NaN());
	result.has_std_errors = true;

	// A minimum-norm solution has no sampling covariance; leave NaN
	if (result.n_params == 0 || !result.is_full_rank() || !std::isfinite(result.mse)) {
		return result;
	}

	ComputeStandardErrors(psi, result.mse, result);

	return result;
}

inline bool LeastSquaresSolver::IsFullRank(const Eigen::MatrixXd &psi, double tolerance) {
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(psi);
	if (tolerance > 0.0) {
		qr.setThreshold(tolerance);
	}

	return qr.rank() == psi.cols();
}

inline void LeastSquaresSolver::ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals,
                                                  size_t rank, size_t n, core::EstimationResult &result) {
	result.rss = residuals.squaredNorm();

	double ss_tot = 0.0;
	if (n > 0) {
		ss_tot = (y.array() - y.mean()).square().sum();
	}

	// R-squared, bounded to [0, 1] (a model without intercept can do worse than the mean)
	result.r_squared = (ss_tot > 1e-10) ? (1.0 - result.rss / ss_tot) : 0.0;
	if (result.r_squared < 0.0) {
		result.r_squared = 0.0;
	} else if (result.r_squared > 1.0) {
		result.r_squared = 1.0;
	}

	// Degrees of freedom count identifiable parameters, not columns
	if (n > rank) {
		result.mse = result.rss / static_cast<double>(n - rank);
		constexpr double min_mse = 1e-20;
		if (result.mse < min_mse) {
			result.mse = min_mse;
		}
	} else {
		// Interpolating fit, variance undefined
		result.mse = std::numeric_limits<double>::quiet_NaN();
	}

	result.rmse = std::sqrt(result.mse);
}

inline void LeastSquaresSolver::ComputeStandardErrors(const Eigen::MatrixXd &psi, double mse,
                                                      core::EstimationResult &result) {
	const auto p = psi.cols();
	const Eigen::MatrixXd gram = psi.transpose() * psi;
	const Eigen::MatrixXd gram_inv = gram.ldlt().solve(Eigen::MatrixXd::Identity(p, p));

	for (Eigen::Index j = 0; j < p; j++) {
		const double variance = mse * gram_inv(j, j);
		result.std_errors(j) = variance > 0.0 ? std::sqrt(variance) : 0.0;
	}
}

} // namespace solvers
} // namespace libnarmax
