#pragma once

#include "libnarmax/basis/polynomial_basis.hpp"
#include "libnarmax/core/estimation_result.hpp"
#include "libnarmax/core/identification_options.hpp"
#include "libnarmax/regressors/lagged_data.hpp"
#include "libnarmax/regressors/regressor_code.hpp"
#include "libnarmax/solvers/least_squares_solver.hpp"
#include "libnarmax/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libnarmax {
namespace solvers {

/**
 * Extended Least Squares (ELS) for NARMAX noise models
 *
 * Plain least squares is biased when the noise is coloured. ELS models the
 * noise with lagged residuals and re-estimates until the process
 * coefficients settle:
 *
 * 1. theta_0 = LS(y, Psi), e = y - Psi*theta_0
 * 2. Build the noise regressors: the polynomial expansion (same degree,
 *    without constant) of e(k-1), ..., e(k-residual_lag). Residuals before
 *    the first valid sample are taken as 0.
 * 3. [theta, c] = LS(y, [Psi | noise]); e = y - [Psi | noise]*[theta, c]
 * 4. Stop when ||theta - theta_prev|| / ||theta_prev|| < els_tolerance,
 *    otherwise go to 2, up to els_max_iterations iterations
 *
 * Only theta (the coefficients of the Psi columns) is reported as
 * coefficients; the residuals are y - Psi*theta. Hitting the iteration cap
 * is not an error: the last iterate comes back with converged = false.
 *
 * Stateless design (all methods are static).
 */
class ExtendedLeastSquaresSolver {
public:
	/**
	 * @param y Target vector (length n)
	 * @param psi Regressor matrix of the process terms (n x p)
	 * @param options residual_lag, basis_degree, els_max_iterations,
	 *                els_tolerance and the singular policy
	 *
	 * @throws std::invalid_argument if dimensions do not match
	 * @throws InvalidRegressorSpecError on invalid ELS options
	 * @throws SingularMatrixError if an augmented system is rank deficient
	 *         under the THROW policy
	 */
	static core::EstimationResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                                  const core::IdentificationOptions &options);

	/**
	 * Fit with standard errors taken from the final augmented system
	 */
	static core::EstimationResult FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                                               const core::IdentificationOptions &options);

	/**
	 * Noise regressor matrix built from a residual sequence
	 *
	 * @param residuals Residuals aligned with the rows of Psi
	 * @param residual_lag Number of residual lags
	 * @param degree Polynomial degree of the expansion
	 * @return n x M matrix, one column per non-constant product of residual lags
	 */
	static Eigen::MatrixXd NoiseRegressors(const Eigen::VectorXd &residuals, size_t residual_lag, size_t degree);

private:
	static core::EstimationResult Run(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                                  const core::IdentificationOptions &options, bool with_std_errors);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::MatrixXd ExtendedLeastSquaresSolver::NoiseRegressors(const Eigen::VectorXd &residuals,
                                                                   size_t residual_lag, size_t degree) {
	const auto n = residuals.size();
	const auto pad = static_cast<Eigen::Index>(residual_lag);

	// Leading zeros stand in for the residuals before the first valid sample
	Eigen::VectorXd padded = Eigen::VectorXd::Zero(n + pad);
	padded.tail(n) = residuals;

	// Residual lags reuse the output factor codes of a residual-only signal
	std::vector<int> codes;
	for (size_t lag = 1; lag <= residual_lag; lag++) {
		codes.push_back(regressors::RegressorEncoder::EncodeFactor(regressors::SignalKind::OUTPUT, 0,
		                                                           static_cast<int>(lag)));
	}

	const Eigen::MatrixXd no_inputs(n + pad, 0);
	const auto lagged = regressors::LaggedData::Build(no_inputs, padded, codes, residual_lag);

	const basis::PolynomialBasis basis(degree);
	const auto table = basis.GenerateCandidates(codes, false);
	return basis.Expand(lagged, table.Codes());
}

inline core::EstimationResult ExtendedLeastSquaresSolver::Run(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
                                                              const core::IdentificationOptions &options,
                                                              bool with_std_errors) {
	if (psi.rows() != y.size()) {
		throw std::invalid_argument("regressor matrix has " + std::to_string(psi.rows()) + " rows but the target has " +
		                            std::to_string(y.size()) + " samples");
	}
	if (options.residual_lag == 0 || options.els_max_iterations == 0 || !(options.els_tolerance > 0.0)) {
		throw core::InvalidRegressorSpecError("residual_lag, els_max_iterations and els_tolerance must be positive");
	}

	NARMAX_TIMING_START();

	const auto p = psi.cols();
	const size_t n = static_cast<size_t>(psi.rows());

	core::EstimationResult initial = LeastSquaresSolver::Fit(y, psi, options);

	// A perfect process fit leaves nothing for a noise model to explain
	if (initial.rss <= std::numeric_limits<double>::epsilon() * y.squaredNorm()) {
		NARMAX_DEBUG("ELS skipped: least-squares residuals are zero");
		return with_std_errors ? LeastSquaresSolver::FitWithStdErrors(y, psi, options) : initial;
	}

	Eigen::VectorXd theta = initial.coefficients;
	Eigen::VectorXd residuals = initial.residuals;
	core::EstimationResult augmented_fit;
	Eigen::MatrixXd augmented;
	size_t iteration = 0;
	bool converged = false;

	while (iteration < options.els_max_iterations) {
		iteration++;

		const Eigen::MatrixXd noise = NoiseRegressors(residuals, options.residual_lag, options.basis_degree);
		augmented.resize(psi.rows(), p + noise.cols());
		augmented << psi, noise;

		augmented_fit = LeastSquaresSolver::Fit(y, augmented, options);

		const Eigen::VectorXd theta_new = augmented_fit.coefficients.head(p);
		const double theta_norm = theta.norm();
		const double change = (theta_new - theta).norm() / (theta_norm > 0.0 ? theta_norm : 1.0);

		NARMAX_DEBUG("ELS iteration " << iteration << ": relative coefficient change " << change);

		theta = theta_new;
		residuals = augmented_fit.residuals;

		if (change < options.els_tolerance) {
			converged = true;
			break;
		}
	}

	if (!converged) {
		NARMAX_WARN("Extended least squares did not converge in " << options.els_max_iterations
		                                                          << " iterations (tolerance " << options.els_tolerance
		                                                          << ")");
	}

	if (with_std_errors) {
		augmented_fit = LeastSquaresSolver::FitWithStdErrors(y, augmented, options);
	}

	core::EstimationResult result(n, static_cast<size_t>(p), 0);
	result.coefficients = theta;
	result.noise_coefficients = augmented_fit.coefficients.tail(augmented.cols() - p);
	result.used_least_norm = augmented_fit.used_least_norm;
	result.tolerance_used = augmented_fit.tolerance_used;
	for (Eigen::Index j = 0; j < p; j++) {
		result.is_aliased[static_cast<size_t>(j)] = augmented_fit.is_aliased[static_cast<size_t>(j)];
	}
	result.rank = static_cast<size_t>(std::count(result.is_aliased.begin(), result.is_aliased.end(), false));
	result.iterations = iteration;
	result.converged = converged;

	result.residuals = y - psi * theta;
	LeastSquaresSolver::ComputeStatistics(y, result.residuals, result.rank, n, result);

	if (with_std_errors) {
		result.std_errors = augmented_fit.std_errors.head(p);
		result.has_std_errors = true;
	}

	NARMAX_TIMING_END("Extended least squares");

	return result;
}

inline core::EstimationResult ExtendedLeastSquaresSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
                                                              const core::IdentificationOptions &options) {
	return Run(y, psi, options, false);
}

inline core::EstimationResult ExtendedLeastSquaresSolver::FitWithStdErrors(const Eigen::VectorXd &y,
                                                                           const Eigen::MatrixXd &psi,
                                                                           const core::IdentificationOptions &options) {
	return Run(y, psi, options, true);
}

} // namespace solvers
} // namespace libnarmax
