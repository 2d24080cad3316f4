#pragma once

#include "libnarmax/basis/polynomial_basis.hpp"
#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/identification_result.hpp"
#include "libnarmax/regressors/information_matrix.hpp"
#include "libnarmax/regressors/regressor_code.hpp"
#include "libnarmax/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace libnarmax {
namespace model {

/**
 * ModelSimulator: predictions of an identified polynomial model
 *
 * - OneStepAhead: every prediction uses measured past outputs. The term
 *   columns come from the predefined-regressor path of the information
 *   matrix builder, so no candidate table is generated.
 * - FreeRun: the model is driven by the inputs only; output terms read the
 *   model's own past predictions after the initial conditions.
 * - NStepAhead: free run restarted from measured outputs every `steps`
 *   samples, so no prediction is more than `steps` samples away from data.
 *
 * Stateless design (all methods are static).
 */
class ModelSimulator {
public:
	/**
	 * One-step-ahead prediction with the model's own warm-up
	 *
	 * @param model Identified model
	 * @param X Input signals (samples x channels, at least model.n_inputs columns)
	 * @param y Measured output
	 * @return Predictions for samples model.MaxLag() .. N-1
	 *
	 * @throws InsufficientDataError if N <= model.MaxLag()
	 * @throws InvalidRegressorSpecError if the model is inconsistent with X
	 */
	static Eigen::VectorXd OneStepAhead(const core::SelectedModel &model, const Eigen::MatrixXd &X,
	                                    const Eigen::VectorXd &y);

	/**
	 * One-step-ahead prediction with an explicit warm-up
	 *
	 * Passing IdentificationResult::max_lag aligns the predictions with the
	 * residuals of the fit.
	 *
	 * @param max_lag Warm-up samples to skip (>= model.MaxLag())
	 * @return Predictions for samples max_lag .. N-1
	 */
	static Eigen::VectorXd OneStepAhead(const core::SelectedModel &model, const Eigen::MatrixXd &X,
	                                    const Eigen::VectorXd &y, size_t max_lag);

	/**
	 * Free-run (infinity-step-ahead) simulation
	 *
	 * The first max_lag samples of the returned series are copied from
	 * y_initial; the rest are simulated. For models without inputs pass an
	 * X with zero columns and one row per sample to simulate.
	 *
	 * @param model Identified model
	 * @param X Input signals (N x channels)
	 * @param y_initial Initial output conditions (at least model.MaxLag() samples)
	 * @return Simulated output of length N
	 *
	 * @throws InsufficientDataError if y_initial or X is shorter than model.MaxLag()
	 * @throws InvalidRegressorSpecError if the model is inconsistent with X
	 */
	static Eigen::VectorXd FreeRun(const core::SelectedModel &model, const Eigen::MatrixXd &X,
	                               const Eigen::VectorXd &y_initial);

	/**
	 * n-step-ahead prediction
	 *
	 * The series is cut into windows of `steps` samples after the warm-up.
	 * Each window is simulated in free run, seeded with the measured outputs
	 * just before it. steps = 1 gives the one-step-ahead predictions and
	 * steps >= N gives the free run.
	 *
	 * @param y Measured output (same number of samples as X)
	 * @param steps Prediction horizon, at least 1
	 * @return Series of length N; the first model.MaxLag() samples are copied from y
	 *
	 * @throws InvalidRegressorSpecError if steps is 0 or X and y differ in length
	 * @throws InsufficientDataError if y is shorter than model.MaxLag()
	 */
	static Eigen::VectorXd NStepAhead(const core::SelectedModel &model, const Eigen::MatrixXd &X,
	                                  const Eigen::VectorXd &y, size_t steps);

private:
	static void CheckModel(const core::SelectedModel &model, const Eigen::MatrixXd &X);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void ModelSimulator::CheckModel(const core::SelectedModel &model, const Eigen::MatrixXd &X) {
	model.Validate();
	if (static_cast<size_t>(X.cols()) < model.n_inputs) {
		throw core::InvalidRegressorSpecError("model uses " + std::to_string(model.n_inputs) +
		                                      " inputs but the data has " + std::to_string(X.cols()));
	}
}

inline Eigen::VectorXd ModelSimulator::OneStepAhead(const core::SelectedModel &model, const Eigen::MatrixXd &X,
                                                    const Eigen::VectorXd &y) {
	return OneStepAhead(model, X, y, static_cast<size_t>(model.MaxLag()));
}

inline Eigen::VectorXd ModelSimulator::OneStepAhead(const core::SelectedModel &model, const Eigen::MatrixXd &X,
                                                    const Eigen::VectorXd &y, size_t max_lag) {
	CheckModel(model, X);
	if (max_lag < static_cast<size_t>(model.MaxLag())) {
		throw core::InvalidRegressorSpecError("warm-up " + std::to_string(max_lag) + " is shorter than the model lag " +
		                                      std::to_string(model.MaxLag()));
	}

	const basis::PolynomialBasis basis(model.degree);
	const regressors::InformationMatrix info =
	    regressors::InformationMatrixBuilder::BuildPredefined(X, y, basis, model.Codes(), max_lag);

	return info.matrix * model.Coefficients();
}

inline Eigen::VectorXd ModelSimulator::FreeRun(const core::SelectedModel &model, const Eigen::MatrixXd &X,
                                               const Eigen::VectorXd &y_initial) {
	CheckModel(model, X);

	const auto max_lag = static_cast<Eigen::Index>(model.MaxLag());
	const auto n = X.rows();

	if (y_initial.size() < max_lag) {
		throw core::InsufficientDataError("free-run simulation needs " + std::to_string(max_lag) +
		                                  " initial output samples (got " + std::to_string(y_initial.size()) + ")");
	}
	if (n < max_lag) {
		throw core::InsufficientDataError("free-run simulation needs at least " + std::to_string(max_lag) +
		                                  " samples (got " + std::to_string(n) + ")");
	}

	// Decode once: each term becomes a list of (factor, exponent) pairs
	std::vector<regressors::TermSpec> specs;
	specs.reserve(model.terms.size());
	for (const auto &term : model.terms) {
		specs.push_back(regressors::RegressorEncoder::Decode(term.code));
	}
	const Eigen::VectorXd theta = model.Coefficients();

	Eigen::VectorXd y_sim(n);
	y_sim.head(max_lag) = y_initial.head(max_lag);

	bool diverged = false;
	for (Eigen::Index k = max_lag; k < n; k++) {
		double value = 0.0;
		for (size_t j = 0; j < specs.size(); j++) {
			double product = theta(static_cast<Eigen::Index>(j));
			for (const auto &factor : specs[j].factors) {
				const Eigen::Index at = k - factor.lag;
				const double base = factor.kind == regressors::SignalKind::OUTPUT
				                        ? y_sim(at)
				                        : X(at, static_cast<Eigen::Index>(factor.input));
				product *= std::pow(base, factor.exponent);
			}
			value += product;
		}
		y_sim(k) = value;

		if (!diverged && !std::isfinite(value)) {
			diverged = true;
			NARMAX_WARN("Free-run simulation diverged at sample " << k);
		}
	}

	return y_sim;
}

inline Eigen::VectorXd ModelSimulator::NStepAhead(const core::SelectedModel &model, const Eigen::MatrixXd &X,
                                                  const Eigen::VectorXd &y, size_t steps) {
	CheckModel(model, X);
	if (steps == 0) {
		throw core::InvalidRegressorSpecError("n-step-ahead prediction needs steps >= 1");
	}
	if (X.rows() != y.size()) {
		throw core::InvalidRegressorSpecError("X and y must have the same number of samples (got " +
		                                      std::to_string(X.rows()) + " and " + std::to_string(y.size()) + ")");
	}

	const auto max_lag = static_cast<Eigen::Index>(model.MaxLag());
	const auto n = y.size();
	if (n < max_lag) {
		throw core::InsufficientDataError("n-step-ahead prediction needs at least " + std::to_string(max_lag) +
		                                  " samples (got " + std::to_string(n) + ")");
	}

	Eigen::VectorXd y_hat(n);
	y_hat.head(max_lag) = y.head(max_lag);

	const auto horizon = static_cast<Eigen::Index>(std::min<size_t>(steps, static_cast<size_t>(n)));
	for (Eigen::Index start = max_lag; start < n; start += horizon) {
		const Eigen::Index length = std::min(horizon, n - start);
		const Eigen::Index first = start - max_lag;
		const Eigen::VectorXd window = FreeRun(model, X.middleRows(first, max_lag + length), y.segment(first, max_lag));
		y_hat.segment(start, length) = window.tail(length);
	}

	return y_hat;
}

} // namespace model
} // namespace libnarmax
