#pragma once

#include "libnarmax/basis/i_basis_function.hpp"
#include "libnarmax/basis/polynomial_basis.hpp"
#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/identification_options.hpp"
#include "libnarmax/core/identification_result.hpp"
#include "libnarmax/regressors/information_matrix.hpp"
#include "libnarmax/selection/frols_selector.hpp"
#include "libnarmax/solvers/i_parameter_estimator.hpp"
#include "libnarmax/utils/tracing.hpp"
#include <Eigen/Dense>
#include <string>

namespace libnarmax {
namespace model {

/**
 * FROLSIdentifier: end-to-end NARMAX identification
 *
 * Data flow of one fit:
 * 1. Validate the options against the data
 * 2. Build the candidate table and the information matrix
 * 3. Select the structure with FROLS (fixed size or information criterion)
 * 4. Estimate the coefficients of the selected terms on their original
 *    columns (least squares, or Extended Least Squares when configured)
 * 5. Assemble the selected model, residuals and traces
 *
 * Every call owns its scratch state, so independent fits can run on
 * separate threads.
 *
 * Stateless design (all methods are static).
 */
class FROLSIdentifier {
public:
	/**
	 * Identify a polynomial model with the configured degree
	 *
	 * @param X Input signals (samples x channels; may have zero columns for NAR)
	 * @param y Output signal
	 * @param options Identification options
	 *
	 * @throws InvalidRegressorSpecError, InsufficientDataError,
	 *         DegenerateRegressorError, SingularMatrixError (see core/errors.hpp)
	 * @throws std::invalid_argument if X and y lengths differ
	 */
	static core::IdentificationResult Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                      const core::IdentificationOptions &options);

	/**
	 * Identify a model over an explicit basis function
	 *
	 * @throws InvalidRegressorSpecError if basis.Degree() differs from options.basis_degree
	 */
	static core::IdentificationResult Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                      const core::IdentificationOptions &options,
	                                      const basis::IBasisFunction &basis);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::IdentificationResult FROLSIdentifier::Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                       const core::IdentificationOptions &options) {
	options.Validate();
	const basis::PolynomialBasis basis(options.basis_degree);
	return Fit(X, y, options, basis);
}

inline core::IdentificationResult FROLSIdentifier::Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                       const core::IdentificationOptions &options,
                                                       const basis::IBasisFunction &basis) {
	if (basis.Degree() != options.basis_degree) {
		throw core::InvalidRegressorSpecError("basis degree " + std::to_string(basis.Degree()) +
		                                      " differs from basis_degree " + std::to_string(options.basis_degree));
	}

	NARMAX_TIMING_START();

	// Step 1-2: candidate space
	const regressors::InformationMatrix info = regressors::InformationMatrixBuilder::Build(X, y, options, basis);
	NARMAX_DEBUG(core::ToString(options.model_type) << " candidate table: " << info.table.Size() << " regressors over "
	                                                << info.Rows() << " samples");

	// Step 3: structure selection
	const selection::SelectionResult selected =
	    selection::FROLSSelector::Select(info.matrix, info.target, options, &info.table);

	// Step 4: parameter estimation on the original columns
	Eigen::MatrixXd psi(info.matrix.rows(), static_cast<Eigen::Index>(selected.indices.size()));
	for (size_t j = 0; j < selected.indices.size(); j++) {
		psi.col(static_cast<Eigen::Index>(j)) = info.matrix.col(static_cast<Eigen::Index>(selected.indices[j]));
	}

	const auto estimator = solvers::MakeEstimator(options);
	NARMAX_DEBUG("Estimating " << psi.cols() << " coefficients with " << estimator->GetName());

	core::IdentificationResult result;
	result.estimation = estimator->FitWithStdErrors(info.target, psi, options);

	// Step 5: assemble
	result.model.n_inputs = static_cast<size_t>(X.cols());
	result.model.degree = basis.Degree();
	for (size_t j = 0; j < selected.indices.size(); j++) {
		core::SelectedTerm term;
		term.code = info.table[selected.indices[j]];
		term.err = selected.err[j];
		term.coefficient = result.estimation.coefficients(static_cast<Eigen::Index>(j));
		result.model.terms.push_back(term);
	}

	result.residuals = result.estimation.residuals;
	result.criterion_trace = selected.criterion_trace;
	result.rss_trace = selected.rss_trace;
	result.rounds_run = selected.rounds_run;
	result.truncated = selected.truncated;
	result.n_candidates = info.table.Size();
	result.max_lag = info.max_lag;

	NARMAX_INFO("Identified " << result.model.Size() << "-term model (ERR sum " << result.ErrSum() << "): "
	                          << result.model.ToString());

	NARMAX_TIMING_END("FROLS identification");

	return result;
}

} // namespace model
} // namespace libnarmax
