#pragma once

#include "libnarmax/basis/i_basis_function.hpp"
#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/identification_options.hpp"
#include "libnarmax/regressors/candidate_table.hpp"
#include "libnarmax/regressors/lagged_data.hpp"
#include "libnarmax/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace libnarmax {
namespace regressors {

/**
 * Candidate regressor matrix and its aligned target
 *
 * matrix has one row per valid sample (N - max_lag rows) and one column per
 * entry of table, in table order. target holds y[max_lag..N-1].
 */
struct InformationMatrix {
	CandidateTable table;
	Eigen::MatrixXd matrix;
	Eigen::VectorXd target;
	size_t max_lag = 0;

	size_t Rows() const {
		return static_cast<size_t>(matrix.rows());
	}

	size_t Cols() const {
		return static_cast<size_t>(matrix.cols());
	}
};

/**
 * InformationMatrixBuilder: lagged signals -> candidate regressor matrix
 *
 * Two paths share one output contract:
 * - Build(): generates the full candidate table through the basis function
 * - BuildPredefined(): evaluates only a fixed term list, skipping the full
 *   expansion (used when the structure is already known, e.g. prediction)
 *
 * Stateless design (all methods are static).
 */
class InformationMatrixBuilder {
public:
	/**
	 * Build the full candidate table and information matrix
	 *
	 * @param X Input signals (samples x channels; zero columns for NAR)
	 * @param y Output signal
	 * @param options Lag, degree and model-type configuration
	 * @param basis Basis function expansion
	 *
	 * @throws InvalidRegressorSpecError on inconsistent configuration
	 * @throws InsufficientDataError when N <= max_lag
	 * @throws std::invalid_argument when X and y lengths differ
	 */
	static InformationMatrix Build(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                               const core::IdentificationOptions &options, const basis::IBasisFunction &basis);

	/**
	 * Evaluate a predefined term list with the configured warm-up
	 *
	 * The warm-up is the larger of the configured max lag and the largest lag
	 * among the terms, so rows line up with Build() whenever the terms come
	 * from the configured candidate space.
	 */
	static InformationMatrix BuildPredefined(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                         const core::IdentificationOptions &options,
	                                         const basis::IBasisFunction &basis,
	                                         const std::vector<RegressorCode> &terms);

	/**
	 * Evaluate a predefined term list with an explicit warm-up length
	 *
	 * @param max_lag Warm-up samples to drop (>= every lag in terms)
	 */
	static InformationMatrix BuildPredefined(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                         const basis::IBasisFunction &basis,
	                                         const std::vector<RegressorCode> &terms, size_t max_lag);

private:
	static void ValidateSignals(const Eigen::MatrixXd &X, const Eigen::VectorXd &y);

	/// Distinct non-unit factor codes of a term list, ascending
	static std::vector<int> FactorCodesOf(const std::vector<RegressorCode> &terms);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void InformationMatrixBuilder::ValidateSignals(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.cols() > 0 && X.rows() != y.size()) {
		throw std::invalid_argument("X and y must have the same number of samples (got " + std::to_string(X.rows()) +
		                            " and " + std::to_string(y.size()) + ")");
	}
}

inline std::vector<int> InformationMatrixBuilder::FactorCodesOf(const std::vector<RegressorCode> &terms) {
	std::set<int> codes;
	for (const auto &term : terms) {
		for (int factor_code : term.factors) {
			if (factor_code != 0) {
				codes.insert(factor_code);
			}
		}
	}
	return std::vector<int>(codes.begin(), codes.end());
}

inline InformationMatrix InformationMatrixBuilder::Build(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                         const core::IdentificationOptions &options,
                                                         const basis::IBasisFunction &basis) {
	ValidateSignals(X, y);
	options.Validate(static_cast<size_t>(X.cols()));

	const auto max_lag = static_cast<size_t>(options.MaxLag());
	const auto n_inputs = static_cast<size_t>(X.cols());

	std::vector<int> factor_codes = LaggedFactorCodes(options.ylag, options.xlag, n_inputs, options.model_type);
	LaggedData lagged = LaggedData::Build(X, y, factor_codes, max_lag);

	InformationMatrix info;
	info.max_lag = max_lag;
	info.table = basis.GenerateCandidates(factor_codes);
	info.matrix = basis.Expand(lagged, info.table.Codes());
	info.target = y.tail(static_cast<Eigen::Index>(lagged.Rows()));

	NARMAX_DEBUG("Information matrix " << info.Rows() << " x " << info.Cols() << " (" << basis.GetName()
	                                   << " degree " << basis.Degree() << ", max_lag " << max_lag << ")");

	return info;
}

inline InformationMatrix InformationMatrixBuilder::BuildPredefined(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                                   const core::IdentificationOptions &options,
                                                                   const basis::IBasisFunction &basis,
                                                                   const std::vector<RegressorCode> &terms) {
	options.Validate(static_cast<size_t>(X.cols()));
	const auto max_lag =
	    static_cast<size_t>(std::max(options.MaxLag(), RegressorEncoder::MaxLag(terms)));
	return BuildPredefined(X, y, basis, terms, max_lag);
}

inline InformationMatrix InformationMatrixBuilder::BuildPredefined(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                                   const basis::IBasisFunction &basis,
                                                                   const std::vector<RegressorCode> &terms,
                                                                   size_t max_lag) {
	ValidateSignals(X, y);

	for (const auto &term : terms) {
		if (term.Width() != basis.Degree()) {
			throw core::InvalidRegressorSpecError("term " + RegressorEncoder::ToString(term) + " has width " +
			                                      std::to_string(term.Width()) + " but the basis degree is " +
			                                      std::to_string(basis.Degree()));
		}
	}

	LaggedData lagged = LaggedData::Build(X, y, FactorCodesOf(terms), max_lag);

	InformationMatrix info;
	info.max_lag = max_lag;
	info.table = CandidateTable(terms);
	info.matrix = basis.Expand(lagged, terms);
	info.target = y.tail(static_cast<Eigen::Index>(lagged.Rows()));
	return info;
}

} // namespace regressors
} // namespace libnarmax
