#pragma once

#include "libnarmax/regressors/candidate_table.hpp"
#include "libnarmax/regressors/lagged_data.hpp"
#include "libnarmax/regressors/regressor_code.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace libnarmax {
namespace basis {

/**
 * IBasisFunction: expansion of lagged signals into candidate regressors
 *
 * A basis function owns two decisions:
 * - which candidate terms exist for a set of lagged factors
 * - how a term's values are computed from the lagged columns
 *
 * The selection engine and the estimators only see the resulting matrix,
 * so new expansions plug in here without touching them.
 */
class IBasisFunction {
public:
	virtual ~IBasisFunction() = default;

	/**
	 * Get the name of this basis function (e.g., "Polynomial")
	 */
	virtual std::string GetName() const = 0;

	/**
	 * Degree of the expansion (width of the generated codes)
	 */
	virtual size_t Degree() const = 0;

	/**
	 * Generate the candidate table over the given lagged factors
	 *
	 * @param lagged_factor_codes Factor codes of the available lagged signals
	 * @param include_constant Whether the constant term is a candidate
	 * @return Immutable table in deterministic column order
	 */
	virtual regressors::CandidateTable GenerateCandidates(const std::vector<int> &lagged_factor_codes,
	                                                      bool include_constant = true) const = 0;

	/**
	 * Evaluate terms on lagged data
	 *
	 * @param lagged Lagged columns (must contain every factor the terms use)
	 * @param terms Terms to evaluate, in output column order
	 * @return Matrix of lagged.Rows() x terms.size()
	 *
	 * @throws InvalidRegressorSpecError if a term needs an unavailable factor
	 */
	virtual Eigen::MatrixXd Expand(const regressors::LaggedData &lagged,
	                               const std::vector<regressors::RegressorCode> &terms) const = 0;
};

} // namespace basis
} // namespace libnarmax
