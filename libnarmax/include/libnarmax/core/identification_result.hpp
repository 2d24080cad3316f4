#pragma once

#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/estimation_result.hpp"
#include "libnarmax/regressors/regressor_code.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace libnarmax {
namespace core {

/// One term of an identified model
struct SelectedTerm {
	regressors::RegressorCode code;
	/// Error Reduction Ratio at the round the term was selected
	double err = 0.0;
	double coefficient = 0.0;
};

/**
 * Identified polynomial model: y(k) = sum_j coefficient_j * term_j(k)
 *
 * Terms are kept in selection order (descending contribution at the time of
 * selection) and are unique.
 */
struct SelectedModel {
	std::vector<SelectedTerm> terms;

	/// Number of input channels the model was identified with
	size_t n_inputs = 0;

	/// Width of the regressor codes (polynomial degree of the expansion)
	size_t degree = 0;

	size_t Size() const {
		return terms.size();
	}

	std::vector<regressors::RegressorCode> Codes() const {
		std::vector<regressors::RegressorCode> codes;
		codes.reserve(terms.size());
		for (const auto &term : terms) {
			codes.push_back(term.code);
		}
		return codes;
	}

	Eigen::VectorXd Coefficients() const {
		Eigen::VectorXd coefficients(static_cast<Eigen::Index>(terms.size()));
		for (size_t j = 0; j < terms.size(); j++) {
			coefficients(static_cast<Eigen::Index>(j)) = terms[j].coefficient;
		}
		return coefficients;
	}

	std::vector<double> ErrValues() const {
		std::vector<double> err;
		err.reserve(terms.size());
		for (const auto &term : terms) {
			err.push_back(term.err);
		}
		return err;
	}

	double ErrSum() const {
		double sum = 0.0;
		for (const auto &term : terms) {
			sum += term.err;
		}
		return sum;
	}

	/// Largest lag referenced by any term (0 for a constant-only model)
	int MaxLag() const {
		return regressors::RegressorEncoder::MaxLag(Codes());
	}

	/// Position of a term, or Size() when absent
	size_t IndexOf(const regressors::RegressorCode &code) const {
		for (size_t j = 0; j < terms.size(); j++) {
			if (terms[j].code == code) {
				return j;
			}
		}
		return terms.size();
	}

	/**
	 * Check the internal consistency of the model
	 *
	 * @throws InvalidRegressorSpecError on duplicate terms, code widths that
	 *         differ from degree, invalid factor codes, or inputs beyond n_inputs
	 */
	void Validate() const {
		if (degree == 0) {
			throw InvalidRegressorSpecError("model degree must be positive");
		}
		std::set<regressors::RegressorCode> seen;
		for (const auto &term : terms) {
			if (term.code.Width() != degree) {
				throw InvalidRegressorSpecError("term width " + std::to_string(term.code.Width()) +
				                                " differs from the model degree " + std::to_string(degree));
			}
			// Decode validates every factor code
			regressors::RegressorEncoder::Decode(term.code);
			for (size_t input : regressors::RegressorEncoder::InputsInvolved(term.code)) {
				if (input >= n_inputs) {
					throw InvalidRegressorSpecError("term " + regressors::RegressorEncoder::ToString(term.code) +
					                                " references input x" + std::to_string(input + 1) +
					                                " but the model has " + std::to_string(n_inputs) + " inputs");
				}
			}
			if (!seen.insert(term.code).second) {
				throw InvalidRegressorSpecError("duplicate model term " +
				                                regressors::RegressorEncoder::ToString(term.code));
			}
		}
	}

	/// Equation form, e.g. "y(k) = 0.9 x1(k-2) + 0.1 y(k-1)"
	std::string ToString(int precision = 6) const {
		std::ostringstream out;
		out << std::setprecision(precision) << "y(k) =";
		if (terms.empty()) {
			out << " 0";
		}
		for (size_t j = 0; j < terms.size(); j++) {
			const double c = terms[j].coefficient;
			if (j == 0) {
				out << " " << c;
			} else {
				out << (c < 0.0 ? " - " : " + ") << std::abs(c);
			}
			if (!terms[j].code.IsConstant()) {
				out << " " << regressors::RegressorEncoder::ToString(terms[j].code);
			}
		}
		return out.str();
	}
};

/**
 * Result of one identification run
 */
struct IdentificationResult {
	/// Selected terms with their ERR and estimated coefficients
	SelectedModel model;

	/// One-step-ahead residuals y - Psi*theta on the valid samples
	Eigen::VectorXd residuals;

	/// Information criterion after each scanned round (auto mode only)
	std::vector<double> criterion_trace;

	/// Nested-model residual sum of squares after each scanned round
	std::vector<double> rss_trace;

	/// Rounds the selector ran
	size_t rounds_run = 0;

	/// Selection stopped early because candidates ran out
	bool truncated = false;

	/// Parameter estimation details (statistics, rank, ELS status)
	EstimationResult estimation;

	/// Size of the candidate table the terms were selected from
	size_t n_candidates = 0;

	/// Warm-up samples dropped before the first valid sample
	size_t max_lag = 0;

	/// Sum of the ERR of the selected terms
	double ErrSum() const {
		return model.ErrSum();
	}
};

} // namespace core
} // namespace libnarmax
