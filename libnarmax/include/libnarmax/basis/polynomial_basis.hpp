#pragma once

#include "libnarmax/basis/i_basis_function.hpp"
#include "libnarmax/core/errors.hpp"
#include <algorithm>

namespace libnarmax {
namespace basis {

/**
 * Polynomial basis: every product of lagged factors up to a given degree
 *
 * Candidates are the combinations with replacement of
 * [0, f_1, ..., f_m] (0 being the unit factor, f sorted ascending), each
 * stored in descending order. For degree 2 over y(k-1), x1(k-1) this gives:
 *   1, y(k-1), x1(k-1), y(k-1)^2, x1(k-1)y(k-1), x1(k-1)^2
 */
class PolynomialBasis : public IBasisFunction {
public:
	/**
	 * @throws InvalidRegressorSpecError if degree is 0
	 */
	explicit PolynomialBasis(size_t degree) : degree_(degree) {
		if (degree_ == 0) {
			throw core::InvalidRegressorSpecError("polynomial degree must be positive");
		}
	}

	std::string GetName() const override {
		return "Polynomial";
	}

	size_t Degree() const override {
		return degree_;
	}

	regressors::CandidateTable GenerateCandidates(const std::vector<int> &lagged_factor_codes,
	                                              bool include_constant = true) const override {
		std::vector<int> elements;
		elements.reserve(lagged_factor_codes.size() + 1);
		elements.push_back(0);
		elements.insert(elements.end(), lagged_factor_codes.begin(), lagged_factor_codes.end());
		std::sort(elements.begin() + 1, elements.end());
		elements.erase(std::unique(elements.begin() + 1, elements.end()), elements.end());

		std::vector<regressors::RegressorCode> codes;
		std::vector<size_t> pick(degree_, 0);
		const size_t m = elements.size();

		// Non-decreasing index vectors enumerate combinations with replacement
		while (true) {
			std::vector<int> factors(degree_);
			for (size_t i = 0; i < degree_; i++) {
				factors[i] = elements[pick[degree_ - 1 - i]];
			}
			regressors::RegressorCode code(std::move(factors));
			if (include_constant || !code.IsConstant()) {
				codes.push_back(std::move(code));
			}

			size_t pos = degree_;
			while (pos > 0 && pick[pos - 1] == m - 1) {
				pos--;
			}
			if (pos == 0) {
				break;
			}
			const size_t next = pick[pos - 1] + 1;
			for (size_t i = pos - 1; i < degree_; i++) {
				pick[i] = next;
			}
		}

		return regressors::CandidateTable(std::move(codes));
	}

	Eigen::MatrixXd Expand(const regressors::LaggedData &lagged,
	                       const std::vector<regressors::RegressorCode> &terms) const override {
		const auto rows = static_cast<Eigen::Index>(lagged.Rows());
		Eigen::MatrixXd psi(rows, static_cast<Eigen::Index>(terms.size()));

		for (size_t j = 0; j < terms.size(); j++) {
			auto column = psi.col(static_cast<Eigen::Index>(j));
			column.setOnes();
			for (int factor_code : terms[j].factors) {
				if (factor_code != 0) {
					column.array() *= lagged.Column(factor_code).array();
				}
			}
		}

		return psi;
	}

private:
	size_t degree_;
};

} // namespace basis
} // namespace libnarmax
