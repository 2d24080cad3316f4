#pragma once

#include "libnarmax/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace libnarmax {
namespace selection {

/// Outcome of one orthogonalization round
struct RoundSelection {
	/// Column index of the chosen candidate
	size_t index = 0;
	/// Error Reduction Ratio of the chosen candidate
	double err = 0.0;
	/// 1-based round number
	size_t round = 0;
	/// Residual sum of squares of the nested model after this round
	double rss = 0.0;
};

/**
 * ErrEngine: modified Gram-Schmidt orthogonalization with ERR ranking
 *
 * Holds a working copy of every candidate column. After each selection the
 * new orthogonal direction is projected out of every remaining candidate and
 * out of the target residual, one direction at a time (modified, not
 * classical, Gram-Schmidt). The ERR of candidate j in the next round is
 *
 *   ERR_j = (w_j' r)^2 / (w_j' w_j * y' y)
 *
 * where w_j is the orthogonalized candidate and r the target with all
 * selected directions removed. Since w_j is orthogonal to those directions,
 * w_j' r equals w_j' y; using r keeps the cancellation error low.
 *
 * The orthogonal basis is a single n x max_rounds buffer filled one column
 * per round and owned by the engine; it is discarded with the engine.
 */
class ErrEngine {
public:
	/// ERR values closer than this are considered tied
	static constexpr double kTieTolerance = 1e-12;

	/**
	 * @param psi Information matrix (n x M), columns in candidate-table order
	 * @param target Target vector (length n)
	 * @param max_rounds Capacity of the orthogonal basis
	 * @param degeneracy_tolerance Relative squared-norm floor for eligibility
	 *
	 * @throws std::invalid_argument on dimension mismatch
	 */
	ErrEngine(const Eigen::MatrixXd &psi, const Eigen::VectorXd &target, size_t max_rounds,
	          double degeneracy_tolerance = 1e-10);

	/**
	 * Run one round: rank every remaining candidate and select the best
	 *
	 * Ties are broken by lowest column index.
	 *
	 * @throws DegenerateRegressorError if every remaining candidate is
	 *         numerically dependent on the selected set (or none remain)
	 * @throws std::out_of_range if max_rounds rounds have already run
	 */
	RoundSelection SelectNext();

	/**
	 * ERR every candidate would have in the next round
	 *
	 * Selected and degenerate candidates report NaN.
	 */
	Eigen::VectorXd CandidateErr() const;

	/// Number of remaining candidates that are not degenerate
	size_t EligibleCount() const;

	size_t Rounds() const {
		return rounds_;
	}

	size_t Capacity() const {
		return static_cast<size_t>(basis_.cols());
	}

	const std::vector<size_t> &Selected() const {
		return selected_;
	}

	const std::vector<double> &ErrValues() const {
		return err_;
	}

	/// Orthogonal columns built so far (n x Rounds())
	Eigen::MatrixXd OrthogonalBasis() const {
		return basis_.leftCols(static_cast<Eigen::Index>(rounds_));
	}

	/**
	 * Coefficients of the target on the orthogonal columns
	 *
	 * These belong to the transformed basis; they are not the model
	 * parameters of the original regressors.
	 */
	Eigen::VectorXd OrthogonalCoefficients() const {
		return Eigen::Map<const Eigen::VectorXd>(orth_coefficients_.data(),
		                                         static_cast<Eigen::Index>(orth_coefficients_.size()));
	}

	/// Residual sum of squares of the nested model with the selected terms
	double ResidualSumOfSquares() const {
		return residual_.squaredNorm();
	}

	double TargetSumOfSquares() const {
		return target_sq_;
	}

private:
	bool IsEligible(size_t j) const;
	double ErrOf(size_t j) const;

	Eigen::MatrixXd work_;
	Eigen::VectorXd original_sq_norms_;
	Eigen::VectorXd residual_;
	Eigen::MatrixXd basis_;
	double target_sq_;
	double degeneracy_tolerance_;

	std::vector<bool> taken_;
	std::vector<size_t> selected_;
	std::vector<double> err_;
	std::vector<double> orth_coefficients_;
	size_t rounds_ = 0;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline ErrEngine::ErrEngine(const Eigen::MatrixXd &psi, const Eigen::VectorXd &target, size_t max_rounds,
                            double degeneracy_tolerance)
    : work_(psi), residual_(target), degeneracy_tolerance_(degeneracy_tolerance) {
	if (psi.rows() != target.size()) {
		throw std::invalid_argument("information matrix has " + std::to_string(psi.rows()) +
		                            " rows but the target has " + std::to_string(target.size()) + " samples");
	}

	original_sq_norms_ = psi.colwise().squaredNorm().transpose();
	target_sq_ = target.squaredNorm();
	basis_.resize(psi.rows(), static_cast<Eigen::Index>(max_rounds));
	taken_.assign(static_cast<size_t>(psi.cols()), false);
	selected_.reserve(max_rounds);
	err_.reserve(max_rounds);
	orth_coefficients_.reserve(max_rounds);
}

inline bool ErrEngine::IsEligible(size_t j) const {
	if (taken_[j]) {
		return false;
	}
	const auto j_idx = static_cast<Eigen::Index>(j);
	const double original = original_sq_norms_(j_idx);
	if (!(original > 0.0) || !std::isfinite(original)) {
		return false;
	}
	const double current = work_.col(j_idx).squaredNorm();
	return current > degeneracy_tolerance_ * original && current > std::numeric_limits<double>::min();
}

inline double ErrEngine::ErrOf(size_t j) const {
	if (!(target_sq_ > 0.0)) {
		return 0.0;
	}
	const auto column = work_.col(static_cast<Eigen::Index>(j));
	const double numerator = column.dot(residual_);
	const double err = (numerator * numerator) / (column.squaredNorm() * target_sq_);
	// Round-off can push the ratio marginally outside [0, 1]
	return std::min(1.0, std::max(0.0, err));
}

inline Eigen::VectorXd ErrEngine::CandidateErr() const {
	Eigen::VectorXd values(work_.cols());
	for (size_t j = 0; j < taken_.size(); j++) {
		values(static_cast<Eigen::Index>(j)) =
		    IsEligible(j) ? ErrOf(j) : std::numeric_limits<double>::quiet_NaN();
	}
	return values;
}

inline size_t ErrEngine::EligibleCount() const {
	size_t count = 0;
	for (size_t j = 0; j < taken_.size(); j++) {
		if (IsEligible(j)) {
			count++;
		}
	}
	return count;
}

inline RoundSelection ErrEngine::SelectNext() {
	if (rounds_ >= Capacity()) {
		throw std::out_of_range("orthogonal basis capacity of " + std::to_string(Capacity()) + " rounds exhausted");
	}

	bool found = false;
	size_t best = 0;
	double best_err = 0.0;
	for (size_t j = 0; j < taken_.size(); j++) {
		if (!IsEligible(j)) {
			continue;
		}
		const double err = ErrOf(j);
		if (!found || err > best_err + kTieTolerance) {
			found = true;
			best = j;
			best_err = err;
		}
	}

	if (!found) {
		const size_t remaining = static_cast<size_t>(std::count(taken_.begin(), taken_.end(), false));
		throw core::DegenerateRegressorError("round " + std::to_string(rounds_ + 1) + ": none of the " +
		                                     std::to_string(remaining) +
		                                     " remaining candidates is linearly independent of the selected terms");
	}

	const auto best_idx = static_cast<Eigen::Index>(best);
	Eigen::VectorXd w = work_.col(best_idx);

	// Second modified Gram-Schmidt pass on the chosen column
	for (size_t i = 0; i < rounds_; i++) {
		const auto q = basis_.col(static_cast<Eigen::Index>(i));
		w -= (q.dot(w) / q.squaredNorm()) * q;
	}
	const double w_sq = w.squaredNorm();

	basis_.col(static_cast<Eigen::Index>(rounds_)) = w;

	const double g = w.dot(residual_) / w_sq;
	residual_ -= g * w;
	orth_coefficients_.push_back(g);

	taken_[best] = true;
	for (size_t j = 0; j < taken_.size(); j++) {
		if (taken_[j]) {
			continue;
		}
		auto column = work_.col(static_cast<Eigen::Index>(j));
		column -= (w.dot(column) / w_sq) * w;
	}

	selected_.push_back(best);
	err_.push_back(best_err);
	rounds_++;

	RoundSelection result;
	result.index = best;
	result.err = best_err;
	result.round = rounds_;
	result.rss = ResidualSumOfSquares();
	return result;
}

} // namespace selection
} // namespace libnarmax
