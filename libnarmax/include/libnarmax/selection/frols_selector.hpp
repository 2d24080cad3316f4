#pragma once

#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/identification_options.hpp"
#include "libnarmax/regressors/candidate_table.hpp"
#include "libnarmax/selection/err_engine.hpp"
#include "libnarmax/selection/information_criteria.hpp"
#include "libnarmax/utils/tracing.hpp"
#include <Eigen/Dense>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

namespace libnarmax {
namespace selection {

/**
 * Result of a FROLS structure selection run
 */
struct SelectionResult {
	/// Selected column indices in selection order (truncated to best_round)
	std::vector<size_t> indices;

	/// ERR of each selected column, aligned with indices
	std::vector<double> err;

	/// Information criterion after each scanned round (auto mode only)
	std::vector<double> criterion_trace;

	/// Nested-model residual sum of squares after each scanned round
	std::vector<double> rss_trace;

	/// Rounds actually run (auto mode may run past best_round)
	size_t rounds_run = 0;

	/// Number of terms kept; in auto mode the criterion argmin (1-based)
	size_t best_round = 0;

	/// Selection stopped early because candidates ran out
	bool truncated = false;

	double ErrSum() const {
		return std::accumulate(err.begin(), err.end(), 0.0);
	}
};

/**
 * FROLSSelector: Forward Regression Orthogonal Least Squares
 *
 * Runs ErrEngine rounds as an explicit state machine:
 * - FIXED: exactly n_terms rounds
 * - AUTO:  n_info_values rounds; after each round r the configured
 *          information criterion is evaluated on the nested model with r
 *          terms, and the final model keeps the rounds up to the first
 *          minimum of that trace
 *
 * An auto-mode scan longer than the candidate table is shortened to the
 * table size. Otherwise running out of independent candidates throws
 * DegenerateRegressorError unless options.truncate_on_exhaustion is set.
 *
 * Stateless design (all methods are static).
 */
class FROLSSelector {
public:
	/**
	 * @param psi Information matrix (n x M)
	 * @param target Aligned target vector (length n)
	 * @param options Selection configuration
	 * @param table Optional candidate table, used only to name terms in logs
	 *
	 * @throws DegenerateRegressorError when candidates run out (see above)
	 * @throws InvalidRegressorSpecError on invalid options
	 */
	static SelectionResult Select(const Eigen::MatrixXd &psi, const Eigen::VectorXd &target,
	                              const core::IdentificationOptions &options,
	                              const regressors::CandidateTable *table = nullptr);

private:
	/// Accumulated state of one selection run
	struct State {
		size_t round = 0;
		std::vector<size_t> selected;
		std::vector<double> err;
		std::vector<double> criterion_trace;
		std::vector<double> rss_trace;
		size_t best_round = 0;
		double best_value = std::numeric_limits<double>::infinity();
		bool truncated = false;
	};

	static std::string TermName(const regressors::CandidateTable *table, size_t index) {
		if (table != nullptr && index < table->Size()) {
			return regressors::RegressorEncoder::ToString((*table)[index]);
		}
		return "column " + std::to_string(index);
	}
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline SelectionResult FROLSSelector::Select(const Eigen::MatrixXd &psi, const Eigen::VectorXd &target,
                                             const core::IdentificationOptions &options,
                                             const regressors::CandidateTable *table) {
	options.Validate();

	const bool auto_mode = options.selection_mode == core::SelectionMode::AUTO;
	const auto n_candidates = static_cast<size_t>(psi.cols());
	const auto n_samples = static_cast<size_t>(psi.rows());
	size_t target_rounds = auto_mode ? options.n_info_values : options.n_terms;
	bool limited = false;

	if (auto_mode && target_rounds > n_candidates) {
		NARMAX_WARN("n_info_values " << target_rounds << " exceeds the " << n_candidates
		                             << " candidate regressors, scanning " << n_candidates << " rounds");
		target_rounds = n_candidates;
	}

	if (target_rounds > n_candidates) {
		if (!options.truncate_on_exhaustion) {
			throw core::DegenerateRegressorError("requested " + std::to_string(target_rounds) +
			                                     " rounds but only " + std::to_string(n_candidates) +
			                                     " candidate regressors exist");
		}
		NARMAX_WARN("Requested " << target_rounds << " rounds, limiting to " << n_candidates << " candidates");
		target_rounds = n_candidates;
		limited = true;
	}

	NARMAX_TIMING_START();

	ErrEngine engine(psi, target, target_rounds, options.degeneracy_tolerance);
	State state;
	state.truncated = limited;

	while (state.round < target_rounds) {
		if (engine.EligibleCount() == 0) {
			// Auto mode already holds a criterion trace to choose from
			const bool can_stop = state.round > 0 && (auto_mode || options.truncate_on_exhaustion);
			if (!can_stop) {
				throw core::DegenerateRegressorError("round " + std::to_string(state.round + 1) +
				                                     ": no remaining candidate is linearly independent of the " +
				                                     std::to_string(state.round) + " selected terms");
			}
			NARMAX_WARN("No independent candidates left after " << state.round << " terms, stopping selection");
			state.truncated = true;
			break;
		}

		const RoundSelection round = engine.SelectNext();
		state.round = round.round;
		state.selected.push_back(round.index);
		state.err.push_back(round.err);
		state.rss_trace.push_back(round.rss);

		NARMAX_DEBUG("FROLS round " << round.round << ": " << TermName(table, round.index) << " ERR=" << round.err
		                            << " RSS=" << round.rss);

		if (auto_mode) {
			const double value =
			    InformationCriteria::Compute(options.info_criterion, round.rss, n_samples, state.round);
			state.criterion_trace.push_back(value);
			if (value < state.best_value) {
				state.best_value = value;
				state.best_round = state.round;
			}
		}
	}

	if (!auto_mode) {
		state.best_round = state.round;
	} else if (state.best_round == 0) {
		// Every criterion value was NaN; keep the whole scan
		state.best_round = state.round;
	}

	SelectionResult result;
	result.rounds_run = state.round;
	result.best_round = state.best_round;
	result.truncated = state.truncated;
	result.criterion_trace = std::move(state.criterion_trace);
	result.rss_trace = std::move(state.rss_trace);
	result.indices.assign(state.selected.begin(), state.selected.begin() + static_cast<std::ptrdiff_t>(state.best_round));
	result.err.assign(state.err.begin(), state.err.begin() + static_cast<std::ptrdiff_t>(state.best_round));

	if (auto_mode) {
		NARMAX_INFO("Information criterion '" << InformationCriteria::Name(options.info_criterion) << "' chose "
		                                      << result.best_round << " of " << result.rounds_run
		                                      << " scanned terms");
	}

	NARMAX_TIMING_END("FROLS selection");

	return result;
}

} // namespace selection
} // namespace libnarmax
