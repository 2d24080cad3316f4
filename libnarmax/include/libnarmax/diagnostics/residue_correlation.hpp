#pragma once

#include <Eigen/Dense>
#include <vector>

namespace libnarmax {
namespace diagnostics {

/**
 * Correlation function of a residual sequence, lag by lag
 */
struct CorrelationResult {
	/// Lags 0..max_lag
	std::vector<size_t> lags;

	/// Normalized correlation at each lag (NaN when a signal has zero variance)
	Eigen::VectorXd values;

	/// Half-width of the 95% confidence band: 1.96 / sqrt(N)
	double confidence_bound = 0.0;

	/// Number of lags whose |value| exceeds the band (NaN values do not count)
	size_t CountOutsideBand(size_t first_lag = 0) const;
};

/**
 * ResidueCorrelation: residual whiteness and independence tests
 *
 * A well identified model leaves residuals that are uncorrelated with their
 * own past and with the inputs. Both functions only compute the correlation
 * and the band; deciding whether a model passes is up to the caller.
 *
 *   Autocorrelation:  rho(t) = sum (e_k - e_bar)(e_{k+t} - e_bar) / sum (e_k - e_bar)^2
 *   CrossCorrelation: rho(t) = sum (x_k - x_bar)(e_{k+t} - e_bar)
 *                              / sqrt(sum (x_k - x_bar)^2 * sum (e_k - e_bar)^2)
 *
 * Stateless design (all methods are static).
 */
class ResidueCorrelation {
public:
	static constexpr double kConfidenceZ = 1.96;

	/**
	 * @param residuals Residual sequence (length N)
	 * @param max_lag Largest lag evaluated
	 * @throws InsufficientDataError if max_lag >= N
	 */
	static CorrelationResult Autocorrelation(const Eigen::VectorXd &residuals, size_t max_lag);

	/**
	 * @param residuals Residual sequence (length N)
	 * @param signal Input signal aligned with the residuals (length N)
	 * @param max_lag Largest lag evaluated
	 * @throws InsufficientDataError if max_lag >= N
	 * @throws std::invalid_argument if the lengths differ
	 */
	static CorrelationResult CrossCorrelation(const Eigen::VectorXd &residuals, const Eigen::VectorXd &signal,
	                                          size_t max_lag);

private:
	static CorrelationResult Correlate(const Eigen::VectorXd &lead, const Eigen::VectorXd &lagged, size_t max_lag);
};

} // namespace diagnostics
} // namespace libnarmax
