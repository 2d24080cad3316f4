#pragma once

#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/identification_options.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <string>

namespace libnarmax {
namespace selection {

/**
 * Information criteria for choosing the model size
 *
 * All criteria use the maximum-likelihood residual variance
 * sigma^2 = RSS / n and drop the constant terms of the Gaussian
 * log-likelihood, so they differ from R's AIC()/BIC() by an offset that
 * depends only on n. Rankings between nested models are identical.
 *
 *   AIC  = n*ln(sigma^2) + 2k
 *   AICc = AIC + 2k(k+1)/(n-k-1)          (+inf when n <= k+1)
 *   BIC  = n*ln(sigma^2) + k*ln(n)
 *   FPE  = n*ln(sigma^2 * (n+k)/(n-k))    (+inf when n <= k)
 *   LILC = n*ln(sigma^2) + 2k*ln(ln(n))
 *
 * sigma^2 is floored at kMinVariance so that exact fits stay finite.
 */
class InformationCriteria {
public:
	static constexpr double kMinVariance = 1e-20;

	static double AIC(double rss, size_t n_samples, size_t n_params) {
		const double n = static_cast<double>(n_samples);
		return n * std::log(Variance(rss, n_samples)) + 2.0 * static_cast<double>(n_params);
	}

	static double AICc(double rss, size_t n_samples, size_t n_params) {
		if (n_samples <= n_params + 1) {
			return std::numeric_limits<double>::infinity();
		}
		const double n = static_cast<double>(n_samples);
		const double k = static_cast<double>(n_params);
		return AIC(rss, n_samples, n_params) + (2.0 * k * (k + 1.0)) / (n - k - 1.0);
	}

	static double BIC(double rss, size_t n_samples, size_t n_params) {
		const double n = static_cast<double>(n_samples);
		return n * std::log(Variance(rss, n_samples)) + static_cast<double>(n_params) * std::log(n);
	}

	static double FPE(double rss, size_t n_samples, size_t n_params) {
		if (n_samples <= n_params) {
			return std::numeric_limits<double>::infinity();
		}
		const double n = static_cast<double>(n_samples);
		const double k = static_cast<double>(n_params);
		return n * std::log(Variance(rss, n_samples) * (n + k) / (n - k));
	}

	static double LILC(double rss, size_t n_samples, size_t n_params) {
		const double n = static_cast<double>(n_samples);
		// ln(ln(n)) is negative below n = e; clamp so extra terms never earn a bonus
		const double penalty = std::max(0.0, std::log(std::log(n)));
		return n * std::log(Variance(rss, n_samples)) + 2.0 * static_cast<double>(n_params) * penalty;
	}

	/**
	 * Evaluate a criterion
	 *
	 * @param rss Residual sum of squares of the candidate model
	 * @param n_samples Number of valid samples
	 * @param n_params Number of terms in the model
	 * @throws std::invalid_argument if n_samples is 0
	 */
	static double Compute(core::InformationCriterion criterion, double rss, size_t n_samples, size_t n_params) {
		if (n_samples == 0) {
			throw std::invalid_argument("information criterion needs at least one sample");
		}
		switch (criterion) {
		case core::InformationCriterion::AIC:
			return AIC(rss, n_samples, n_params);
		case core::InformationCriterion::AICC:
			return AICc(rss, n_samples, n_params);
		case core::InformationCriterion::BIC:
			return BIC(rss, n_samples, n_params);
		case core::InformationCriterion::FPE:
			return FPE(rss, n_samples, n_params);
		case core::InformationCriterion::LILC:
			return LILC(rss, n_samples, n_params);
		}
		throw std::invalid_argument("unknown information criterion");
	}

	/// Name -> criterion lookup table (lower-case keys)
	static const std::map<std::string, core::InformationCriterion> &Table() {
		static const std::map<std::string, core::InformationCriterion> table = {
		    {"aic", core::InformationCriterion::AIC},   {"aicc", core::InformationCriterion::AICC},
		    {"bic", core::InformationCriterion::BIC},   {"fpe", core::InformationCriterion::FPE},
		    {"lilc", core::InformationCriterion::LILC},
		};
		return table;
	}

	/**
	 * @throws InvalidRegressorSpecError for an unknown name
	 */
	static core::InformationCriterion FromName(const std::string &name) {
		const auto &table = Table();
		auto it = table.find(core::ToLower(name));
		if (it == table.end()) {
			throw core::InvalidRegressorSpecError("info_criterion must be one of aic, aicc, bic, fpe, lilc (got '" +
			                                      name + "')");
		}
		return it->second;
	}

	static std::string Name(core::InformationCriterion criterion) {
		for (const auto &entry : Table()) {
			if (entry.second == criterion) {
				return entry.first;
			}
		}
		return "unknown";
	}

private:
	static double Variance(double rss, size_t n_samples) {
		return std::max(rss / static_cast<double>(n_samples), kMinVariance);
	}
};

} // namespace selection
} // namespace libnarmax
