#pragma once

#include "libnarmax/core/errors.hpp"
#include "libnarmax/regressors/regressor_code.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace libnarmax {
namespace regressors {

/**
 * Lagged signal columns aligned on the valid samples
 *
 * Row r corresponds to sample k = max_lag + r; the column of factor code
 * "signal s at lag l" holds s[k - l].
 */
struct LaggedData {
	std::vector<int> factor_codes;
	Eigen::MatrixXd columns;
	size_t max_lag = 0;

	size_t Rows() const {
		return static_cast<size_t>(columns.rows());
	}

	bool Has(int factor_code) const {
		return column_of_.count(factor_code) > 0;
	}

	/**
	 * @throws InvalidRegressorSpecError if the factor was not built
	 */
	Eigen::Ref<const Eigen::VectorXd> Column(int factor_code) const {
		auto it = column_of_.find(factor_code);
		if (it == column_of_.end()) {
			throw core::InvalidRegressorSpecError("lagged column for factor " + std::to_string(factor_code) +
			                                      " is not available");
		}
		return columns.col(it->second);
	}

	/**
	 * Build lagged columns for the given factor codes
	 *
	 * @param X Input signals (samples x channels, may have zero columns)
	 * @param y Output signal
	 * @param codes Factor codes to build (output or input blocks)
	 * @param max_lag Number of warm-up samples to drop (>= every lag in codes)
	 */
	static LaggedData Build(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const std::vector<int> &codes,
	                        size_t max_lag) {
		const auto n = static_cast<size_t>(y.size());
		LaggedData data;
		data.max_lag = max_lag;
		data.factor_codes = codes;

		if (n <= max_lag) {
			throw core::InsufficientDataError("need more than " + std::to_string(max_lag) + " samples (got " +
			                                  std::to_string(n) + ")");
		}

		const auto rows = static_cast<Eigen::Index>(n - max_lag);
		data.columns.resize(rows, static_cast<Eigen::Index>(codes.size()));

		for (size_t j = 0; j < codes.size(); j++) {
			const TermFactor factor = RegressorEncoder::DecodeFactor(codes[j]);
			if (static_cast<size_t>(factor.lag) > max_lag) {
				throw core::InvalidRegressorSpecError("lag " + std::to_string(factor.lag) +
				                                      " exceeds the warm-up length " + std::to_string(max_lag));
			}

			const auto start = static_cast<Eigen::Index>(max_lag) - factor.lag;
			auto j_idx = static_cast<Eigen::Index>(j);
			if (factor.kind == SignalKind::OUTPUT) {
				data.columns.col(j_idx) = y.segment(start, rows);
			} else {
				if (factor.input >= static_cast<size_t>(X.cols())) {
					throw core::InvalidRegressorSpecError("term references input x" + std::to_string(factor.input + 1) +
					                                      " but the data has " + std::to_string(X.cols()) +
					                                      " inputs");
				}
				data.columns.col(j_idx) = X.col(static_cast<Eigen::Index>(factor.input)).segment(start, rows);
			}
			data.column_of_[codes[j]] = j_idx;
		}

		return data;
	}

private:
	std::map<int, Eigen::Index> column_of_;
};

} // namespace regressors
} // namespace libnarmax
