#pragma once

#include "libnarmax/regressors/regressor_code.hpp"
#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace libnarmax {
namespace regressors {

/**
 * Immutable, ordered list of candidate regressors
 *
 * The position of a code in the table is the column index of that regressor
 * in the information matrix and in every selection result.
 */
class CandidateTable {
public:
	static constexpr size_t npos = std::numeric_limits<size_t>::max();

	CandidateTable() = default;

	/**
	 * @param codes Candidate codes in column order (must be unique)
	 * @throws InvalidRegressorSpecError on duplicate codes or mixed widths
	 */
	explicit CandidateTable(std::vector<RegressorCode> codes) : codes_(std::move(codes)) {
		for (size_t i = 0; i < codes_.size(); i++) {
			if (codes_[i].Width() != codes_[0].Width()) {
				throw core::InvalidRegressorSpecError("candidate codes must all have the same width");
			}
			if (!index_.emplace(codes_[i], i).second) {
				throw core::InvalidRegressorSpecError("duplicate candidate regressor " +
				                                      RegressorEncoder::ToString(codes_[i]));
			}
		}
	}

	size_t Size() const {
		return codes_.size();
	}

	bool Empty() const {
		return codes_.empty();
	}

	const RegressorCode &operator[](size_t index) const {
		return codes_[index];
	}

	const std::vector<RegressorCode> &Codes() const {
		return codes_;
	}

	/// Column index of a code, or npos when it is not a candidate
	size_t IndexOf(const RegressorCode &code) const {
		auto it = index_.find(code);
		return it == index_.end() ? npos : it->second;
	}

	/// Code width (expansion degree), 0 for an empty table
	size_t Degree() const {
		return codes_.empty() ? 0 : codes_[0].Width();
	}

	int MaxLag() const {
		return RegressorEncoder::MaxLag(codes_);
	}

	/// Codes at the given column indices, in that order
	std::vector<RegressorCode> Subset(const std::vector<size_t> &indices) const {
		std::vector<RegressorCode> subset;
		subset.reserve(indices.size());
		for (size_t index : indices) {
			subset.push_back(codes_.at(index));
		}
		return subset;
	}

private:
	std::vector<RegressorCode> codes_;
	std::map<RegressorCode, size_t> index_;
};

/**
 * Lagged factor codes of a configuration, in regressor-space order:
 * output lags ascending, then each input's lags ascending.
 *
 * @param n_inputs Number of input channels in the data
 */
inline std::vector<int> LaggedFactorCodes(const core::LagSpec &ylag, const core::InputLagSpec &xlag, size_t n_inputs,
                                          core::ModelType model_type) {
	std::vector<int> codes;
	if (core::UsesOutputLags(model_type)) {
		for (int lag : ylag.lags) {
			codes.push_back(RegressorEncoder::EncodeFactor(SignalKind::OUTPUT, 0, lag));
		}
	}
	if (core::UsesInputLags(model_type)) {
		for (size_t input = 0; input < n_inputs; input++) {
			for (int lag : xlag.ForInput(input).lags) {
				codes.push_back(RegressorEncoder::EncodeFactor(SignalKind::INPUT, input, lag));
			}
		}
	}
	return codes;
}

} // namespace regressors
} // namespace libnarmax
