#pragma once

#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/identification_options.hpp"
#include "libnarmax/core/lag_spec.hpp"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace libnarmax {
namespace regressors {

/// Kind of signal a lagged factor reads from
enum class SignalKind { OUTPUT, INPUT };

/**
 * One lagged signal raised to a power, e.g. x2(k-3)^2
 */
struct TermFactor {
	SignalKind kind = SignalKind::OUTPUT;
	/// 0-based input channel (ignored for OUTPUT)
	size_t input = 0;
	int lag = 1;
	int exponent = 1;

	bool operator==(const TermFactor &other) const {
		return kind == other.kind && (kind == SignalKind::OUTPUT || input == other.input) && lag == other.lag &&
		       exponent == other.exponent;
	}
};

/**
 * Decoded description of one regressor: the product of its factors.
 * An empty factor list is the constant term.
 */
struct TermSpec {
	std::vector<TermFactor> factors;

	bool IsConstant() const {
		return factors.empty();
	}

	int TotalExponent() const {
		int total = 0;
		for (const auto &factor : factors) {
			total += factor.exponent;
		}
		return total;
	}

	bool operator==(const TermSpec &other) const {
		return factors == other.factors;
	}
};

/**
 * Canonical integer code of a regressor
 *
 * A regressor of a degree-d expansion is stored as d factor codes sorted in
 * descending order and padded with 0 (the unit factor):
 * - output y(k-l)       -> 1000 + l
 * - input  x_i(k-l)     -> 1000 * (i + 2) + l   (i is the 0-based channel)
 *
 * So with degree 2, x1(k-1)y(k-1) is [2001, 1001], y(k-2) is [1002, 0] and
 * the constant term is [0, 0].
 */
struct RegressorCode {
	std::vector<int> factors;

	RegressorCode() = default;
	explicit RegressorCode(std::vector<int> factors_) : factors(std::move(factors_)) {
	}

	/// Constant (intercept) code of the given degree
	static RegressorCode Constant(size_t degree) {
		return RegressorCode(std::vector<int>(degree, 0));
	}

	bool IsConstant() const {
		return std::all_of(factors.begin(), factors.end(), [](int code) { return code == 0; });
	}

	/// Width of the code (the expansion degree it was generated for)
	size_t Width() const {
		return factors.size();
	}

	bool operator==(const RegressorCode &other) const {
		return factors == other.factors;
	}

	bool operator!=(const RegressorCode &other) const {
		return !(*this == other);
	}

	bool operator<(const RegressorCode &other) const {
		return factors < other.factors;
	}
};

/**
 * RegressorEncoder: conversions between term descriptions and codes
 *
 * Stateless; all methods are static. Codes are collision-free as long as
 * lags stay within 1..999, which every encode path checks.
 */
class RegressorEncoder {
public:
	static constexpr int kLagBlock = 1000;
	static constexpr int kOutputBlock = 1;

	/// Factor code of one lagged signal
	static int EncodeFactor(SignalKind kind, size_t input, int lag);

	/// Inverse of EncodeFactor (exponent is 1)
	static TermFactor DecodeFactor(int factor_code);

	/**
	 * Encode a term description into a code of the given width
	 *
	 * @throws InvalidRegressorSpecError for non-positive degree, lags outside
	 *         1..999, non-positive exponents, or total exponent above degree
	 */
	static RegressorCode Encode(const TermSpec &term, size_t degree);

	/// Exact inverse of Encode; factors come out in descending code order
	static TermSpec Decode(const RegressorCode &code);

	/// Largest lag referenced by one code (0 for the constant)
	static int MaxLag(const RegressorCode &code);

	/// Largest lag referenced by any code of a table or model
	static int MaxLag(const std::vector<RegressorCode> &codes);

	/**
	 * Largest lag of a lag configuration
	 *
	 * Scalar, per-input and nested lag forms are all reduced to their
	 * maximum; the model type decides whether ylag and xlag take part.
	 */
	static int MaxLag(const core::LagSpec &ylag, const core::InputLagSpec &xlag, core::ModelType model_type);

	/// Polynomial degree of the term (number of non-unit factors)
	static size_t Degree(const RegressorCode &code);

	/// Whether any factor reads the output signal
	static bool InvolvesOutput(const RegressorCode &code);

	/// Sorted, unique 0-based input channels the term reads
	static std::vector<size_t> InputsInvolved(const RegressorCode &code);

	/// Human-readable name: "1", "y(k-1)", "x1(k-2)y(k-1)", "x2(k-1)^2"
	static std::string ToString(const RegressorCode &code);

private:
	static void ValidateFactorCode(int factor_code);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline int RegressorEncoder::EncodeFactor(SignalKind kind, size_t input, int lag) {
	if (lag < 1 || lag > core::kMaxSupportedLag) {
		throw core::InvalidRegressorSpecError("lag must be in 1.." + std::to_string(core::kMaxSupportedLag) +
		                                      " (got " + std::to_string(lag) + ")");
	}
	const int block = (kind == SignalKind::OUTPUT) ? kOutputBlock : static_cast<int>(input) + 2;
	return block * kLagBlock + lag;
}

inline void RegressorEncoder::ValidateFactorCode(int factor_code) {
	const int lag = factor_code % kLagBlock;
	if (factor_code < kLagBlock || lag == 0) {
		throw core::InvalidRegressorSpecError("invalid factor code " + std::to_string(factor_code));
	}
}

inline TermFactor RegressorEncoder::DecodeFactor(int factor_code) {
	ValidateFactorCode(factor_code);
	TermFactor factor;
	const int block = factor_code / kLagBlock;
	factor.lag = factor_code % kLagBlock;
	factor.exponent = 1;
	if (block == kOutputBlock) {
		factor.kind = SignalKind::OUTPUT;
		factor.input = 0;
	} else {
		factor.kind = SignalKind::INPUT;
		factor.input = static_cast<size_t>(block - 2);
	}
	return factor;
}

inline RegressorCode RegressorEncoder::Encode(const TermSpec &term, size_t degree) {
	if (degree == 0) {
		throw core::InvalidRegressorSpecError("degree must be positive");
	}

	std::vector<int> codes;
	for (const auto &factor : term.factors) {
		if (factor.exponent < 1) {
			throw core::InvalidRegressorSpecError("factor exponent must be positive (got " +
			                                      std::to_string(factor.exponent) + ")");
		}
		const int code = EncodeFactor(factor.kind, factor.input, factor.lag);
		for (int e = 0; e < factor.exponent; e++) {
			codes.push_back(code);
		}
	}

	if (codes.size() > degree) {
		throw core::InvalidRegressorSpecError("term of degree " + std::to_string(codes.size()) +
		                                      " exceeds the expansion degree " + std::to_string(degree));
	}

	codes.resize(degree, 0);
	std::sort(codes.begin(), codes.end(), std::greater<int>());
	return RegressorCode(std::move(codes));
}

inline TermSpec RegressorEncoder::Decode(const RegressorCode &code) {
	std::vector<int> codes;
	for (int factor_code : code.factors) {
		if (factor_code != 0) {
			codes.push_back(factor_code);
		}
	}
	std::sort(codes.begin(), codes.end(), std::greater<int>());

	TermSpec term;
	for (size_t i = 0; i < codes.size();) {
		size_t j = i;
		while (j < codes.size() && codes[j] == codes[i]) {
			j++;
		}
		TermFactor factor = DecodeFactor(codes[i]);
		factor.exponent = static_cast<int>(j - i);
		term.factors.push_back(factor);
		i = j;
	}
	return term;
}

inline int RegressorEncoder::MaxLag(const RegressorCode &code) {
	int max_lag = 0;
	for (int factor_code : code.factors) {
		if (factor_code != 0) {
			max_lag = std::max(max_lag, factor_code % kLagBlock);
		}
	}
	return max_lag;
}

inline int RegressorEncoder::MaxLag(const std::vector<RegressorCode> &codes) {
	int max_lag = 0;
	for (const auto &code : codes) {
		max_lag = std::max(max_lag, MaxLag(code));
	}
	return max_lag;
}

inline int RegressorEncoder::MaxLag(const core::LagSpec &ylag, const core::InputLagSpec &xlag,
                                    core::ModelType model_type) {
	int max_lag = 0;
	if (core::UsesOutputLags(model_type)) {
		max_lag = std::max(max_lag, ylag.Max());
	}
	if (core::UsesInputLags(model_type)) {
		max_lag = std::max(max_lag, xlag.Max());
	}
	return max_lag;
}

inline size_t RegressorEncoder::Degree(const RegressorCode &code) {
	return static_cast<size_t>(
	    std::count_if(code.factors.begin(), code.factors.end(), [](int factor_code) { return factor_code != 0; }));
}

inline bool RegressorEncoder::InvolvesOutput(const RegressorCode &code) {
	return std::any_of(code.factors.begin(), code.factors.end(),
	                   [](int factor_code) { return factor_code != 0 && factor_code / kLagBlock == kOutputBlock; });
}

inline std::vector<size_t> RegressorEncoder::InputsInvolved(const RegressorCode &code) {
	std::set<size_t> inputs;
	for (int factor_code : code.factors) {
		if (factor_code != 0 && factor_code / kLagBlock != kOutputBlock) {
			inputs.insert(DecodeFactor(factor_code).input);
		}
	}
	return std::vector<size_t>(inputs.begin(), inputs.end());
}

inline std::string RegressorEncoder::ToString(const RegressorCode &code) {
	const TermSpec term = Decode(code);
	if (term.IsConstant()) {
		return "1";
	}

	// Inputs first, then the output, matching the usual x1(k-1)y(k-1) notation
	std::string name;
	for (const auto &factor : term.factors) {
		if (factor.kind == SignalKind::OUTPUT) {
			name += "y(k-" + std::to_string(factor.lag) + ")";
		} else {
			name += "x" + std::to_string(factor.input + 1) + "(k-" + std::to_string(factor.lag) + ")";
		}
		if (factor.exponent > 1) {
			name += "^" + std::to_string(factor.exponent);
		}
	}
	return name;
}

} // namespace regressors
} // namespace libnarmax
