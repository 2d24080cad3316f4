#pragma once

#include "libnarmax/core/errors.hpp"
#include "libnarmax/core/lag_spec.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace libnarmax {
namespace core {

/// Which lagged signals enter the regressor space
enum class ModelType {
	NARMAX, ///< lagged outputs and inputs (noise terms only through ELS)
	NARX,   ///< lagged outputs and inputs
	NAR,    ///< lagged outputs only
	NFIR    ///< lagged inputs only
};

enum class SelectionMode {
	FIXED, ///< select exactly n_terms regressors
	AUTO   ///< scan n_info_values rounds and keep the information-criterion minimum
};

enum class InformationCriterion { AIC, AICC, BIC, FPE, LILC };

/// What parameter estimation does with a rank-deficient system
enum class SingularPolicy {
	THROW,      ///< throw SingularMatrixError
	LEAST_NORM  ///< return the minimum-norm least-squares solution
};

inline std::string ToLower(std::string value) {
	std::transform(value.begin(), value.end(), value.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return value;
}

inline std::string ToString(ModelType type) {
	switch (type) {
	case ModelType::NARMAX:
		return "NARMAX";
	case ModelType::NARX:
		return "NARX";
	case ModelType::NAR:
		return "NAR";
	case ModelType::NFIR:
		return "NFIR";
	}
	return "UNKNOWN";
}

inline ModelType ModelTypeFromString(const std::string &name) {
	const std::string lower = ToLower(name);
	if (lower == "narmax") {
		return ModelType::NARMAX;
	}
	if (lower == "narx") {
		return ModelType::NARX;
	}
	if (lower == "nar") {
		return ModelType::NAR;
	}
	if (lower == "nfir") {
		return ModelType::NFIR;
	}
	throw InvalidRegressorSpecError("model_type must be NARMAX, NARX, NAR or NFIR (got '" + name + "')");
}

inline SelectionMode SelectionModeFromString(const std::string &name) {
	const std::string lower = ToLower(name);
	if (lower == "fixed") {
		return SelectionMode::FIXED;
	}
	if (lower == "auto") {
		return SelectionMode::AUTO;
	}
	throw InvalidRegressorSpecError("selection_mode must be 'fixed' or 'auto' (got '" + name + "')");
}

inline SingularPolicy SingularPolicyFromString(const std::string &name) {
	const std::string lower = ToLower(name);
	if (lower == "error") {
		return SingularPolicy::THROW;
	}
	if (lower == "least_norm") {
		return SingularPolicy::LEAST_NORM;
	}
	throw InvalidRegressorSpecError("singular_policy must be 'error' or 'least_norm' (got '" + name + "')");
}

/// Whether the model type draws on lagged outputs
inline bool UsesOutputLags(ModelType type) {
	return type != ModelType::NFIR;
}

/// Whether the model type draws on lagged inputs
inline bool UsesInputLags(ModelType type) {
	return type != ModelType::NAR;
}

/**
 * Configuration options for NARMAX structure selection and estimation
 *
 * All options have defaults matching common FROLS practice and can be
 * overridden individually. Validate() rejects invalid values before any
 * computation starts.
 */
struct IdentificationOptions {
	// ========================================================================
	// Regressor space
	// ========================================================================

	/// Output lags. Default: 1..2
	LagSpec ylag = LagSpec::UpTo(2);

	/// Input lags (uniform, per-input maximum, or per-input explicit). Default: 1..2
	InputLagSpec xlag = InputLagSpec::Uniform(2);

	/// Polynomial degree of the basis expansion
	size_t basis_degree = 2;

	ModelType model_type = ModelType::NARMAX;

	// ========================================================================
	// Structure selection
	// ========================================================================

	SelectionMode selection_mode = SelectionMode::AUTO;

	/// Number of terms selected in fixed mode
	size_t n_terms = 0;

	/// Number of rounds scanned in auto mode
	size_t n_info_values = 15;

	InformationCriterion info_criterion = InformationCriterion::AIC;

	/// Relative squared-norm floor below which an orthogonalized candidate
	/// is treated as linearly dependent on the selected set
	double degeneracy_tolerance = 1e-10;

	/// Stop selection early (with a warning) instead of throwing
	/// DegenerateRegressorError when candidates run out
	bool truncate_on_exhaustion = false;

	// ========================================================================
	// Parameter estimation
	// ========================================================================

	bool extended_least_squares = false;

	/// Residual lags added by Extended Least Squares
	size_t residual_lag = 2;

	size_t els_max_iterations = 30;

	/// Relative coefficient change that ends the ELS loop
	double els_tolerance = 1e-6;

	SingularPolicy singular_policy = SingularPolicy::THROW;

	/// QR decomposition rank tolerance (-1 = auto, use Eigen default)
	double qr_tolerance = -1.0;

	// ========================================================================
	// Constructors
	// ========================================================================

	IdentificationOptions() = default;

	/// Fixed-size selection of n_terms_ regressors
	static IdentificationOptions Fixed(size_t n_terms_) {
		IdentificationOptions opts;
		opts.selection_mode = SelectionMode::FIXED;
		opts.n_terms = n_terms_;
		return opts;
	}

	/// Automatic order selection over n_info_values_ rounds
	static IdentificationOptions Auto(size_t n_info_values_ = 15,
	                                  InformationCriterion criterion_ = InformationCriterion::AIC) {
		IdentificationOptions opts;
		opts.selection_mode = SelectionMode::AUTO;
		opts.n_info_values = n_info_values_;
		opts.info_criterion = criterion_;
		return opts;
	}

	/// Largest lag the configured regressor space references
	int MaxLag() const {
		int max_lag = 0;
		if (UsesOutputLags(model_type)) {
			max_lag = std::max(max_lag, ylag.Max());
		}
		if (UsesInputLags(model_type)) {
			max_lag = std::max(max_lag, xlag.Max());
		}
		return max_lag;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate options that do not depend on the data
	 *
	 * @throws InvalidRegressorSpecError if validation fails
	 */
	void Validate() const {
		if (basis_degree == 0) {
			throw InvalidRegressorSpecError("basis_degree must be positive");
		}

		if (UsesOutputLags(model_type)) {
			ylag.Validate("ylag");
		}

		if (selection_mode == SelectionMode::FIXED && n_terms == 0) {
			throw InvalidRegressorSpecError("n_terms must be positive in fixed selection mode");
		}

		if (selection_mode == SelectionMode::AUTO && n_info_values == 0) {
			throw InvalidRegressorSpecError("n_info_values must be positive in auto selection mode");
		}

		// Written so that NaN fails too
		if (!(degeneracy_tolerance >= 0.0 && degeneracy_tolerance < 1.0)) {
			throw InvalidRegressorSpecError("degeneracy_tolerance must be in [0, 1) (got " +
			                                std::to_string(degeneracy_tolerance) + ")");
		}

		if (extended_least_squares) {
			if (residual_lag == 0 || residual_lag > static_cast<size_t>(kMaxSupportedLag)) {
				throw InvalidRegressorSpecError("residual_lag must be in 1.." + std::to_string(kMaxSupportedLag) +
				                                " (got " + std::to_string(residual_lag) + ")");
			}
			if (els_max_iterations == 0) {
				throw InvalidRegressorSpecError("els_max_iterations must be positive");
			}
			if (!(els_tolerance > 0.0)) {
				throw InvalidRegressorSpecError("els_tolerance must be positive (got " +
				                                std::to_string(els_tolerance) + ")");
			}
		}
	}

	/**
	 * Validate options against the number of input channels in the data
	 *
	 * @throws InvalidRegressorSpecError if validation fails
	 */
	void Validate(size_t n_inputs) const {
		Validate();

		if (UsesInputLags(model_type)) {
			if (n_inputs == 0) {
				throw InvalidRegressorSpecError("model_type " + ToString(model_type) +
				                                " requires at least one input signal");
			}
			xlag.Validate(n_inputs);
		}
	}
};

} // namespace core
} // namespace libnarmax
