#include "libnarmax/io/options_parser.hpp"

#include "libnarmax/core/errors.hpp"
#include "libnarmax/selection/information_criteria.hpp"

#include <cstdint>
#include <vector>

namespace libnarmax {
namespace io {

using nlohmann::json;

namespace {

int64_t GetInteger(const std::string &key, const json &value) {
	if (!value.is_number_integer()) {
		throw core::InvalidRegressorSpecError("option '" + key + "' must be an integer (got " + value.dump() + ")");
	}
	return value.get<int64_t>();
}

size_t GetSize(const std::string &key, const json &value) {
	const int64_t parsed = GetInteger(key, value);
	if (parsed < 0) {
		throw core::InvalidRegressorSpecError("option '" + key + "' must be non-negative (got " +
		                                      std::to_string(parsed) + ")");
	}
	return static_cast<size_t>(parsed);
}

int GetLag(const std::string &key, const json &value) {
	const int64_t parsed = GetInteger(key, value);
	if (parsed < 1 || parsed > core::kMaxSupportedLag) {
		throw core::InvalidRegressorSpecError("option '" + key + "' lags must be in 1.." +
		                                      std::to_string(core::kMaxSupportedLag) + " (got " +
		                                      std::to_string(parsed) + ")");
	}
	return static_cast<int>(parsed);
}

double GetDouble(const std::string &key, const json &value) {
	if (!value.is_number()) {
		throw core::InvalidRegressorSpecError("option '" + key + "' must be a number (got " + value.dump() + ")");
	}
	return value.get<double>();
}

bool GetBool(const std::string &key, const json &value) {
	if (!value.is_boolean()) {
		throw core::InvalidRegressorSpecError("option '" + key + "' must be true or false (got " + value.dump() + ")");
	}
	return value.get<bool>();
}

std::string GetString(const std::string &key, const json &value) {
	if (!value.is_string()) {
		throw core::InvalidRegressorSpecError("option '" + key + "' must be a string (got " + value.dump() + ")");
	}
	return value.get<std::string>();
}

std::vector<int> GetLagList(const std::string &key, const json &value) {
	std::vector<int> lags;
	for (const auto &entry : value) {
		lags.push_back(GetLag(key, entry));
	}
	return lags;
}

core::LagSpec ParseOutputLags(const json &value) {
	if (value.is_number_integer()) {
		return core::LagSpec::UpTo(GetLag("ylag", value));
	}
	if (value.is_array() && !value.empty()) {
		return core::LagSpec::Explicit(GetLagList("ylag", value));
	}
	throw core::InvalidRegressorSpecError("option 'ylag' must be a positive integer or a non-empty list of lags");
}

core::InputLagSpec ParseInputLags(const json &value) {
	if (value.is_number_integer()) {
		return core::InputLagSpec::Uniform(GetLag("xlag", value));
	}
	if (!value.is_array() || value.empty()) {
		throw core::InvalidRegressorSpecError(
		    "option 'xlag' must be an integer, a list of integers or a list of lag lists");
	}

	bool all_lists = true;
	bool all_integers = true;
	for (const auto &entry : value) {
		all_lists = all_lists && entry.is_array();
		all_integers = all_integers && entry.is_number_integer();
	}

	if (all_integers) {
		std::vector<int> max_lags;
		for (const auto &entry : value) {
			max_lags.push_back(GetLag("xlag", entry));
		}
		return core::InputLagSpec::PerInputMax(max_lags);
	}
	if (all_lists) {
		std::vector<std::vector<int>> lag_lists;
		for (const auto &entry : value) {
			if (entry.empty()) {
				throw core::InvalidRegressorSpecError("option 'xlag' has an empty lag list");
			}
			lag_lists.push_back(GetLagList("xlag", entry));
		}
		return core::InputLagSpec::PerInputExplicit(lag_lists);
	}
	throw core::InvalidRegressorSpecError("option 'xlag' must not mix integers and lag lists");
}

/// Integer n when lags are exactly 1..n, otherwise the explicit list
json LagSpecToJson(const core::LagSpec &spec) {
	bool contiguous = true;
	for (size_t i = 0; i < spec.lags.size(); i++) {
		contiguous = contiguous && spec.lags[i] == static_cast<int>(i + 1);
	}
	if (contiguous && !spec.lags.empty()) {
		return json(spec.Max());
	}
	return json(spec.lags);
}

std::string CriterionName(core::InformationCriterion criterion) {
	return selection::InformationCriteria::Name(criterion);
}

std::string SelectionModeName(core::SelectionMode mode) {
	return mode == core::SelectionMode::FIXED ? "fixed" : "auto";
}

std::string SingularPolicyName(core::SingularPolicy policy) {
	return policy == core::SingularPolicy::THROW ? "error" : "least_norm";
}

} // namespace

std::string OptionsParser::ValidKeys() {
	return "ylag, xlag, basis_degree, model_type, selection_mode, n_terms, n_info_values, info_criterion, "
	       "degeneracy_tolerance, truncate_on_exhaustion, extended_least_squares, residual_lag, "
	       "els_max_iterations, els_tolerance, singular_policy, qr_tolerance";
}

core::IdentificationOptions OptionsParser::Parse(const json &document) {
	core::IdentificationOptions opts;

	// Return defaults if no options provided
	if (document.is_null()) {
		return opts;
	}
	if (!document.is_object()) {
		throw core::InvalidRegressorSpecError("options must be a JSON object (got " + document.dump() + ")");
	}

	bool has_selection_mode = false;
	bool has_n_terms = false;

	for (auto it = document.begin(); it != document.end(); ++it) {
		const std::string &key = it.key();
		const json &value = it.value();

		if (key == "ylag") {
			opts.ylag = ParseOutputLags(value);
		} else if (key == "xlag") {
			opts.xlag = ParseInputLags(value);
		} else if (key == "basis_degree") {
			opts.basis_degree = GetSize(key, value);
		} else if (key == "model_type") {
			opts.model_type = core::ModelTypeFromString(GetString(key, value));
		} else if (key == "selection_mode") {
			opts.selection_mode = core::SelectionModeFromString(GetString(key, value));
			has_selection_mode = true;
		} else if (key == "n_terms") {
			opts.n_terms = GetSize(key, value);
			has_n_terms = true;
		} else if (key == "n_info_values") {
			opts.n_info_values = GetSize(key, value);
		} else if (key == "info_criterion") {
			opts.info_criterion = selection::InformationCriteria::FromName(GetString(key, value));
		} else if (key == "degeneracy_tolerance") {
			opts.degeneracy_tolerance = GetDouble(key, value);
		} else if (key == "truncate_on_exhaustion") {
			opts.truncate_on_exhaustion = GetBool(key, value);
		} else if (key == "extended_least_squares") {
			opts.extended_least_squares = GetBool(key, value);
		} else if (key == "residual_lag") {
			opts.residual_lag = GetSize(key, value);
		} else if (key == "els_max_iterations") {
			opts.els_max_iterations = GetSize(key, value);
		} else if (key == "els_tolerance") {
			opts.els_tolerance = GetDouble(key, value);
		} else if (key == "singular_policy") {
			opts.singular_policy = core::SingularPolicyFromString(GetString(key, value));
		} else if (key == "qr_tolerance") {
			opts.qr_tolerance = GetDouble(key, value);
		} else {
			throw core::InvalidRegressorSpecError("unknown option '" + key + "'. Valid options are: " + ValidKeys());
		}
	}

	if (has_n_terms && !has_selection_mode) {
		opts.selection_mode = core::SelectionMode::FIXED;
	}

	opts.Validate();
	return opts;
}

core::IdentificationOptions OptionsParser::Parse(const std::string &text) {
	json document;
	try {
		document = json::parse(text);
	} catch (const json::parse_error &e) {
		throw core::InvalidRegressorSpecError(std::string("malformed options JSON: ") + e.what());
	}
	return Parse(document);
}

json OptionsParser::ToJson(const core::IdentificationOptions &options) {
	json document;
	document["ylag"] = LagSpecToJson(options.ylag);

	if (options.xlag.IsUniform()) {
		const json shared = LagSpecToJson(options.xlag.ForInput(0));
		if (!shared.is_number_integer()) {
			throw core::InvalidRegressorSpecError("a uniform explicit xlag list has no JSON form; "
			                                      "give one lag list per input instead");
		}
		document["xlag"] = shared;
	} else {
		std::vector<json> per_input;
		bool all_contiguous = true;
		for (size_t i = 0; i < options.xlag.Size(); i++) {
			per_input.push_back(LagSpecToJson(options.xlag.ForInput(i)));
			all_contiguous = all_contiguous && per_input.back().is_number_integer();
		}
		json xlag = json::array();
		for (size_t i = 0; i < per_input.size(); i++) {
			xlag.push_back(all_contiguous ? per_input[i] : json(options.xlag.ForInput(i).lags));
		}
		document["xlag"] = xlag;
	}

	document["basis_degree"] = options.basis_degree;
	document["model_type"] = core::ToString(options.model_type);
	document["selection_mode"] = SelectionModeName(options.selection_mode);
	document["n_terms"] = options.n_terms;
	document["n_info_values"] = options.n_info_values;
	document["info_criterion"] = CriterionName(options.info_criterion);
	document["degeneracy_tolerance"] = options.degeneracy_tolerance;
	document["truncate_on_exhaustion"] = options.truncate_on_exhaustion;
	document["extended_least_squares"] = options.extended_least_squares;
	document["residual_lag"] = options.residual_lag;
	document["els_max_iterations"] = options.els_max_iterations;
	document["els_tolerance"] = options.els_tolerance;
	document["singular_policy"] = SingularPolicyName(options.singular_policy);
	document["qr_tolerance"] = options.qr_tolerance;
	return document;
}

} // namespace io
} // namespace libnarmax
