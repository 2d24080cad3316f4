#include "libnarmax/io/model_serialization.hpp"

#include "libnarmax/core/errors.hpp"
#include "libnarmax/regressors/regressor_code.hpp"

#include <cstdint>
#include <limits>
#include <vector>

namespace libnarmax {
namespace io {

using nlohmann::json;

namespace {

const json &Require(const json &document, const std::string &key) {
	auto it = document.find(key);
	if (it == document.end()) {
		throw core::InvalidRegressorSpecError("model document is missing '" + key + "'");
	}
	return *it;
}

size_t RequireSize(const json &document, const std::string &key) {
	const json &value = Require(document, key);
	if (!value.is_number_integer() || value.get<int64_t>() < 0) {
		throw core::InvalidRegressorSpecError("model field '" + key + "' must be a non-negative integer");
	}
	return static_cast<size_t>(value.get<int64_t>());
}

double RequireNumber(const json &document, const std::string &key) {
	const json &value = Require(document, key);
	if (!value.is_number()) {
		throw core::InvalidRegressorSpecError("model field '" + key + "' must be a number");
	}
	return value.get<double>();
}

regressors::RegressorCode ParseRegressor(const json &value) {
	if (!value.is_array() || value.empty()) {
		throw core::InvalidRegressorSpecError("'regressor' must be a non-empty list of factor codes");
	}
	std::vector<int> factors;
	for (const auto &entry : value) {
		if (!entry.is_number_integer()) {
			throw core::InvalidRegressorSpecError("factor codes must be integers (got " + entry.dump() + ")");
		}
		const bool in_range = entry.is_number_unsigned()
		                          ? entry.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
		                          : entry.get<int64_t>() >= std::numeric_limits<int>::min() &&
		                                entry.get<int64_t>() <= std::numeric_limits<int>::max();
		if (!in_range) {
			throw core::InvalidRegressorSpecError("factor code out of range (got " + entry.dump() + ")");
		}
		factors.push_back(static_cast<int>(entry.get<int64_t>()));
	}
	// Stored codes are canonical; re-encode so hand-written documents are too
	const regressors::TermSpec spec = regressors::RegressorEncoder::Decode(regressors::RegressorCode(factors));
	return regressors::RegressorEncoder::Encode(spec, factors.size());
}

} // namespace

json ModelToJson(const core::SelectedModel &model) {
	json terms = json::array();
	for (const auto &term : model.terms) {
		json entry;
		entry["regressor"] = term.code.factors;
		entry["name"] = regressors::RegressorEncoder::ToString(term.code);
		entry["coefficient"] = term.coefficient;
		entry["err"] = term.err;
		terms.push_back(entry);
	}

	json document;
	document["format"] = kModelFormat;
	document["version"] = kModelFormatVersion;
	document["n_inputs"] = model.n_inputs;
	document["degree"] = model.degree;
	document["terms"] = terms;
	return document;
}

core::SelectedModel ModelFromJson(const json &document) {
	if (!document.is_object()) {
		throw core::InvalidRegressorSpecError("model document must be a JSON object");
	}

	auto format = document.find("format");
	if (format != document.end() && (!format->is_string() || format->get<std::string>() != kModelFormat)) {
		throw core::InvalidRegressorSpecError("unexpected model format " + format->dump());
	}
	auto version = document.find("version");
	if (version != document.end() && (!version->is_number_integer() || version->get<int>() > kModelFormatVersion)) {
		throw core::InvalidRegressorSpecError("unsupported model format version " + version->dump());
	}

	core::SelectedModel model;
	model.n_inputs = RequireSize(document, "n_inputs");

	const json &terms = Require(document, "terms");
	if (!terms.is_array()) {
		throw core::InvalidRegressorSpecError("model field 'terms' must be a list");
	}

	for (const auto &entry : terms) {
		if (!entry.is_object()) {
			throw core::InvalidRegressorSpecError("model terms must be objects");
		}
		core::SelectedTerm term;
		term.code = ParseRegressor(Require(entry, "regressor"));
		term.coefficient = RequireNumber(entry, "coefficient");
		term.err = entry.contains("err") ? RequireNumber(entry, "err") : 0.0;
		model.terms.push_back(term);
	}

	if (document.contains("degree")) {
		model.degree = RequireSize(document, "degree");
	} else if (!model.terms.empty()) {
		model.degree = model.terms.front().code.Width();
	} else {
		throw core::InvalidRegressorSpecError("a model without terms must state its 'degree'");
	}

	model.Validate();
	return model;
}

std::string ModelToString(const core::SelectedModel &model, int indent) {
	return ModelToJson(model).dump(indent);
}

core::SelectedModel ModelFromString(const std::string &text) {
	json document;
	try {
		document = json::parse(text);
	} catch (const json::parse_error &e) {
		throw core::InvalidRegressorSpecError(std::string("malformed model JSON: ") + e.what());
	}
	return ModelFromJson(document);
}

} // namespace io
} // namespace libnarmax
