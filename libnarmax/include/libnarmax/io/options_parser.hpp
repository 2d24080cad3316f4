#pragma once

#include "libnarmax/core/identification_options.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace libnarmax {
namespace io {

/**
 * JSON front end for IdentificationOptions
 *
 * Accepts an object whose keys are the option names, e.g.
 *
 *   {"ylag": 2, "xlag": [[1, 2], [3]], "basis_degree": 2,
 *    "selection_mode": "fixed", "n_terms": 3, "model_type": "NARX"}
 *
 * - ylag: int n (lags 1..n) or list of explicit lags
 * - xlag: int n (lags 1..n for every input), list of ints (maximum lag per
 *   input) or list of lists (explicit lags per input)
 * - string enums (model_type, selection_mode, info_criterion,
 *   singular_policy) are case-insensitive
 * - when selection_mode is absent, giving n_terms selects fixed mode
 *
 * Missing keys keep their defaults. The parsed options are validated.
 */
class OptionsParser {
public:
	/**
	 * @param document JSON object (null gives the defaults)
	 * @throws InvalidRegressorSpecError on unknown keys, wrongly typed values
	 *         or values rejected by IdentificationOptions::Validate()
	 */
	static core::IdentificationOptions Parse(const nlohmann::json &document);

	/**
	 * Parse options from JSON text
	 *
	 * @throws InvalidRegressorSpecError on malformed JSON (and see above)
	 */
	static core::IdentificationOptions Parse(const std::string &text);

	/**
	 * Serialize options to the same document format
	 *
	 * @throws InvalidRegressorSpecError if xlag is a uniform explicit lag list,
	 *         which the JSON form cannot express
	 */
	static nlohmann::json ToJson(const core::IdentificationOptions &options);

	/// Comma-separated list of the recognized keys
	static std::string ValidKeys();
};

} // namespace io
} // namespace libnarmax
