#pragma once

#include "libnarmax/core/identification_result.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace libnarmax {
namespace io {

/// Value of the "format" field written by ModelToJson
constexpr const char *kModelFormat = "libnarmax-model";
constexpr int kModelFormatVersion = 1;

/**
 * Serialize an identified model
 *
 * Layout:
 *
 *   {"format": "libnarmax-model", "version": 1, "n_inputs": 1, "degree": 2,
 *    "terms": [{"regressor": [2002, 0], "name": "x1(k-2)",
 *               "coefficient": 0.9, "err": 0.81}, ...]}
 *
 * "name" is informational and ignored when reading.
 */
nlohmann::json ModelToJson(const core::SelectedModel &model);

/**
 * Restore a model written by ModelToJson
 *
 * @throws InvalidRegressorSpecError on a malformed document or an
 *         inconsistent model (see SelectedModel::Validate)
 */
core::SelectedModel ModelFromJson(const nlohmann::json &document);

/// ModelToJson(model).dump(indent)
std::string ModelToString(const core::SelectedModel &model, int indent = 2);

/**
 * @throws InvalidRegressorSpecError on malformed JSON text (and see ModelFromJson)
 */
core::SelectedModel ModelFromString(const std::string &text);

} // namespace io
} // namespace libnarmax
