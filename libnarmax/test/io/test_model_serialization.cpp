#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "../test_helpers.hpp"
#include <libnarmax/core/errors.hpp>
#include <libnarmax/io/model_serialization.hpp>
#include <libnarmax/model/frols_identifier.hpp>
#include <libnarmax/model/model_simulator.hpp>
#include <nlohmann/json.hpp>

using namespace libnarmax;
using namespace libnarmax::core;
using nlohmann::json;
using regressors::RegressorCode;
using Catch::Matchers::WithinAbs;

namespace {

SelectedModel SampleModel() {
	SelectedModel model;
	model.n_inputs = 1;
	model.degree = 2;

	SelectedTerm first;
	first.code = RegressorCode({2002, 0});
	first.coefficient = 0.9;
	first.err = 0.8;

	SelectedTerm second;
	second.code = RegressorCode({2001, 1001});
	second.coefficient = -0.1;
	second.err = 0.05;

	model.terms = {first, second};
	return model;
}

} // namespace

TEST_CASE("Model document layout", "[serialization]") {
	const json document = io::ModelToJson(SampleModel());

	REQUIRE(document["format"] == "libnarmax-model");
	REQUIRE(document["version"] == 1);
	REQUIRE(document["n_inputs"] == 1);
	REQUIRE(document["degree"] == 2);
	REQUIRE(document["terms"].size() == 2);
	REQUIRE(document["terms"][0]["regressor"] == json({2002, 0}));
	REQUIRE(document["terms"][0]["name"] == "x1(k-2)");
	REQUIRE(document["terms"][1]["name"] == "x1(k-1)y(k-1)");
	REQUIRE(document["terms"][1]["coefficient"].get<double>() == -0.1);
}

TEST_CASE("Models are restored from their documents", "[serialization]") {
	const SelectedModel original = SampleModel();
	const SelectedModel restored = io::ModelFromString(io::ModelToString(original));

	REQUIRE(restored.n_inputs == 1);
	REQUIRE(restored.degree == 2);
	REQUIRE(restored.Codes() == original.Codes());
	REQUIRE(restored.ErrValues() == original.ErrValues());
	REQUIRE((restored.Coefficients() - original.Coefficients()).norm() == 0.0);
}

TEST_CASE("Hand-written model documents", "[serialization]") {
	SECTION("Factor order is canonicalized and err is optional") {
		const SelectedModel model = io::ModelFromJson(json::parse(R"({
			"n_inputs": 1,
			"terms": [{"regressor": [0, 1001], "coefficient": 0.5},
			          {"regressor": [1001, 2001], "coefficient": 0.2}]
		})"));
		REQUIRE(model.degree == 2);
		REQUIRE(model.terms[0].code == RegressorCode({1001, 0}));
		REQUIRE(model.terms[1].code == RegressorCode({2001, 1001}));
		REQUIRE(model.terms[0].err == 0.0);
	}

	SECTION("Model without terms needs its degree") {
		REQUIRE_THROWS_AS(io::ModelFromJson(json::parse(R"({"n_inputs": 0, "terms": []})")),
		                  InvalidRegressorSpecError);
		const SelectedModel empty = io::ModelFromJson(json::parse(R"({"n_inputs": 0, "degree": 1, "terms": []})"));
		REQUIRE(empty.Size() == 0);
	}
}

TEST_CASE("Invalid model documents", "[serialization]") {
	const auto parse = [](const char *text) { return io::ModelFromJson(json::parse(text)); };

	REQUIRE_THROWS_AS(parse(R"([])"), InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(parse(R"({"terms": []})"), InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(parse(R"({"format": "other", "n_inputs": 1, "degree": 1, "terms": []})"),
	                  InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(parse(R"({"version": 99, "n_inputs": 1, "degree": 1, "terms": []})"),
	                  InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(parse(R"({"n_inputs": 1, "terms": [{"regressor": [2001]}]})"), InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(parse(R"({"n_inputs": 1, "terms": [{"regressor": [], "coefficient": 1}]})"),
	                  InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(parse(R"({"n_inputs": 1, "terms": [{"regressor": [1.5], "coefficient": 1}]})"),
	                  InvalidRegressorSpecError);
	// Input 2 in a single-input model
	REQUIRE_THROWS_AS(parse(R"({"n_inputs": 1, "terms": [{"regressor": [3001], "coefficient": 1}]})"),
	                  InvalidRegressorSpecError);
	// 2001 + 2^32 and 2001 - 2^32 would wrap to a valid code as 32-bit int
	REQUIRE_THROWS_AS(parse(R"({"n_inputs": 1, "terms": [{"regressor": [4294969297], "coefficient": 1}]})"),
	                  InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(parse(R"({"n_inputs": 1, "terms": [{"regressor": [-4294965295], "coefficient": 1}]})"),
	                  InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(parse(R"({"n_inputs": 1, "terms": [{"regressor": [18446744073709551615], "coefficient": 1}]})"),
	                  InvalidRegressorSpecError);
	// Duplicate terms after canonicalization
	REQUIRE_THROWS_AS(parse(R"({"n_inputs": 1, "terms": [{"regressor": [0, 1001], "coefficient": 1},
	                                                      {"regressor": [1001, 0], "coefficient": 2}]})"),
	                  InvalidRegressorSpecError);
	REQUIRE_THROWS_AS(io::ModelFromString("{not json"), InvalidRegressorSpecError);
}

TEST_CASE("A restored model predicts like the identified one", "[serialization]") {
	const test::SystemData data = test::ThreeTermSystem(400, 0.01, 19);
	const IdentificationResult result = model::FROLSIdentifier::Fit(data.X, data.y, IdentificationOptions::Fixed(3));

	const SelectedModel restored = io::ModelFromString(io::ModelToString(result.model));

	const Eigen::VectorXd expected = model::ModelSimulator::OneStepAhead(result.model, data.X, data.y);
	const Eigen::VectorXd actual = model::ModelSimulator::OneStepAhead(restored, data.X, data.y);
	REQUIRE((expected - actual).cwiseAbs().maxCoeff() < 1e-12);
}
