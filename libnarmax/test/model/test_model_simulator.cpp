#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "../test_helpers.hpp"
#include <libnarmax/core/errors.hpp>
#include <libnarmax/core/identification_result.hpp>
#include <libnarmax/diagnostics/metrics.hpp>
#include <libnarmax/model/frols_identifier.hpp>
#include <libnarmax/model/model_simulator.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <random>

using namespace libnarmax;
using namespace libnarmax::core;
using namespace libnarmax::model;
using regressors::RegressorCode;
using Catch::Matchers::WithinAbs;

namespace {

core::SelectedTerm Term(std::vector<int> factors, double coefficient) {
	core::SelectedTerm term;
	term.code = RegressorCode(std::move(factors));
	term.coefficient = coefficient;
	return term;
}

// y(k) = 0.5 y(k-1) + 0.3 x1(k-1) + 0.2 x1(k-1)^2
core::SelectedModel QuadraticModel() {
	core::SelectedModel model;
	model.n_inputs = 1;
	model.degree = 2;
	model.terms = {Term({1001, 0}, 0.5), Term({2001, 0}, 0.3), Term({2001, 2001}, 0.2)};
	return model;
}

Eigen::VectorXd SimulateQuadratic(const Eigen::VectorXd &x, double y0) {
	Eigen::VectorXd y(x.size());
	y(0) = y0;
	for (Eigen::Index k = 1; k < y.size(); k++) {
		y(k) = 0.5 * y(k - 1) + 0.3 * x(k - 1) + 0.2 * x(k - 1) * x(k - 1);
	}
	return y;
}

} // namespace

TEST_CASE("Free run reproduces a known model", "[simulation]") {
	std::mt19937 rng(4);
	const Eigen::MatrixXd X = test::UniformSignal(200, -1.0, 1.0, rng);
	const Eigen::VectorXd y = SimulateQuadratic(X.col(0), 0.25);

	const Eigen::VectorXd simulated = ModelSimulator::FreeRun(QuadraticModel(), X, y.head(1));

	REQUIRE(simulated.size() == 200);
	REQUIRE_THAT(simulated(0), WithinAbs(0.25, 1e-15));
	REQUIRE((simulated - y).cwiseAbs().maxCoeff() < 1e-12);
}

TEST_CASE("One-step-ahead prediction of a known model", "[simulation]") {
	std::mt19937 rng(5);
	const Eigen::MatrixXd X = test::UniformSignal(100, -1.0, 1.0, rng);
	const Eigen::VectorXd y = SimulateQuadratic(X.col(0), 0.0);
	const core::SelectedModel model = QuadraticModel();

	const Eigen::VectorXd predicted = ModelSimulator::OneStepAhead(model, X, y);
	REQUIRE(predicted.size() == 99);
	REQUIRE((predicted - y.tail(99)).cwiseAbs().maxCoeff() < 1e-12);

	SECTION("Longer warm-up drops more samples") {
		const Eigen::VectorXd shifted = ModelSimulator::OneStepAhead(model, X, y, 3);
		REQUIRE(shifted.size() == 97);
		REQUIRE((shifted - y.tail(97)).cwiseAbs().maxCoeff() < 1e-12);
	}

	SECTION("Warm-up shorter than the model lag") {
		REQUIRE_THROWS_AS(ModelSimulator::OneStepAhead(model, X, y, 0), InvalidRegressorSpecError);
	}
}

TEST_CASE("One-step-ahead prediction matches the fitted values", "[simulation]") {
	const test::SystemData data = test::ThreeTermSystem(600, 0.01, 31);
	const IdentificationOptions options = IdentificationOptions::Fixed(3);

	const IdentificationResult result = FROLSIdentifier::Fit(data.X, data.y, options);
	const Eigen::VectorXd predicted = ModelSimulator::OneStepAhead(result.model, data.X, data.y, result.max_lag);

	const Eigen::Index rows = data.y.size() - static_cast<Eigen::Index>(result.max_lag);
	REQUIRE(predicted.size() == rows);
	const Eigen::VectorXd fitted = data.y.tail(rows) - result.residuals;
	REQUIRE((predicted - fitted).cwiseAbs().maxCoeff() < 1e-9);

	SECTION("Free run stays close to the measured output") {
		const Eigen::VectorXd simulated = ModelSimulator::FreeRun(result.model, data.X, data.y.head(2));
		REQUIRE(diagnostics::RootRelativeSquaredError(data.y, simulated) < 0.1);
	}
}

TEST_CASE("n-step-ahead prediction bridges one-step and free run", "[simulation]") {
	const test::SystemData data = test::ThreeTermSystem(300, 0.02, 61);
	IdentificationOptions options = IdentificationOptions::Fixed(3);
	const IdentificationResult result = FROLSIdentifier::Fit(data.X, data.y, options);
	const core::SelectedModel &model = result.model;
	const Eigen::Index max_lag = model.MaxLag();
	const Eigen::Index rows = data.y.size() - max_lag;

	SECTION("One step equals one-step-ahead prediction") {
		const Eigen::VectorXd predicted = ModelSimulator::NStepAhead(model, data.X, data.y, 1);
		const Eigen::VectorXd one_step = ModelSimulator::OneStepAhead(model, data.X, data.y);
		REQUIRE(predicted.size() == data.y.size());
		REQUIRE(predicted.head(max_lag) == data.y.head(max_lag));
		REQUIRE((predicted.tail(rows) - one_step).cwiseAbs().maxCoeff() < 1e-12);
	}

	SECTION("A horizon covering the series equals free run") {
		const Eigen::VectorXd simulated = ModelSimulator::FreeRun(model, data.X, data.y.head(max_lag));
		const Eigen::VectorXd predicted = ModelSimulator::NStepAhead(model, data.X, data.y, 1000);
		REQUIRE(predicted == simulated);
	}

	SECTION("Each window restarts from measured outputs") {
		const size_t steps = 7;
		const Eigen::VectorXd predicted = ModelSimulator::NStepAhead(model, data.X, data.y, steps);
		const auto window = static_cast<Eigen::Index>(steps);

		const Eigen::VectorXd first = ModelSimulator::FreeRun(model, data.X.topRows(max_lag + window),
		                                                      data.y.head(max_lag));
		REQUIRE(predicted.segment(max_lag, window) == first.tail(window));

		const Eigen::Index start = max_lag + window;
		const Eigen::VectorXd second = ModelSimulator::FreeRun(
		    model, data.X.middleRows(start - max_lag, max_lag + window), data.y.segment(start - max_lag, max_lag));
		REQUIRE(predicted.segment(start, window) == second.tail(window));
	}

	SECTION("Invalid horizon or lengths") {
		REQUIRE_THROWS_AS(ModelSimulator::NStepAhead(model, data.X, data.y, 0), InvalidRegressorSpecError);
		REQUIRE_THROWS_AS(ModelSimulator::NStepAhead(model, data.X, data.y.head(100), 3), InvalidRegressorSpecError);
	}
}

TEST_CASE("Models without lagged terms", "[simulation]") {
	core::SelectedModel model;
	model.n_inputs = 0;
	model.degree = 1;
	model.terms = {Term({0}, 1.5)};

	const Eigen::MatrixXd X(6, 0);
	const Eigen::VectorXd simulated = ModelSimulator::FreeRun(model, X, Eigen::VectorXd());
	REQUIRE(simulated.size() == 6);
	REQUIRE((simulated.array() == 1.5).all());
}

TEST_CASE("Autoregressive free run without inputs", "[simulation]") {
	core::SelectedModel model;
	model.n_inputs = 0;
	model.degree = 1;
	model.terms = {Term({1002}, -0.5), Term({1001}, 1.0)};

	const Eigen::MatrixXd X(5, 0);
	const Eigen::VectorXd simulated = ModelSimulator::FreeRun(model, X, Eigen::Vector2d(1.0, 2.0));

	// y(k) = y(k-1) - 0.5 y(k-2)
	REQUIRE_THAT(simulated(2), WithinAbs(1.5, 1e-15));
	REQUIRE_THAT(simulated(3), WithinAbs(0.5, 1e-15));
	REQUIRE_THAT(simulated(4), WithinAbs(-0.25, 1e-15));
}

TEST_CASE("Simulation rejects inconsistent inputs", "[simulation]") {
	const core::SelectedModel model = QuadraticModel();
	const Eigen::MatrixXd X = Eigen::MatrixXd::Zero(10, 1);
	const Eigen::VectorXd y = Eigen::VectorXd::Zero(10);

	SECTION("Too few input channels") {
		const Eigen::MatrixXd no_inputs(10, 0);
		REQUIRE_THROWS_AS(ModelSimulator::FreeRun(model, no_inputs, y), InvalidRegressorSpecError);
		REQUIRE_THROWS_AS(ModelSimulator::OneStepAhead(model, no_inputs, y), InvalidRegressorSpecError);
	}

	SECTION("Missing initial conditions") {
		REQUIRE_THROWS_AS(ModelSimulator::FreeRun(model, X, Eigen::VectorXd()), InsufficientDataError);
	}

	SECTION("Invalid model") {
		core::SelectedModel broken = model;
		broken.terms.push_back(broken.terms.front());
		REQUIRE_THROWS_AS(ModelSimulator::FreeRun(broken, X, y), InvalidRegressorSpecError);
	}
}
