#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "../test_helpers.hpp"
#include <libnarmax/core/errors.hpp>
#include <libnarmax/diagnostics/metrics.hpp>
#include <libnarmax/diagnostics/residue_correlation.hpp>
#include <libnarmax/diagnostics/residue_correlation_impl.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <random>

using namespace libnarmax;
using namespace libnarmax::diagnostics;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("White noise stays inside the confidence band", "[residues]") {
	std::mt19937 rng(2024);
	const Eigen::VectorXd e = test::GaussianNoise(2000, 1.0, rng);

	const CorrelationResult acf = ResidueCorrelation::Autocorrelation(e, 40);

	REQUIRE(acf.lags.size() == 41);
	REQUIRE(acf.values.size() == 41);
	REQUIRE(acf.lags.front() == 0);
	REQUIRE(acf.lags.back() == 40);
	REQUIRE_THAT(acf.values(0), WithinAbs(1.0, 1e-12));
	REQUIRE_THAT(acf.confidence_bound, WithinRel(1.96 / std::sqrt(2000.0), 1e-12));

	// Lag 0 is always outside; about 5% of the remaining 40 lags may be
	REQUIRE(acf.CountOutsideBand(1) <= 8);
	REQUIRE(acf.values.tail(40).cwiseAbs().maxCoeff() < 0.1);
}

TEST_CASE("Correlated residuals leave the confidence band", "[residues]") {
	std::mt19937 rng(7);
	const Eigen::VectorXd e = test::GaussianNoise(1000, 1.0, rng);
	Eigen::VectorXd ar(1000);
	ar(0) = e(0);
	for (Eigen::Index k = 1; k < ar.size(); k++) {
		ar(k) = 0.8 * ar(k - 1) + e(k);
	}

	const CorrelationResult acf = ResidueCorrelation::Autocorrelation(ar, 5);

	REQUIRE_THAT(acf.values(1), WithinAbs(0.8, 0.08));
	REQUIRE(acf.CountOutsideBand(1) == 5);
}

TEST_CASE("Cross-correlation detects a residual input dependence", "[residues]") {
	std::mt19937 rng(13);
	const Eigen::VectorXd x = test::UniformSignal(1500, -1.0, 1.0, rng);
	const Eigen::VectorXd noise = test::GaussianNoise(1500, 0.1, rng);

	// Residual that still contains x(k-2)
	Eigen::VectorXd e = noise;
	for (Eigen::Index k = 2; k < e.size(); k++) {
		e(k) += 0.5 * x(k - 2);
	}

	const CorrelationResult ccf = ResidueCorrelation::CrossCorrelation(e, x, 4);

	REQUIRE(ccf.values.size() == 5);
	REQUIRE(std::abs(ccf.values(2)) > 0.8);
	REQUIRE(std::abs(ccf.values(0)) < 0.1);
	REQUIRE(std::abs(ccf.values(1)) < 0.1);

	const CorrelationResult independent = ResidueCorrelation::CrossCorrelation(noise, x, 10);
	REQUIRE(independent.CountOutsideBand() <= 3);
}

TEST_CASE("Residue correlation edge cases", "[residues]") {
	SECTION("Zero variance gives NaN") {
		const Eigen::VectorXd constant = Eigen::VectorXd::Constant(20, 3.0);
		const CorrelationResult acf = ResidueCorrelation::Autocorrelation(constant, 3);
		for (Eigen::Index i = 0; i < acf.values.size(); i++) {
			REQUIRE(std::isnan(acf.values(i)));
		}
		REQUIRE(acf.CountOutsideBand() == 0);
	}

	SECTION("Too many lags") {
		const Eigen::VectorXd e = Eigen::VectorXd::LinSpaced(10, 0.0, 1.0);
		REQUIRE_THROWS_AS(ResidueCorrelation::Autocorrelation(e, 10), core::InsufficientDataError);
		REQUIRE_NOTHROW(ResidueCorrelation::Autocorrelation(e, 9));
	}

	SECTION("Length mismatch") {
		const Eigen::VectorXd e = Eigen::VectorXd::LinSpaced(10, 0.0, 1.0);
		const Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(9, 0.0, 1.0);
		REQUIRE_THROWS_AS(ResidueCorrelation::CrossCorrelation(e, x, 2), std::invalid_argument);
	}
}

TEST_CASE("Fit-quality metrics", "[residues]") {
	const Eigen::VectorXd y = Eigen::Vector4d(1.0, 2.0, 3.0, 4.0);

	SECTION("Perfect prediction") {
		REQUIRE_THAT(RootRelativeSquaredError(y, y), WithinAbs(0.0, 1e-15));
		REQUIRE_THAT(Metrics::RSquared(y, y), WithinAbs(1.0, 1e-15));
		REQUIRE_THAT(Metrics::RootMeanSquaredError(y, y), WithinAbs(0.0, 1e-15));
	}

	SECTION("Predicting the mean") {
		const Eigen::VectorXd mean = Eigen::VectorXd::Constant(4, 2.5);
		REQUIRE_THAT(Metrics::RootRelativeSquaredError(y, mean), WithinAbs(1.0, 1e-12));
		REQUIRE_THAT(Metrics::RSquared(y, mean), WithinAbs(0.0, 1e-12));
		REQUIRE_THAT(Metrics::MeanAbsoluteError(y, mean), WithinAbs(1.0, 1e-12));
		REQUIRE_THAT(Metrics::RootMeanSquaredError(y, mean), WithinAbs(std::sqrt(1.25), 1e-12));
	}

	SECTION("Undefined and invalid inputs") {
		const Eigen::VectorXd flat = Eigen::VectorXd::Ones(4);
		REQUIRE(std::isnan(Metrics::RootRelativeSquaredError(flat, y)));
		REQUIRE_THROWS_AS(Metrics::RootRelativeSquaredError(y, Eigen::VectorXd::Ones(3)), std::invalid_argument);
		REQUIRE_THROWS_AS(Metrics::RootMeanSquaredError(Eigen::VectorXd(), Eigen::VectorXd()),
		                  std::invalid_argument);
	}
}
