#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "../test_helpers.hpp"
#include <libnarmax/core/errors.hpp>
#include <libnarmax/selection/err_engine.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <random>

using namespace libnarmax;
using namespace libnarmax::selection;
using Catch::Matchers::WithinAbs;

TEST_CASE("ERR values stay in [0, 1] and sum to at most 1", "[err]") {
	std::mt19937 rng(20240611);

	for (int trial = 0; trial < 20; trial++) {
		const Eigen::MatrixXd psi = test::GaussianMatrix(120, 12, rng);
		const Eigen::VectorXd y = psi.leftCols(3) * Eigen::Vector3d(1.0, -0.5, 0.25) + test::GaussianNoise(120, 0.3, rng);

		ErrEngine engine(psi, y, 12);
		double sum = 0.0;
		for (int round = 0; round < 12; round++) {
			const Eigen::VectorXd candidates = engine.CandidateErr();
			for (Eigen::Index j = 0; j < candidates.size(); j++) {
				if (!std::isnan(candidates(j))) {
					REQUIRE(candidates(j) >= 0.0);
					REQUIRE(candidates(j) <= 1.0);
				}
			}
			sum += engine.SelectNext().err;
		}
		REQUIRE(sum <= 1.0 + 1e-9);
	}
}

TEST_CASE("Orthogonal basis columns are pairwise orthogonal", "[err]") {
	std::mt19937 rng(7);

	for (int trial = 0; trial < 10; trial++) {
		Eigen::MatrixXd psi = test::GaussianMatrix(200, 10, rng);
		// Nearly collinear pair to stress the second orthogonalization pass
		psi.col(9) = psi.col(0) + 1e-4 * psi.col(9);
		const Eigen::VectorXd y = test::GaussianMatrix(200, 1, rng);

		ErrEngine engine(psi, y, 10);
		for (int round = 0; round < 10; round++) {
			engine.SelectNext();

			const Eigen::MatrixXd q = engine.OrthogonalBasis();
			REQUIRE(q.cols() == round + 1);
			for (Eigen::Index i = 0; i < q.cols(); i++) {
				for (Eigen::Index j = i + 1; j < q.cols(); j++) {
					const double cosine = q.col(i).dot(q.col(j)) / (q.col(i).norm() * q.col(j).norm());
					REQUIRE(std::abs(cosine) < 1e-10);
				}
			}
		}
	}
}

TEST_CASE("Residual sum of squares matches the nested least-squares fit", "[err]") {
	std::mt19937 rng(99);
	const Eigen::MatrixXd psi = test::GaussianMatrix(80, 6, rng);
	const Eigen::VectorXd y = psi.col(2) * 2.0 - psi.col(4) + test::GaussianNoise(80, 0.1, rng);

	ErrEngine engine(psi, y, 4);
	for (int round = 0; round < 4; round++) {
		const RoundSelection selection = engine.SelectNext();

		Eigen::MatrixXd nested(psi.rows(), static_cast<Eigen::Index>(engine.Selected().size()));
		for (size_t j = 0; j < engine.Selected().size(); j++) {
			nested.col(static_cast<Eigen::Index>(j)) = psi.col(static_cast<Eigen::Index>(engine.Selected()[j]));
		}
		const Eigen::VectorXd theta = nested.colPivHouseholderQr().solve(y);
		const double rss = (y - nested * theta).squaredNorm();

		REQUIRE_THAT(selection.rss, WithinAbs(rss, 1e-8 * y.squaredNorm()));
	}

	SECTION("Selected ERR accounts for the explained energy") {
		double err_sum = 0.0;
		for (double err : engine.ErrValues()) {
			err_sum += err;
		}
		const double explained = 1.0 - engine.ResidualSumOfSquares() / engine.TargetSumOfSquares();
		REQUIRE_THAT(err_sum, WithinAbs(explained, 1e-10));
	}
}

TEST_CASE("Strongest regressor is selected first", "[err]") {
	std::mt19937 rng(3);
	const Eigen::MatrixXd psi = test::GaussianMatrix(500, 5, rng);
	const Eigen::VectorXd y = 3.0 * psi.col(3) + 0.5 * psi.col(1) + test::GaussianNoise(500, 0.05, rng);

	ErrEngine engine(psi, y, 2);
	REQUIRE(engine.SelectNext().index == 3);
	REQUIRE(engine.SelectNext().index == 1);
	REQUIRE(engine.Rounds() == 2);
	REQUIRE(engine.OrthogonalCoefficients().size() == 2);
}

TEST_CASE("Ties go to the lowest column index", "[err]") {
	Eigen::MatrixXd psi(4, 3);
	psi << 1, 0, 1,
	       0, 1, 0,
	       1, 0, 1,
	       0, 1, 0;
	const Eigen::VectorXd y = Eigen::Vector4d(1.0, 0.0, 1.0, 0.0);

	ErrEngine engine(psi, y, 1);
	const RoundSelection selection = engine.SelectNext();
	REQUIRE(selection.index == 0);
	REQUIRE_THAT(selection.err, WithinAbs(1.0, 1e-12));
}

TEST_CASE("Degenerate candidates are never selected", "[err]") {
	std::mt19937 rng(11);
	Eigen::MatrixXd psi = test::GaussianMatrix(50, 4, rng);
	psi.col(2) = psi.col(0) - psi.col(1);
	psi.col(3).setZero();
	const Eigen::VectorXd y = psi.col(0) + test::GaussianNoise(50, 0.1, rng);

	ErrEngine engine(psi, y, 4);
	REQUIRE(engine.EligibleCount() == 3);

	engine.SelectNext();
	engine.SelectNext();

	// The third column is now a combination of the two selected ones
	REQUIRE(engine.EligibleCount() == 0);
	REQUIRE(std::isnan(engine.CandidateErr()(2)));
	REQUIRE(std::isnan(engine.CandidateErr()(3)));
	REQUIRE_THROWS_AS(engine.SelectNext(), core::DegenerateRegressorError);
}

TEST_CASE("ERR engine bookkeeping errors", "[err]") {
	const Eigen::MatrixXd psi = Eigen::MatrixXd::Identity(3, 3);

	SECTION("Capacity") {
		ErrEngine engine(psi, Eigen::Vector3d(1.0, 2.0, 3.0), 1);
		engine.SelectNext();
		REQUIRE_THROWS_AS(engine.SelectNext(), std::out_of_range);
	}

	SECTION("Dimension mismatch") {
		REQUIRE_THROWS_AS(ErrEngine(psi, Eigen::Vector2d(1.0, 2.0), 1), std::invalid_argument);
	}

	SECTION("Zero target") {
		ErrEngine engine(psi, Eigen::Vector3d::Zero(), 3);
		const Eigen::VectorXd err = engine.CandidateErr();
		REQUIRE((err.array() == 0.0).all());
		REQUIRE(engine.SelectNext().index == 0);
	}
}
