#pragma once

#include <Eigen/Dense>
#include <random>

namespace libnarmax {
namespace test {

/// Input/output record of a simulated system
struct SystemData {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	/// Noise sequence that drove the system
	Eigen::VectorXd e;
};

inline Eigen::VectorXd UniformSignal(size_t n, double lo, double hi, std::mt19937 &rng) {
	std::uniform_real_distribution<double> dist(lo, hi);
	Eigen::VectorXd signal(static_cast<Eigen::Index>(n));
	for (Eigen::Index i = 0; i < signal.size(); i++) {
		signal(i) = dist(rng);
	}
	return signal;
}

inline Eigen::VectorXd GaussianNoise(size_t n, double sigma, std::mt19937 &rng) {
	std::normal_distribution<double> dist(0.0, sigma);
	Eigen::VectorXd noise(static_cast<Eigen::Index>(n));
	for (Eigen::Index i = 0; i < noise.size(); i++) {
		noise(i) = dist(rng);
	}
	return noise;
}

inline Eigen::MatrixXd GaussianMatrix(size_t rows, size_t cols, std::mt19937 &rng) {
	std::normal_distribution<double> dist(0.0, 1.0);
	Eigen::MatrixXd m(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
	for (Eigen::Index j = 0; j < m.cols(); j++) {
		for (Eigen::Index i = 0; i < m.rows(); i++) {
			m(i, j) = dist(rng);
		}
	}
	return m;
}

/**
 * y(k) = 0.9 x(k-2) + 0.1 y(k-1) + 0.1 x(k-1) y(k-1) + e(k)
 *
 * x ~ U(-1, 1), e ~ N(0, noise_sigma^2)
 */
inline SystemData ThreeTermSystem(size_t n, double noise_sigma, unsigned seed) {
	std::mt19937 rng(seed);
	SystemData data;
	data.X = UniformSignal(n, -1.0, 1.0, rng);
	data.e = GaussianNoise(n, noise_sigma, rng);
	data.y = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));

	const auto x = data.X.col(0);
	for (Eigen::Index k = 2; k < data.y.size(); k++) {
		data.y(k) = 0.9 * x(k - 2) + 0.1 * data.y(k - 1) + 0.1 * x(k - 1) * data.y(k - 1) + data.e(k);
	}
	return data;
}

/**
 * ARMAX system with moving-average (coloured) noise:
 * y(k) = 0.5 y(k-1) + x(k-1) + e(k) + 0.8 e(k-1)
 */
inline SystemData ColoredNoiseSystem(size_t n, double noise_sigma, unsigned seed) {
	std::mt19937 rng(seed);
	SystemData data;
	data.X = UniformSignal(n, -1.0, 1.0, rng);
	data.e = GaussianNoise(n, noise_sigma, rng);
	data.y = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));

	const auto x = data.X.col(0);
	for (Eigen::Index k = 1; k < data.y.size(); k++) {
		data.y(k) = 0.5 * data.y(k - 1) + x(k - 1) + data.e(k) + 0.8 * data.e(k - 1);
	}
	return data;
}

/**
 * Two-input finite impulse response system:
 * y(k) = 0.6 x1(k-1) - 0.4 x2(k-2) + 0.2 x1(k-1) x2(k-1) + e(k)
 */
inline SystemData TwoInputFirSystem(size_t n, double noise_sigma, unsigned seed) {
	std::mt19937 rng(seed);
	SystemData data;
	data.X.resize(static_cast<Eigen::Index>(n), 2);
	data.X.col(0) = UniformSignal(n, -1.0, 1.0, rng);
	data.X.col(1) = UniformSignal(n, -1.0, 1.0, rng);
	data.e = GaussianNoise(n, noise_sigma, rng);
	data.y = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));

	for (Eigen::Index k = 2; k < data.y.size(); k++) {
		data.y(k) = 0.6 * data.X(k - 1, 0) - 0.4 * data.X(k - 2, 1) + 0.2 * data.X(k - 1, 0) * data.X(k - 1, 1) +
		            data.e(k);
	}
	return data;
}

} // namespace test
} // namespace libnarmax
