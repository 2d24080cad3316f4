#pragma once

#include "libnarmax/core/estimation_result.hpp"
#include "libnarmax/core/identification_options.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace libnarmax {
namespace solvers {

/**
 * IParameterEstimator: Abstract interface for parameter estimators
 *
 * An estimator takes the columns of the selected regressors and the aligned
 * target and returns coefficients in that column order. The structure
 * selection never depends on which estimator runs afterwards.
 *
 * The concrete estimators (LeastSquaresSolver, ExtendedLeastSquaresSolver)
 * use static methods; this interface is for runtime selection and for
 * testing.
 */
class IParameterEstimator {
public:
	virtual ~IParameterEstimator() = default;

	/**
	 * Get the name of this estimator (e.g., "LeastSquares")
	 */
	virtual std::string GetName() const = 0;

	/**
	 * Get a description of what this estimator does
	 */
	virtual std::string GetDescription() const = 0;

	/**
	 * Estimate the coefficients
	 *
	 * @param y Target vector (length n)
	 * @param psi Regressor matrix of the selected terms (n x p)
	 * @param options Identification options (singular policy, ELS settings)
	 * @return EstimationResult with coefficients and fit statistics
	 *
	 * @throws std::invalid_argument if dimensions do not match
	 * @throws SingularMatrixError for a rank-deficient system under the THROW policy
	 */
	virtual core::EstimationResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                                   const core::IdentificationOptions &options) const = 0;

	/**
	 * Estimate the coefficients together with their standard errors
	 */
	virtual core::EstimationResult FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                                                const core::IdentificationOptions &options) const = 0;
};

/**
 * EstimatorAdapter: Template adapter for static estimator classes
 *
 * Example usage:
 * ```cpp
 * std::unique_ptr<IParameterEstimator> estimator =
 *     std::make_unique<EstimatorAdapter<LeastSquaresSolver>>("LeastSquares", "QR least squares");
 *
 * auto result = estimator->Fit(y, psi, options);
 * ```
 *
 * Template parameter TSolver must provide:
 * - static EstimationResult Fit(y, psi, options)
 * - static EstimationResult FitWithStdErrors(y, psi, options)
 */
template <typename TSolver>
class EstimatorAdapter : public IParameterEstimator {
private:
	std::string name_;
	std::string description_;

public:
	EstimatorAdapter(const std::string &name, const std::string &description)
	    : name_(name), description_(description) {
	}

	std::string GetName() const override {
		return name_;
	}

	std::string GetDescription() const override {
		return description_;
	}

	core::EstimationResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                           const core::IdentificationOptions &options) const override {
		return TSolver::Fit(y, psi, options);
	}

	core::EstimationResult FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &psi,
	                                        const core::IdentificationOptions &options) const override {
		return TSolver::FitWithStdErrors(y, psi, options);
	}
};

/**
 * Estimator configured by the options: Extended Least Squares when
 * options.extended_least_squares is set, plain least squares otherwise
 */
std::unique_ptr<IParameterEstimator> MakeEstimator(const core::IdentificationOptions &options);

} // namespace solvers
} // namespace libnarmax
