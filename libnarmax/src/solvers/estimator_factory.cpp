#include "libnarmax/solvers/extended_least_squares.hpp"
#include "libnarmax/solvers/i_parameter_estimator.hpp"
#include "libnarmax/solvers/least_squares_solver.hpp"

namespace libnarmax {
namespace solvers {

std::unique_ptr<IParameterEstimator> MakeEstimator(const core::IdentificationOptions &options) {
	if (options.extended_least_squares) {
		return std::make_unique<EstimatorAdapter<ExtendedLeastSquaresSolver>>(
		    "ExtendedLeastSquares", "Least squares re-estimated with lagged residual regressors");
	}
	return std::make_unique<EstimatorAdapter<LeastSquaresSolver>>("LeastSquares", "Column-pivoting QR least squares");
}

} // namespace solvers
} // namespace libnarmax
