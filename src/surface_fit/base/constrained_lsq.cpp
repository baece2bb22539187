#include "constrained_lsq.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "coefficient_errors.hpp"

/*This file contains the linear algebra behind the surface fit.
Constraints are eliminated through an SVD of the constraint matrix before the data fit.*/

namespace constrained_lsq
{

/*This function solves an unconstrained least-squares problem.
Rank-deficient systems get the basic (QR) or minimum-norm (SVD) solution.*/
Eigen::VectorXd least_squares(const Eigen::MatrixXd& A, const Eigen::VectorXd& y, deckcoef::FitSolver solver)
{
    if (A.cols() == 0)
    {
        return Eigen::VectorXd();
    }
    if (A.rows() == 0)
    {
        return Eigen::VectorXd::Zero(A.cols());
    }

    Eigen::VectorXd x;
    if (solver == deckcoef::FitSolver::Svd)
    {
        Eigen::BDCSVD<Eigen::MatrixXd> svd(A, Eigen::ComputeThinU | Eigen::ComputeThinV);
        svd.setThreshold(rank_threshold);
        x = svd.solve(y);
    }
    else
    {
        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
        qr.setThreshold(rank_threshold);
        x = qr.solve(y);
    }

    if (!x.allFinite())
    {
        throw deckcoef::FitError("Least-squares solve produced non-finite coefficients");
    }
    return x;
}

/*This function solves the equality-constrained least-squares problem.*/
Eigen::VectorXd solve(const Eigen::MatrixXd& A,
                      const Eigen::VectorXd& y,
                      const Eigen::MatrixXd& C,
                      const Eigen::VectorXd& d,
                      deckcoef::FitSolver solver)
{
    if (C.rows() == 0)
    {
        return least_squares(A, y, solver);
    }

    const Eigen::Index n_terms = C.cols();
    Eigen::JacobiSVD<Eigen::MatrixXd> csvd(C, Eigen::ComputeFullU | Eigen::ComputeFullV);
    csvd.setThreshold(rank_threshold);

    const Eigen::VectorXd particular = csvd.solve(d);
    const double mismatch = (C * particular - d).norm();
    if (!std::isfinite(mismatch) || mismatch > consistency_tolerance * std::max(1.0, d.norm()))
    {
        std::ostringstream oss;
        oss << "Boundary constraints are inconsistent (residual " << mismatch << ")";
        throw deckcoef::FitError(oss.str());
    }

    const Eigen::Index rank = csvd.rank();
    if (rank >= n_terms)
    {
        return particular;
    }

    const Eigen::MatrixXd kernel = csvd.matrixV().rightCols(n_terms - rank);
    const Eigen::VectorXd z = least_squares(A * kernel, y - A * particular, solver);
    return particular + kernel * z;
}

} // namespace constrained_lsq
