#include "polynomial_basis.hpp"

/*This file contains the monomial basis of the polynomial surface fit.
Rows are evaluated directly in radians; degrees stay small enough for that.*/

namespace polynomial_basis
{

namespace
{
/**
 * @brief Integer power with 0^0 = 1 and negative exponents mapped to zero.
 */
double ipow(double x, int n)
{
    if (n < 0) return 0.0;
    double out = 1.0;
    for (int k = 0; k < n; ++k)
    {
        out *= x;
    }
    return out;
}
}

std::vector<std::pair<int, int>> exponents(int degree, deckcoef::DegreeType type)
{
    std::vector<std::pair<int, int>> terms;
    for (int i = 0; i <= degree; ++i)
    {
        for (int j = 0; j <= degree; ++j)
        {
            if (type == deckcoef::DegreeType::Total && i + j > degree)
            {
                continue;
            }
            terms.emplace_back(i, j);
        }
    }
    return terms;
}

Eigen::RowVectorXd row(const std::vector<std::pair<int, int>>& terms,
                       deckcoef::ConstraintQuantity quantity,
                       double x0,
                       double x1)
{
    Eigen::RowVectorXd out(static_cast<Eigen::Index>(terms.size()));
    for (std::size_t k = 0; k < terms.size(); ++k)
    {
        const int i = terms[k].first;
        const int j = terms[k].second;
        double v = 0.0;
        switch (quantity)
        {
            case deckcoef::ConstraintQuantity::Value:
                v = ipow(x0, i) * ipow(x1, j);
                break;
            case deckcoef::ConstraintQuantity::DerivativeX0:
                v = static_cast<double>(i) * ipow(x0, i - 1) * ipow(x1, j);
                break;
            case deckcoef::ConstraintQuantity::DerivativeX1:
                v = static_cast<double>(j) * ipow(x0, i) * ipow(x1, j - 1);
                break;
        }
        out(static_cast<Eigen::Index>(k)) = v;
    }
    return out;
}

Eigen::MatrixXd design_matrix(const std::vector<std::pair<int, int>>& terms,
                              const std::vector<double>& x0,
                              const std::vector<double>& x1)
{
    Eigen::MatrixXd A(static_cast<Eigen::Index>(x0.size()), static_cast<Eigen::Index>(terms.size()));
    for (std::size_t p = 0; p < x0.size(); ++p)
    {
        A.row(static_cast<Eigen::Index>(p)) = row(terms, deckcoef::ConstraintQuantity::Value, x0[p], x1[p]);
    }
    return A;
}

} // namespace polynomial_basis
