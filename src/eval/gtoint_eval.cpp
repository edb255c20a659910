#include "gtoint_eval.hpp"
#include "../integrals/gtoint_transform.hpp"
#include <stdexcept>
#include <string>
#ifdef _OPENMP
    #include <omp.h>
#endif

using EVAL::Vec3I;

namespace
{
    // d^k/dx^k x^n exp(-alpha x^2) without the exponential. The derivative maps c x^p to
    // c p x^(p - 1) - 2 alpha c x^(p + 1), powers run from n - k to n + k.
    double deriv_1d(const double x, const int n, const int k, const double alpha)
    {
        std::vector<double> c(2 * k + 1, 0.0);
        c[k] = 1.0;

        for (int d = 0; d < k; ++d)
        {
            std::vector<double> next(2 * k + 1, 0.0);

            for (int q = 0; q < 2 * k + 1; ++q)
            {
                if (c[q] == 0.0) continue;

                const int p = n - k + q;
                if (p != 0) next[q - 1] += c[q] * p;
                next[q + 1] -= 2.0 * alpha * c[q];
            }

            c.swap(next);
        }

        double val = 0.0;
        for (int q = 0; q < 2 * k + 1; ++q)
            if (c[q] != 0.0) val += c[q] * std::pow(x, n - k + q);

        return val;
    }

    void check_orders(const Vec3I& orders)
    {
        if ((orders.array() < 0).any())
            throw std::invalid_argument("Derivative orders must be non-negative.");
    }

    void check_input(const EigenMatrix<double>& points, const EigenMatrix<int>& angmoms,
                     const EigenVector<double>& alphas, const EigenVector<double>& coeffs)
    {
        if (points.cols() != 3)
            throw std::invalid_argument("Points must have 3 columns, got " + std::to_string(points.cols()) + ".");

        if (angmoms.cols() != 3)
            throw std::invalid_argument("Angular momentum components must have 3 columns, got "
                                        + std::to_string(angmoms.cols()) + ".");

        if (alphas.size() != coeffs.size())
            throw std::invalid_argument("Got " + std::to_string(alphas.size()) + " exponents and "
                                        + std::to_string(coeffs.size()) + " coefficients.");
    }

    // (M * cart) x N rows of a shell, primitive norms applied, contraction norms not
    EigenMatrix<double> shell_rows(const ContractionShell& sh, const EigenMatrix<double>& points, const Vec3I& orders)
    {
        const Index ncart = sh.get_cirange();
        const EigenMatrix<int> comps = sh.cart_components();
        const EigenMatrix<double>& coeffs = sh.coeffs();
        const EigenMatrix<double>& N = sh.prim_norm();

        EigenMatrix<double> rows = EigenMatrix<double>::Zero(sh.num_seg_cont() * ncart, points.rows());

        for (Index p = 0; p < points.rows(); ++p)
        {
            const Vec3D r = points.row(p).transpose();

            for (Index c = 0; c < ncart; ++c)
            {
                const Vec3I a = comps.row(c).transpose();

                for (Index k = 0; k < sh.num_prims(); ++k)
                {
                    const double g = N(c, k) * EVAL::evaluate_deriv_primitive(r, orders, sh.r(), a, sh.alpha()(k));

                    for (Index m = 0; m < sh.num_seg_cont(); ++m)
                        rows(m * ncart + c, p) += coeffs(k, m) * g;
                }
            }
        }

        return rows;
    }

    EigenMatrix<double> basis_values(const std::vector<ContractionShell>& basis, const EigenMatrix<double>& points,
                                     const Vec3I& orders, const CoordSpec& coord)
    {
        if (points.cols() != 3)
            throw std::invalid_argument("Points must have 3 columns, got " + std::to_string(points.cols()) + ".");

        check_orders(orders);

        const std::vector<Index> offs = coord.offsets(basis);
        const Index nshells = static_cast<Index>(basis.size());

        EigenMatrix<double> vals = EigenMatrix<double>(offs.back(), points.rows());

#ifdef _OPENMP
        #pragma omp parallel for schedule(dynamic)
#endif
        for (Index s = 0; s < nshells; ++s)
        {
            const bool pure = coord.at(s) == TWOINDEX::CoordType::spherical;
            const EigenMatrix<double> rows = TRANSFORM::to_shell_form(basis[s], shell_rows(basis[s], points, orders),
                                                                      pure);
            vals.middleRows(offs[s], rows.rows()) = rows;
        }

        return vals;
    }

    void check_transform(const std::vector<ContractionShell>& basis, const CoordSpec& coord,
                         const EigenMatrix<double>& transform)
    {
        const Index nbasis = coord.num_functions(basis);

        if (transform.cols() != nbasis)
            throw std::invalid_argument("Transform has " + std::to_string(transform.cols())
                                        + " columns but the basis has " + std::to_string(nbasis) + " functions.");
    }
}

double EVAL::evaluate_primitive(const Vec3D& point, const Vec3D& center, const Vec3I& angmom, const double alpha)
{
    const Vec3D d = point - center;

    double val = std::exp(-alpha * d.squaredNorm());
    for (int i = 0; i < 3; ++i)
        if (angmom(i)) val *= std::pow(d(i), angmom(i));

    return val;
}

double EVAL::evaluate_deriv_primitive(const Vec3D& point, const Vec3I& orders, const Vec3D& center,
                                      const Vec3I& angmom, const double alpha)
{
    check_orders(orders);

    if (!orders.any()) return evaluate_primitive(point, center, angmom, alpha);

    const Vec3D d = point - center;

    double val = std::exp(-alpha * d.squaredNorm());
    for (int i = 0; i < 3; ++i)
    {
        if (!orders(i))
        {
            if (angmom(i)) val *= std::pow(d(i), angmom(i));
            continue;
        }

        val *= deriv_1d(d(i), angmom(i), orders(i), alpha);
    }

    return val;
}

EigenMatrix<double> EVAL::evaluate_deriv_contraction(const EigenMatrix<double>& points, const Vec3I& orders,
                                                     const Vec3D& center, const EigenMatrix<int>& angmoms,
                                                     const EigenVector<double>& alphas,
                                                     const EigenVector<double>& coeffs)
{
    check_input(points, angmoms, alphas, coeffs);
    check_orders(orders);

    EigenMatrix<double> vals = EigenMatrix<double>::Zero(angmoms.rows(), points.rows());

    for (Index a = 0; a < angmoms.rows(); ++a)
    {
        const Vec3I angmom = angmoms.row(a).transpose();

        for (Index p = 0; p < points.rows(); ++p)
        {
            const Vec3D r = points.row(p).transpose();

            for (Index k = 0; k < alphas.size(); ++k)
                vals(a, p) += coeffs(k) * evaluate_deriv_primitive(r, orders, center, angmom, alphas(k));
        }
    }

    return vals;
}

EigenVector<double> EVAL::evaluate_deriv_contraction(const Vec3D& point, const Vec3I& orders,
                                                     const Vec3D& center, const EigenMatrix<int>& angmoms,
                                                     const EigenVector<double>& alphas,
                                                     const EigenVector<double>& coeffs)
{
    const EigenMatrix<double> points = point.transpose();

    return evaluate_deriv_contraction(points, orders, center, angmoms, alphas, coeffs).col(0);
}

EigenMatrix<double> EVAL::evaluate_contraction(const EigenMatrix<double>& points, const Vec3D& center,
                                               const EigenMatrix<int>& angmoms, const EigenVector<double>& alphas,
                                               const EigenVector<double>& coeffs)
{
    return evaluate_deriv_contraction(points, Vec3I::Zero(), center, angmoms, alphas, coeffs);
}

EigenVector<double> EVAL::evaluate_contraction(const Vec3D& point, const Vec3D& center,
                                               const EigenMatrix<int>& angmoms, const EigenVector<double>& alphas,
                                               const EigenVector<double>& coeffs)
{
    return evaluate_deriv_contraction(point, Vec3I::Zero(), center, angmoms, alphas, coeffs);
}

EigenMatrix<double> EVAL::evaluate_basis(const std::vector<ContractionShell>& basis, const EigenMatrix<double>& points,
                                         const CoordSpec& coord)
{
    return basis_values(basis, points, Vec3I::Zero(), coord);
}

EigenMatrix<double> EVAL::evaluate_basis(const std::vector<ContractionShell>& basis, const EigenMatrix<double>& points,
                                         const CoordSpec& coord, const EigenMatrix<double>& transform)
{
    check_transform(basis, coord, transform);

    return transform * basis_values(basis, points, Vec3I::Zero(), coord);
}

EigenMatrix<double> EVAL::evaluate_deriv_basis(const std::vector<ContractionShell>& basis,
                                               const EigenMatrix<double>& points, const Vec3I& orders,
                                               const CoordSpec& coord)
{
    return basis_values(basis, points, orders, coord);
}

EigenMatrix<double> EVAL::evaluate_deriv_basis(const std::vector<ContractionShell>& basis,
                                               const EigenMatrix<double>& points, const Vec3I& orders,
                                               const CoordSpec& coord, const EigenMatrix<double>& transform)
{
    check_transform(basis, coord, transform);

    return transform * basis_values(basis, points, orders, coord);
}
