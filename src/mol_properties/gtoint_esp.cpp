#include "gtoint_esp.hpp"
#include "../integrals/gtoint_pointcharge.hpp"
#include <stdexcept>
#include <string>

using gtointmath::safe_divide;
using POINTCHARGE::point_charge_integral;

namespace
{
    // |D_ij - D_ji| <= atol + rtol |D_ji|
    bool is_symmetric(const EigenMatrix<double>& D)
    {
        constexpr double rtol = 1.0E-05;
        constexpr double atol = 1.0E-08;

        for (Index i = 0; i < D.rows(); ++i)
            for (Index j = 0; j < D.cols(); ++j)
                if (std::fabs(D(i, j) - D(j, i)) > atol + rtol * std::fabs(D(j, i)))
                    return false;

        return true;
    }

    void check_nuclei(const EigenMatrix<double>& nuc_coords, const EigenVector<double>& nuc_charges,
                      const double threshold_dist)
    {
        if (nuc_coords.cols() != 3)
            throw std::invalid_argument("Nuclear coordinates must have 3 columns.");

        if (nuc_coords.rows() != nuc_charges.size())
            throw std::invalid_argument("Got " + std::to_string(nuc_coords.rows()) + " nuclear positions and "
                                        + std::to_string(nuc_charges.size()) + " nuclear charges.");

        if (threshold_dist < 0.0)
            throw std::invalid_argument("threshold_dist must be greater than or equal to zero.");
    }

    void check_input(const EigenMatrix<double>& density, const EigenMatrix<double>& nuc_coords,
                     const EigenVector<double>& nuc_charges, const double threshold_dist,
                     const Index nbasis)
    {
        if (density.rows() != density.cols() || !is_symmetric(density))
            throw std::invalid_argument("The density matrix must be square and symmetric.");

        check_nuclei(nuc_coords, nuc_charges, threshold_dist);

        if (density.rows() != nbasis)
            throw std::invalid_argument("The density matrix is " + std::to_string(density.rows()) + " x "
                                        + std::to_string(density.cols()) + " but the basis has "
                                        + std::to_string(nbasis) + " functions.");
    }

    EigenVector<double> hartree_potential(const std::vector<EigenMatrix<double>>& pc_ints,
                                          const EigenMatrix<double>& density)
    {
        EigenVector<double> vh = EigenVector<double>(static_cast<Index>(pc_ints.size()));

        for (size_t p = 0; p < pc_ints.size(); ++p)
            vh(static_cast<Index>(p)) = density.cwiseProduct(pc_ints[p]).sum();

        return vh;
    }
}

EigenVector<double> ESP::nuclear_potential(const EigenMatrix<double>& points,
                                           const EigenMatrix<double>& nuc_coords,
                                           const EigenVector<double>& nuc_charges,
                                           const double threshold_dist)
{
    if (points.cols() != 3)
        throw std::invalid_argument("Points must have 3 columns, got " + std::to_string(points.cols()) + ".");

    check_nuclei(nuc_coords, nuc_charges, threshold_dist);

    EigenVector<double> vn = EigenVector<double>::Zero(points.rows());

    for (Index p = 0; p < points.rows(); ++p)
        for (Index a = 0; a < nuc_coords.rows(); ++a)
        {
            const double dist = (points.row(p) - nuc_coords.row(a)).norm();
            if (dist < threshold_dist) continue;

            vn(p) += safe_divide(nuc_charges(a), dist);
        }

    return vn;
}

EigenVector<double> ESP::electrostatic_potential(const std::vector<ContractionShell>& basis,
                                                 const EigenMatrix<double>& density,
                                                 const EigenMatrix<double>& points,
                                                 const EigenMatrix<double>& nuc_coords,
                                                 const EigenVector<double>& nuc_charges,
                                                 const CoordSpec& coord,
                                                 const double threshold_dist)
{
    check_input(density, nuc_coords, nuc_charges, threshold_dist, coord.num_functions(basis));

    const EigenVector<double> unit_charges = -EigenVector<double>::Ones(points.rows());
    const auto pc_ints = point_charge_integral(basis, points, unit_charges, coord);

    return nuclear_potential(points, nuc_coords, nuc_charges, threshold_dist) - hartree_potential(pc_ints, density);
}

EigenVector<double> ESP::electrostatic_potential(const std::vector<ContractionShell>& basis,
                                                 const EigenMatrix<double>& density,
                                                 const EigenMatrix<double>& points,
                                                 const EigenMatrix<double>& nuc_coords,
                                                 const EigenVector<double>& nuc_charges,
                                                 const CoordSpec& coord,
                                                 const EigenMatrix<double>& transform,
                                                 const double threshold_dist)
{
    check_input(density, nuc_coords, nuc_charges, threshold_dist, transform.rows());

    const EigenVector<double> unit_charges = -EigenVector<double>::Ones(points.rows());
    const auto pc_ints = point_charge_integral(basis, points, unit_charges, coord, transform);

    return nuclear_potential(points, nuc_coords, nuc_charges, threshold_dist) - hartree_potential(pc_ints, density);
}
