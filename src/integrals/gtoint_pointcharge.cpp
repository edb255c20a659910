#include "gtoint_pointcharge.hpp"
#include "gtoint_shellpair.hpp"
#include "gtoint_osrecur.hpp"
#include "../math/gamma.hpp"
#include <stdexcept>
#include <string>

using BASIS::ShellPair;
using extramath::F_nu;
using gtointmath::rab2;
using os_recursion::osrecurpot3c;

POINTCHARGE::PointChargeIntegral::PointChargeIntegral(const std::vector<ContractionShell>& basis,
                                                      const EigenMatrix<double>& points,
                                                      const EigenVector<double>& charges)
: TwoIndexBase(basis), m_points(points), m_charges(charges)
{
    if (m_points.cols() != 3)
        throw std::invalid_argument("Point charge coordinates must have 3 columns, got "
                                    + std::to_string(m_points.cols()) + ".");

    if (m_points.rows() != m_charges.size())
        throw std::invalid_argument("Got " + std::to_string(m_points.rows()) + " point charge coordinates and "
                                    + std::to_string(m_charges.size()) + " charges.");
}

std::vector<tensor4d<double>>
POINTCHARGE::PointChargeIntegral::construct_array_contraction(const ContractionShell& sh1,
                                                              const ContractionShell& sh2) const
{
    const Index L1 = sh1.L(); const Index L2 = sh2.L();
    const Index M1 = sh1.num_seg_cont(); const Index M2 = sh2.num_seg_cont();
    const Index nmax = L1 + L2;

    const Index dim1 = L1 + 1; const Index dim2 = L2 + 1;
    const Index dim11122 = dim1 * dim1 * dim1 * dim2 * dim2;
    const Index dim1112 = dim1 * dim1 * dim1 * dim2;
    const Index dim111 = dim1 * dim1 * dim1;
    const Index dim11 = dim1 * dim1;

    const auto idx = [&](Index n2, Index m2, Index l2, Index n1, Index m1, Index l1) -> Index
    {
        return  dim11122 * n2 +
                dim1112 * m2 +
                dim111 * l2 +
                dim11 * n1 +
                dim1 * m1 +
                l1;
    };

    EigenMatrix<double> Vs = EigenMatrix<double>::Zero(dim2 * dim2 * dim2 * dim1 * dim1 * dim1, nmax + 1);

    std::vector<tensor4d<double>> blocks;
    blocks.reserve(m_points.rows());

    const ShellPair sp(sh1, sh2);
    const EigenMatrix<double>& c1 = sh1.coeffs();
    const EigenMatrix<double>& c2 = sh2.coeffs();
    const EigenMatrix<double>& N1 = sh1.prim_norm();
    const EigenMatrix<double>& N2 = sh2.prim_norm();
    const auto& id1 = sh1.get_indices();
    const auto& id2 = sh2.get_indices();
    const Index K2 = sh2.num_prims();

    for (Index c = 0; c < m_points.rows(); ++c)
    {
        const Vec3D C = m_points.row(c).transpose();
        tensor4d<double> v_block(M1, sh1.get_cirange(), M2, sh2.get_cirange());

        for (Index p1 = 0; p1 < sh1.num_prims(); ++p1)
        {
            for (Index p2 = 0; p2 < K2; ++p2)
            {
                const Index id = p1 * K2 + p2;
                const double gamma12 = sp.gamma_ab(id);
                const double r_pc2 = rab2(sp.P(id), C);
                const double T = gamma12 * r_pc2;
                const double prefac = m_charges(c) * sp.pfac2(id);

                osrecurpot3c<double>(sp.PA(id), sp.PB(id), sp.P(id) - C, gamma12, r_pc2,
                                     T, F_nu(static_cast<double>(nmax), T), L1, L1, L1, L2, L2, L2, nmax, Vs, idx);

                for (const auto& i : id1)
                {
                    for (const auto& j : id2)
                    {
                        const double v = prefac * N1(i.ci, p1) * N2(j.ci, p2) * Vs(idx(j.n, j.m, j.l, i.n, i.m, i.l), 0);

                        for (Index m1 = 0; m1 < M1; ++m1)
                            for (Index m2 = 0; m2 < M2; ++m2)
                                v_block(m1, i.ci, m2, j.ci) -= c1(p1, m1) * c2(p2, m2) * v;
                    }
                }
            }
        }

        blocks.emplace_back(std::move(v_block));
    }

    return blocks;
}

std::vector<EigenMatrix<double>> POINTCHARGE::point_charge_integral(const std::vector<ContractionShell>& basis,
                                                                    const EigenMatrix<double>& points,
                                                                    const EigenVector<double>& charges,
                                                                    const CoordSpec& coord)
{
    return PointChargeIntegral(basis, points, charges).construct_array_mix(coord);
}

std::vector<EigenMatrix<double>> POINTCHARGE::point_charge_integral(const std::vector<ContractionShell>& basis,
                                                                    const EigenMatrix<double>& points,
                                                                    const EigenVector<double>& charges,
                                                                    const CoordSpec& coord,
                                                                    const EigenMatrix<double>& transform)
{
    return PointChargeIntegral(basis, points, charges).construct_array_lincomb(transform, coord);
}
