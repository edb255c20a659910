#include "gtoint_moment.hpp"
#include "gtoint_shellpair.hpp"
#include "gtoint_osrecur.hpp"
#include <stdexcept>
#include <string>

using BASIS::ShellPair;
using os_recursion::osrecurmoment;
using tensormath::tensor3d;
using tensormath::tensor4d;

void MOMENT::check_orders(const EigenMatrix<int>& orders)
{
    if (orders.cols() != 3)
        throw std::invalid_argument("Moment orders must have 3 columns (x, y, z), got "
                                    + std::to_string(orders.cols()) + ".");

    for (Index n = 0; n < orders.rows(); ++n)
        for (Index k = 0; k < 3; ++k)
            if (orders(n, k) < 0)
                throw std::invalid_argument("Moment orders must be non-negative, row " + std::to_string(n)
                                            + " has " + std::to_string(orders(n, k)) + ".");
}

std::vector<tensor4d<double>>
MOMENT::compute_multipole_moment_integrals(const Eigen::Ref<const Vec3D>& center,
                                           const EigenMatrix<int>& orders,
                                           const BASIS::ContractionShell& sh1,
                                           const BASIS::ContractionShell& sh2)
{
    check_orders(orders);

    const Index nmoments = orders.rows();
    const Index L1 = sh1.L();
    const Index L2 = sh2.L();
    const Index M1 = sh1.num_seg_cont();
    const Index M2 = sh2.num_seg_cont();

    std::vector<tensor4d<double>> blocks;
    blocks.reserve(nmoments);
    for (Index n = 0; n < nmoments; ++n)
        blocks.emplace_back(tensor4d<double>(M1, sh1.get_cirange(), M2, sh2.get_cirange()));

    if (!nmoments) return blocks;

    const Index Ex = orders.col(0).maxCoeff();
    const Index Ey = orders.col(1).maxCoeff();
    const Index Ez = orders.col(2).maxCoeff();

    tensor3d<double> Sx(Ex + 1, L2 + 1, L1 + 1);
    tensor3d<double> Sy(Ey + 1, L2 + 1, L1 + 1);
    tensor3d<double> Sz(Ez + 1, L2 + 1, L1 + 1);

    const ShellPair sp(sh1, sh2);
    const EigenMatrix<double>& c1 = sh1.coeffs();
    const EigenMatrix<double>& c2 = sh2.coeffs();
    const EigenMatrix<double>& N1 = sh1.prim_norm();
    const EigenMatrix<double>& N2 = sh2.prim_norm();
    const auto& id1 = sh1.get_indices();
    const auto& id2 = sh2.get_indices();
    const Index K2 = sh2.num_prims();

    for (Index p1 = 0; p1 < sh1.num_prims(); ++p1)
    {
        for (Index p2 = 0; p2 < K2; ++p2)
        {
            const Index id = p1 * K2 + p2;
            const Vec3D& Rpa = sp.PA(id);
            const Vec3D& Rpb = sp.PB(id);
            const Vec3D Rpc = sp.P(id) - center;
            const double gamma12inv = 1.0 / (2.0 * sp.gamma_ab(id));
            const double prefac = sp.pfac(id);

            osrecurmoment<double>(Sx, L1, L2, Ex, Rpa(0), Rpb(0), Rpc(0), gamma12inv);
            osrecurmoment<double>(Sy, L1, L2, Ey, Rpa(1), Rpb(1), Rpc(1), gamma12inv);
            osrecurmoment<double>(Sz, L1, L2, Ez, Rpa(2), Rpb(2), Rpc(2), gamma12inv);

            for (Index n = 0; n < nmoments; ++n)
            {
                const Index ex = orders(n, 0);
                const Index ey = orders(n, 1);
                const Index ez = orders(n, 2);
                auto& block = blocks[n];

                for (const auto& i : id1)
                {
                    for (const auto& j : id2)
                    {
                        const double s = prefac * N1(i.ci, p1) * N2(j.ci, p2)
                                       * Sx(ex, j.l, i.l) * Sy(ey, j.m, i.m) * Sz(ez, j.n, i.n);

                        for (Index m1 = 0; m1 < M1; ++m1)
                            for (Index m2 = 0; m2 < M2; ++m2)
                                block(m1, i.ci, m2, j.ci) += c1(p1, m1) * c2(p2, m2) * s;
                    }
                }
            }
        }
    }

    return blocks;
}
