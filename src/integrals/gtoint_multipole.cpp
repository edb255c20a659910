#include "gtoint_multipole.hpp"
#include "gtoint_moment.hpp"
#include <stdexcept>

using MOMENT::compute_multipole_moment_integrals;

MULTIPOLE::MomentIntegral::MomentIntegral(const std::vector<ContractionShell>& basis,
                                          const Eigen::Ref<const Vec3D>& center,
                                          const EigenMatrix<int>& orders)
: TwoIndexBase(basis), m_center(center), m_orders(orders)
{
    if (!m_center.allFinite())
        throw std::invalid_argument("Moment center must have finite coordinates.");

    MOMENT::check_orders(m_orders);
}

std::vector<tensor4d<double>>
MULTIPOLE::MomentIntegral::construct_array_contraction(const ContractionShell& sh1, const ContractionShell& sh2) const
{
    return compute_multipole_moment_integrals(m_center, m_orders, sh1, sh2);
}

std::vector<EigenMatrix<double>> MULTIPOLE::moment_integral(const std::vector<ContractionShell>& basis,
                                                            const Eigen::Ref<const Vec3D>& center,
                                                            const EigenMatrix<int>& orders,
                                                            const CoordSpec& coord)
{
    return MomentIntegral(basis, center, orders).construct_array_mix(coord);
}

std::vector<EigenMatrix<double>> MULTIPOLE::moment_integral(const std::vector<ContractionShell>& basis,
                                                            const Eigen::Ref<const Vec3D>& center,
                                                            const EigenMatrix<int>& orders,
                                                            const CoordSpec& coord,
                                                            const EigenMatrix<double>& transform)
{
    return MomentIntegral(basis, center, orders).construct_array_lincomb(transform, coord);
}

EigenMatrix<int> MULTIPOLE::orders_up_to(int max_order)
{
    if (max_order < 0)
        throw std::invalid_argument("Maximum moment order must be non-negative.");

    Index nrows = 0;
    for (int L = 0; L <= max_order; ++L) nrows += gtointmath::ncart(L);

    EigenMatrix<int> orders(nrows, 3);

    for (int L = 0, row = 0; L <= max_order; ++L)
        for (int i = 0; i <= L; ++i)
            for (int j = 0; j <= i; ++j, ++row)
            {
                orders(row, 0) = L - i;
                orders(row, 1) = i - j;
                orders(row, 2) = j;
            }

    return orders;
}
