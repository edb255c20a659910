#ifndef GTOINT_MOMENT
#define GTOINT_MOMENT

#include "gtoint_shell.hpp"
#include "../math/gtoint_tensors.hpp"
#include <vector>

namespace MOMENT
{
    /*
     * Multipole moment integrals int (r - C)^e g_a(r) g_b(r) dr over a pair of generalized shells,
     * one (M1, cart1, M2, cart2) block per row e = (ex, ey, ez) of orders.
     *
     * Primitive norms and contraction coefficients are applied, contraction norms are not.
     * Order (0, 0, 0) is the overlap, the center C then has no effect.
     * Throws std::invalid_argument when orders is not N x 3 or holds a negative entry.
     */
    std::vector<tensormath::tensor4d<double>>
    compute_multipole_moment_integrals(const Eigen::Ref<const Vec3D>& center,
                                       const EigenMatrix<int>& orders,
                                       const BASIS::ContractionShell& sh1,
                                       const BASIS::ContractionShell& sh2);

    // Throws std::invalid_argument unless orders is N x 3 with non-negative entries
    void check_orders(const EigenMatrix<int>& orders);
}

#endif
// End GTOINT_MOMENT
