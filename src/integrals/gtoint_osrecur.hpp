#ifndef OSRECURALG_H
#define OSRECURALG_H

#include "../math/gtoint_tensors.hpp"
#include "../math/gtoint_math.hpp"
#include <array>

using tensormath::tensor3d;

namespace os_recursion
{

// Two center multipole moment recursion in one dimension, S(e, j, i) = S^e_{ij} for
// angular momentum i on A, j on B and moment order e about C. Can be used for x, y, z.
//
// S^e_{i+1,j} = X_PA S^e_{ij} + 1/2p (i S^e_{i-1,j} + j S^e_{i,j-1} + e S^{e-1}_{ij})
// S^e_{i,j+1} = X_PB S^e_{ij} + 1/2p (...)
// S^{e+1}_{ij} = X_PC S^e_{ij} + 1/2p (...)
//
// S^0_{00} = 1, the Gaussian prefactor is applied by the caller.
template<typename D>
void constexpr osrecurmoment(tensor3d<D>& S, const Index L1, const Index L2, const Index E,
                             const D Xpa, const D Xpb, const D Xpc, const D gamma12inv) noexcept
{
    const auto lower = [&](Index e, Index j, Index i) -> D
    {
        D tmp = 0;
        if (i) tmp += (D)i * S(e, j, i - 1);
        if (j) tmp += (D)j * S(e, j - 1, i);
        if (e) tmp += (D)e * S(e - 1, j, i);
        return gamma12inv * tmp;
    };

    S(0, 0, 0) = 1.0;

    for(Index i = 0; i < L1; ++i)
        S(0, 0, i + 1) = Xpa * S(0, 0, i) + lower(0, 0, i);

    for(Index j = 0; j < L2; ++j)
        for(Index i = 0; i <= L1; ++i)
            S(0, j + 1, i) = Xpb * S(0, j, i) + lower(0, j, i);

    for(Index e = 0; e < E; ++e)
        for(Index j = 0; j <= L2; ++j)
            for(Index i = 0; i <= L1; ++i)
                S(e + 1, j, i) = Xpc * S(e, j, i) + lower(e, j, i);
}

// Three center potential recursion, Jn(idx(n2, m2, l2, n1, m1, l1), n) = Theta^(n) of the auxiliary
// Obara-Saika integrals. The six powers (l1, m1, n1, l2, m2, n2) are raised one at a time, powers of
// later stages held at zero, so every raise only reads entries already built:
//
// J(a + 1_k)^(n) = X_PK J(a)^(n) - X_PC J(a)^(n+1)
//                + a_k / 2p (J(a - 1_k)^(n) - J(a - 1_k)^(n+1))
//                + a_k' / 2p (J(a - 1_k')^(n) - J(a - 1_k')^(n+1))
//
// k' is the same Cartesian direction on the other center. Starts from Boys function values at T.
template<typename D, typename IDX>
void constexpr
osrecurpot3c(const Eigen::Ref<const Vec3D>& PA, const Eigen::Ref<const Vec3D>& PB,
             const Eigen::Ref<const Vec3D>& PC, const D gamma,
             const D r_pc2,  const D T, const D Fnu_at_nmax, const Index l1, const Index m1,
             const Index n1, const Index l2, const Index m2, const  Index n2, const Index nmax, EigenMatrix<D>& Jn,
             const IDX& idx) noexcept
{
    if (std::fabs(r_pc2) > 1.0E-18)
    {
        // Downward recursion for Boys stability
        const D expT = std::exp(-T);
        Jn(0, nmax) = Fnu_at_nmax;
        for (Index n = nmax; n > 0; --n)
            Jn(0, n - 1) = (2.0 * T * Jn(0, n) + expT) / (2.0 * n - 1.0);
    }
    else
    {
        for (Index n = 0; n <= nmax; ++n) Jn(0, n) = 1.0 / (2.0 * n + 1.0);
    }

    if(!nmax) return;

    const D gamma2inv = 1.0 / (gamma + gamma);
    const std::array<Index, 6> top = {l1, m1, n1, l2, m2, n2};
    const std::array<D, 6> X = {PA(0), PA(1), PA(2), PB(0), PB(1), PB(2)};

    const auto at = [&idx](const std::array<Index, 6>& a) -> Index
    {
        return idx(a[5], a[4], a[3], a[2], a[1], a[0]);
    };

    for (int k = 0; k < 6; ++k)
    {
        const int axis = k % 3;
        const int partner = (k < 3) ? k + 3 : k - 3;

        // odometer over stages 0..k, stage k slowest
        std::array<Index, 6> a = {0, 0, 0, 0, 0, 0};
        for (;;)
        {
            if (a[k] < top[k])
            {
                const Index order = a[0] + a[1] + a[2] + a[3] + a[4] + a[5];
                std::array<Index, 6> up = a;
                ++up[k];
                const Index id_up = at(up);
                const Index id = at(a);

                for (Index n = 0; n < nmax - order; ++n)
                    Jn(id_up, n) = X[k] * Jn(id, n) - PC(axis) * Jn(id, n + 1);

                for (const int s : {k, partner})
                {
                    if (!a[s]) continue;

                    std::array<Index, 6> down = a;
                    --down[s];
                    const Index id_down = at(down);
                    const D fac = (D)a[s] * gamma2inv;

                    for (Index n = 0; n < nmax - order; ++n)
                        Jn(id_up, n) += fac * (Jn(id_down, n) - Jn(id_down, n + 1));
                }
            }

            int s = 0;
            for (; s <= k; ++s)
            {
                if (a[s] < top[s]) { ++a[s]; break; }
                a[s] = 0;
            }
            if (s > k) break;
        }
    }
}

}
#endif // OSRECURALG_H
