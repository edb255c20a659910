#include "gtoint_shellpair.hpp"

using gtointmath::pi;

BASIS::ShellPair::ShellPair(const ContractionShell& s1, const ContractionShell& s2)
: m_s1(s1), m_s2(s2)
{
    const Index dim1 = m_s1.num_prims();
    const Index dim2 = m_s2.num_prims();
    const EigenVector<double>& alpha1 = m_s1.alpha();
    const EigenVector<double>& alpha2 = m_s2.alpha();

    P = EigenVector<Vec3D>(dim1 * dim2);
    PA = EigenVector<Vec3D>(dim1 * dim2);
    PB = EigenVector<Vec3D>(dim1 * dim2);
    gamma_ab = EigenVector<double>(dim1 * dim2);
    pfac = EigenVector<double>(dim1 * dim2);
    pfac2 = EigenVector<double>(dim1 * dim2);

    AB = m_s1.r() - m_s2.r();

    const double Rab2 = gtointmath::rab2(m_s1.r(), m_s2.r());

    for(Index i = 0; i < dim1; ++i)
        for(Index j = 0; j < dim2; ++j)
        {
            const Index id = i * dim2 + j;
            gamma_ab(id) = alpha1(i) + alpha2(j);

            const Vec3D P_ = gtointmath::gpc(alpha1(i), alpha2(j), m_s1.r(), m_s2.r());
            const double eta = alpha1(i) * alpha2(j) / gamma_ab(id);
            const double Kab = std::exp(-eta * Rab2);

            pfac(id)  = std::pow(pi / gamma_ab(id), 1.5) * Kab;
            pfac2(id) = (2.0 * pi / gamma_ab(id)) * Kab;

            P(id) = P_;
            PA(id) = P_ - m_s1.r();
            PB(id) = P_ - m_s2.r();
        }
}
