#include "gtoint_shell.hpp"
#include "gtoint_moment.hpp"
#include "../math/solid_harmonics.hpp"
#include <stdexcept>
#include <string>

using gtointmath::dfac;
using gtointmath::pi;
using MOMENT::compute_multipole_moment_integrals;

BASIS::ContractionShell::ContractionShell(const int L, const Eigen::Ref<const Vec3D>& r,
                                          const EigenMatrix<double>& coeffs,
                                          const EigenVector<double>& alpha)
:   m_L(L),
    m_r(r),
    m_alpha(alpha),
    m_coeffs(coeffs)
{
    check_input();

    cirange = gtointmath::ncart(m_L);
    sirange = gtointmath::nsph(m_L);

    indices = std::vector<idq>(cirange);

    for (Index i = 0, ci = 0; i <= m_L; ++i)
    {
        Index l = m_L - i;
        for (Index j = 0; j <= i; ++j, ++ci)
        {
            Index m = i - j;
            Index n = j;

            indices[ci].l = l;
            indices[ci].m = m;
            indices[ci].n = n;
            indices[ci].ci = ci;
        }
    }

    cart_to_spherical = gtointmath::cart_to_sph_transform(m_L);

    assign_prim_norm();
    assign_cont_norm();
}

BASIS::ContractionShell::ContractionShell(const int L, const Eigen::Ref<const Vec3D>& r,
                                          const EigenVector<double>& coeffs,
                                          const EigenVector<double>& alpha)
:   ContractionShell(L, r, EigenMatrix<double>(coeffs), alpha)
{
}

void BASIS::ContractionShell::check_input() const
{
    if (m_L < 0)
        throw std::invalid_argument("Angular momentum must be a non-negative integer, got " + std::to_string(m_L) + ".");

    if (!m_r.allFinite())
        throw std::invalid_argument("Shell center must have finite coordinates.");

    if (!m_alpha.size())
        throw std::invalid_argument("A shell needs at least one primitive exponent.");

    for (Index i = 0; i < m_alpha.size(); ++i)
        if (!(m_alpha(i) > 0.0))
            throw std::invalid_argument("Primitive exponents must be positive, exponent "
                                        + std::to_string(i) + " is " + std::to_string(m_alpha(i)) + ".");

    if (!m_coeffs.cols())
        throw std::invalid_argument("Contraction coefficients must have at least one column.");

    if (m_coeffs.rows() != m_alpha.size())
        throw std::invalid_argument("Coefficient matrix has " + std::to_string(m_coeffs.rows())
                                    + " rows but there are " + std::to_string(m_alpha.size()) + " exponents.");
}

// N(a, alpha) = (2 alpha / pi)^(3/4) (4 alpha)^(L/2) / sqrt((2ax - 1)!! (2ay - 1)!! (2az - 1)!!)
void BASIS::ContractionShell::assign_prim_norm()
{
    m_prim_norm = EigenMatrix<double>(cirange, m_alpha.size());

    for (const auto& i : indices)
    {
        const double dfac_lmn = dfac(2 * i.l - 1) * dfac(2 * i.m - 1) * dfac(2 * i.n - 1);

        for (Index k = 0; k < m_alpha.size(); ++k)
            m_prim_norm(i.ci, k) = std::pow(2.0 * m_alpha(k) / pi, 0.75)
                                 * std::pow(4.0 * m_alpha(k), 0.5 * m_L) / std::sqrt(dfac_lmn);
    }
}

// Must run last: the moment engine reads the primitive level data set above.
void BASIS::ContractionShell::assign_cont_norm()
{
    m_cont_norm = EigenMatrix<double>::Ones(num_seg_cont(), cirange);

    const auto self_overlap = compute_multipole_moment_integrals(Vec3D::Zero(), EigenMatrix<int>::Zero(1, 3),
                                                                 *this, *this);
    const auto& S = self_overlap[0];

    for (Index m = 0; m < num_seg_cont(); ++m)
        for (Index ci = 0; ci < cirange; ++ci)
        {
            if (!(S(m, ci, m, ci) > 0.0))
                throw std::invalid_argument("Segmented contraction " + std::to_string(m)
                                            + " has zero norm, check the contraction coefficients.");

            m_cont_norm(m, ci) = 1.0 / std::sqrt(S(m, ci, m, ci));
        }
}

EigenMatrix<int> BASIS::ContractionShell::cart_components() const
{
    EigenMatrix<int> comps(cirange, 3);

    for (const auto& i : indices)
    {
        comps(i.ci, 0) = static_cast<int>(i.l);
        comps(i.ci, 1) = static_cast<int>(i.m);
        comps(i.ci, 2) = static_cast<int>(i.n);
    }

    return comps;
}

std::vector<int> BASIS::ContractionShell::sph_components() const
{
    std::vector<int> comps;
    for (int m = -m_L; m <= m_L; ++m) comps.emplace_back(m);

    return comps;
}
