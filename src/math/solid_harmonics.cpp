#include "solid_harmonics.hpp"
#include <boost/math/special_functions/binomial.hpp>
#include <boost/math/special_functions/factorials.hpp>
#include <array>
#include <cstdlib>

namespace
{
    double binom(int n, int k)
    {
        return boost::math::binomial_coefficient<double>(static_cast<unsigned>(n), static_cast<unsigned>(k));
    }

    double fact(int n)
    {
        return boost::math::factorial<double>(static_cast<unsigned>(n));
    }

    // position of the component with powers ay, az within its shell
    Index cart_index(int ay, int az)
    {
        const int i = ay + az;
        return i * (i + 1) / 2 + az;
    }
}

EigenVector<double> gtointmath::calcYlm_coeff(int l, int m_signed)
{
    EigenVector<double> coeffs = EigenVector<double>::Zero(ncart(l));
    const int m = std::abs(m_signed);

    // i^q, real part for the cosine type (m >= 0), imaginary part for the sine type
    constexpr std::array<int, 4> re_phase = {1, 0, -1, 0};
    constexpr std::array<int, 4> im_phase = {0, 1, 0, -1};
    const std::array<int, 4>& phase = (m_signed < 0) ? im_phase : re_phase;

    double norm = std::pow(2.0, -l);
    if (m) norm *= std::sqrt(2.0 * fact(l - m) / fact(l + m));

    for (int k = 0; k <= (l - m) / 2; ++k)
    {
        double ck = (k % 2 ? -norm : norm) * binom(l, k) * binom(2 * (l - k), l);
        if (m) ck *= fact(l - 2 * k) / fact(l - 2 * k - m);

        // r^2k = (x^2 + y^2 + z^2)^k times z^(l - m - 2k) times (x + iy)^m
        for (int a = 0; a <= k; ++a)
            for (int b = 0; b <= a; ++b)
            {
                const double c = ck * binom(k, a) * binom(a, b);
                const int az = l - m - 2 * (k - b);
                const int ay = 2 * (a - b);

                for (int q = 0; q <= m; ++q)
                    if (phase[q % 4])
                        coeffs(cart_index(ay + q, az)) += phase[q % 4] * binom(m, q) * c;
            }
    }

    return coeffs;
}

EigenMatrix<double> gtointmath::cart_to_sph_transform(int l)
{
    EigenMatrix<double> tr(nsph(l), ncart(l));

    for (int m = -l; m <= l; ++m)
        tr.row(l + m) = calcYlm_coeff(l, m).transpose();

    // calcYlm_coeff assumes the x^l normalization on every component, rescale to N(x^l) / N(ax, ay, az)
    const double dfac_l = dfac(2 * l - 1);

    for (int i = 0, ci = 0; i <= l; ++i)
        for (int j = 0; j <= i; ++j, ++ci)
        {
            const int ax = l - i;
            const int ay = i - j;
            const int az = j;
            tr.col(ci) *= std::sqrt(dfac(2 * ax - 1) * dfac(2 * ay - 1) * dfac(2 * az - 1) / dfac_l);
        }

    return tr;
}
