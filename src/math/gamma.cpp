#include "gamma.hpp"
#include <boost/math/special_functions/gamma.hpp>
#include <cmath>

double extramath::F_nu(const double nu, const double x)
{
    // Small argument: two terms of the Taylor series, P(a, x) underflows first
    if (x < 1.0E-12) return 1.0 / (2.0 * nu + 1.0) - x / (2.0 * nu + 3.0);

    const double a = nu + 0.5;
    return 0.5 * boost::math::tgamma(a) * boost::math::gamma_p(a, x) / std::pow(x, a);
}
