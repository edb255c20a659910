/*
 * Boys function F_nu(T) = int_0^1 t^(2 nu) exp(-T t^2) dt
 *
 * Evaluated through the regularized lower incomplete gamma function,
 * F_nu(T) = Gamma(nu + 1/2) P(nu + 1/2, T) / (2 T^(nu + 1/2)).
 */

#pragma once

namespace extramath
{
    double F_nu(const double nu, const double x);
}
