#ifndef SOLID_HARMONICS_H
#define SOLID_HARMONICS_H

// Real solid harmonic coefficients, after erkale - DFT from hel.
// See http://en.wikipedia.org/wiki/Solid_spherical_harmonics

#include "gtoint_math.hpp"

namespace gtointmath
{

// Coefficients of Y_lm over the Cartesian monomials x^ax y^ay z^az, each taken with the
// x^l normalization. Entries follow the shell order, decreasing x then decreasing y.
EigenVector<double> calcYlm_coeff(int l, int m);

/// (2l+1, cart) matrix taking individually normalized Cartesian contractions to
/// normalized real solid harmonics, rows m = -l..l. Applied from the left.
EigenMatrix<double> cart_to_sph_transform(int l);
}

#endif
