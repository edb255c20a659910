#ifndef GTOINT_SHELL_PAIR
#define GTOINT_SHELL_PAIR
#include "gtoint_shell.hpp"

namespace BASIS
{

// Primitive pair data, index p1 * K2 + p2. Contraction coefficients are not folded in,
// a generalized shell carries several coefficient columns.
struct ShellPair
{
    explicit ShellPair(const ContractionShell& s1, const ContractionShell& s2);
    const ContractionShell& m_s1;
    const ContractionShell& m_s2;
    EigenVector<Vec3D> P;
    EigenVector<Vec3D> PA;
    EigenVector<Vec3D> PB;
    Vec3D AB;
    EigenVector<double> gamma_ab;
    EigenVector<double> pfac;   // (pi / p)^(3/2) exp(-mu AB^2), overlap type
    EigenVector<double> pfac2;  // (2 pi / p) exp(-mu AB^2), potential type
};
}

#endif
// end GTOINT_SHELL_PAIR
