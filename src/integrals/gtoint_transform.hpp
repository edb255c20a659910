#ifndef SPHERICAL_TRANSFORM_H
#define SPHERICAL_TRANSFORM_H

#include "gtoint_shell.hpp"
#include "../math/gtoint_tensors.hpp"

using BASIS::ContractionShell;
using tensormath::tensor4d;

namespace TRANSFORM
{
    // Rows (m, cart) of a shell, m * cart + c, to (m, n) with n cart or sph.
    // Contraction norms are applied, then the spherical transform when pure.
    EigenMatrix<double> to_shell_form(const ContractionShell& sh, const Eigen::Ref<const EigenMatrix<double>>& rows,
                                      const bool pure);

    // Normalized shell pair block, (M1 * n1) x (M2 * n2)
    EigenMatrix<double> transform(const ContractionShell& sh1, const ContractionShell& sh2,
                                  const tensor4d<double>& block, const bool pure1, const bool pure2);

    // Copy block into M at (off1, off2), and its transpose at (off2, off1) when mirror is set
    void place(const Eigen::Ref<const EigenMatrix<double>>& block, EigenMatrix<double>& M,
               const Index off1, const Index off2, const bool mirror);
}

#endif
