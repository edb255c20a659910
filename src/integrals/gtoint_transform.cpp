#include "gtoint_transform.hpp"

EigenMatrix<double> TRANSFORM::to_shell_form(const ContractionShell& sh,
                                             const Eigen::Ref<const EigenMatrix<double>>& rows,
                                             const bool pure)
{
    const Index ncart = sh.get_cirange();
    const Index nfunc = (pure) ? sh.get_sirange() : ncart;
    const Index nseg = sh.num_seg_cont();
    const EigenMatrix<double>& cont_norm = sh.cont_norm();

    EigenMatrix<double> out = EigenMatrix<double>(nseg * nfunc, rows.cols());

    for (Index m = 0; m < nseg; ++m)
    {
        EigenMatrix<double> seg = rows.middleRows(m * ncart, ncart);

        for (Index c = 0; c < ncart; ++c)
            seg.row(c) *= cont_norm(m, c);

        if (pure) // Spherical basis
            out.middleRows(m * nfunc, nfunc) = sh.get_spherical_form() * seg;
        else      // Cartesian basis
            out.middleRows(m * nfunc, nfunc) = seg;
    }

    return out;
}

EigenMatrix<double> TRANSFORM::transform(const ContractionShell& sh1, const ContractionShell& sh2,
                                         const tensor4d<double>& block, const bool pure1, const bool pure2)
{
    const EigenMatrix<double> left = to_shell_form(sh1, block.matricize(), pure1);
    const EigenMatrix<double> both = to_shell_form(sh2, left.transpose(), pure2);

    return both.transpose();
}

void TRANSFORM::place(const Eigen::Ref<const EigenMatrix<double>>& block, EigenMatrix<double>& M,
                      const Index off1, const Index off2, const bool mirror)
{
    M.block(off1, off2, block.rows(), block.cols()) = block;

    if (mirror)
        M.block(off2, off1, block.cols(), block.rows()) = block.transpose();
}
