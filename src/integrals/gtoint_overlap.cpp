#include "gtoint_overlap.hpp"
#include "gtoint_moment.hpp"

using MOMENT::compute_multipole_moment_integrals;

std::vector<tensor4d<double>>
OVERLAP::Overlap::construct_array_contraction(const ContractionShell& sh1, const ContractionShell& sh2) const
{
    return compute_multipole_moment_integrals(Vec3D::Zero(), EigenMatrix<int>::Zero(1, 3), sh1, sh2);
}

EigenMatrix<double> OVERLAP::overlap_integral(const std::vector<ContractionShell>& basis, const CoordSpec& coord)
{
    return Overlap(basis).construct_array_mix(coord)[0];
}

EigenMatrix<double> OVERLAP::overlap_integral(const std::vector<ContractionShell>& basis, const CoordSpec& coord,
                                              const EigenMatrix<double>& transform)
{
    return Overlap(basis).construct_array_lincomb(transform, coord)[0];
}

EigenMatrix<double> OVERLAP::overlap_asymmetric(const std::vector<ContractionShell>& basis_one,
                                                const std::vector<ContractionShell>& basis_two,
                                                const CoordSpec& coord_one, const CoordSpec& coord_two)
{
    return Overlap(basis_one, basis_two).construct_array_mix(coord_one, coord_two)[0];
}

EigenMatrix<double> OVERLAP::overlap_asymmetric(const std::vector<ContractionShell>& basis_one,
                                                const std::vector<ContractionShell>& basis_two,
                                                const CoordSpec& coord_one, const CoordSpec& coord_two,
                                                const EigenMatrix<double>& transform_one,
                                                const EigenMatrix<double>& transform_two)
{
    return Overlap(basis_one, basis_two).construct_array_lincomb(transform_one, transform_two,
                                                                 coord_one, coord_two)[0];
}
