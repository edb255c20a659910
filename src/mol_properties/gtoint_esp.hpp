#ifndef GTOINT_ESP_H
#define GTOINT_ESP_H

#include "../integrals/gtoint_twoindex.hpp"
#include <vector>

using TWOINDEX::CoordSpec;

namespace ESP
{
    //! Electrostatic potential V(r) = sum_A Z_A / |r - R_A| - sum_ab D_ab <a| 1 / |r' - r| |b>
    //! basis         : The contraction shells.
    //! density       : One electron density matrix over the basis in coord (symmetric).
    //! points        : N x 3 points, Bohr.
    //! nuc_coords    : Nuclear positions, N_nuc x 3.
    //! nuc_charges   : Nuclear charges, N_nuc.
    //! coord         : Coordinate types of the basis.
    //! threshold_dist: Nuclei closer than this to a point are left out at that point.
    //!                 A nucleus at zero distance is always left out.
    EigenVector<double> electrostatic_potential(const std::vector<ContractionShell>& basis,
                                                const EigenMatrix<double>& density,
                                                const EigenMatrix<double>& points,
                                                const EigenMatrix<double>& nuc_coords,
                                                const EigenVector<double>& nuc_charges,
                                                const CoordSpec& coord,
                                                const double threshold_dist = 0.0);

    //! As above with the density expressed over the linear combinations transform * basis.
    EigenVector<double> electrostatic_potential(const std::vector<ContractionShell>& basis,
                                                const EigenMatrix<double>& density,
                                                const EigenMatrix<double>& points,
                                                const EigenMatrix<double>& nuc_coords,
                                                const EigenVector<double>& nuc_charges,
                                                const CoordSpec& coord,
                                                const EigenMatrix<double>& transform,
                                                const double threshold_dist = 0.0);

    //! Nuclear part only, N points. Same nuclear and threshold checks as above, points must have 3 columns.
    EigenVector<double> nuclear_potential(const EigenMatrix<double>& points,
                                          const EigenMatrix<double>& nuc_coords,
                                          const EigenVector<double>& nuc_charges,
                                          const double threshold_dist);
}

#endif
// GTOINT_ESP_H
