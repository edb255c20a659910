#ifndef GTOINT_OVERLAP
#define GTOINT_OVERLAP

#include "gtoint_twoindex.hpp"

using TWOINDEX::CoordSpec;
using TWOINDEX::TwoIndexBase;

namespace OVERLAP
{
    class Overlap : public TwoIndexBase
    {
        public:
            explicit Overlap(const std::vector<ContractionShell>& basis) : TwoIndexBase(basis) {}
            explicit Overlap(const std::vector<ContractionShell>& basis_one,
                             const std::vector<ContractionShell>& basis_two)
            : TwoIndexBase(basis_one, basis_two) {}
            ~Overlap() override = default;

            Index num_components() const override {return 1;}

            std::vector<tensor4d<double>>
            construct_array_contraction(const ContractionShell& sh1, const ContractionShell& sh2) const override;
    };

    EigenMatrix<double> overlap_integral(const std::vector<ContractionShell>& basis, const CoordSpec& coord);

    // transform (K_orbs, K_cont) applied on both indices
    EigenMatrix<double> overlap_integral(const std::vector<ContractionShell>& basis, const CoordSpec& coord,
                                         const EigenMatrix<double>& transform);

    // <a|b> with a from basis_one and b from basis_two
    EigenMatrix<double> overlap_asymmetric(const std::vector<ContractionShell>& basis_one,
                                           const std::vector<ContractionShell>& basis_two,
                                           const CoordSpec& coord_one, const CoordSpec& coord_two);

    EigenMatrix<double> overlap_asymmetric(const std::vector<ContractionShell>& basis_one,
                                           const std::vector<ContractionShell>& basis_two,
                                           const CoordSpec& coord_one, const CoordSpec& coord_two,
                                           const EigenMatrix<double>& transform_one,
                                           const EigenMatrix<double>& transform_two);
}

#endif
// end GTOINT_OVERLAP
