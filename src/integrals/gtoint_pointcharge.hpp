#ifndef GTOINT_POINTCHARGE
#define GTOINT_POINTCHARGE

#include "gtoint_twoindex.hpp"

using TWOINDEX::CoordSpec;
using TWOINDEX::TwoIndexBase;

namespace POINTCHARGE
{
    // -q_C <a| 1 / |r - C| |b>, one array per point charge
    class PointChargeIntegral : public TwoIndexBase
    {
        public:
            explicit PointChargeIntegral(const std::vector<ContractionShell>& basis,
                                         const EigenMatrix<double>& points,
                                         const EigenVector<double>& charges);
            ~PointChargeIntegral() override = default;

            Index num_components() const override {return m_points.rows();}

            std::vector<tensor4d<double>>
            construct_array_contraction(const ContractionShell& sh1, const ContractionShell& sh2) const override;

        private:
            EigenMatrix<double> m_points;
            EigenVector<double> m_charges;
    };

    std::vector<EigenMatrix<double>> point_charge_integral(const std::vector<ContractionShell>& basis,
                                                           const EigenMatrix<double>& points,
                                                           const EigenVector<double>& charges,
                                                           const CoordSpec& coord);

    std::vector<EigenMatrix<double>> point_charge_integral(const std::vector<ContractionShell>& basis,
                                                           const EigenMatrix<double>& points,
                                                           const EigenVector<double>& charges,
                                                           const CoordSpec& coord,
                                                           const EigenMatrix<double>& transform);
}

#endif
// End GTOINT_POINTCHARGE
