#ifndef GTOINT_MULTIPOLE
#define GTOINT_MULTIPOLE

#include "gtoint_twoindex.hpp"

using TWOINDEX::CoordSpec;
using TWOINDEX::TwoIndexBase;

namespace MULTIPOLE
{
    // <a| (x - Cx)^ex (y - Cy)^ey (z - Cz)^ez |b>, one array per row of orders
    class MomentIntegral : public TwoIndexBase
    {
        public:
            explicit MomentIntegral(const std::vector<ContractionShell>& basis,
                                    const Eigen::Ref<const Vec3D>& center, const EigenMatrix<int>& orders);
            ~MomentIntegral() override = default;

            Index num_components() const override {return m_orders.rows();}

            std::vector<tensor4d<double>>
            construct_array_contraction(const ContractionShell& sh1, const ContractionShell& sh2) const override;

        private:
            Vec3D m_center;
            EigenMatrix<int> m_orders;
    };

    std::vector<EigenMatrix<double>> moment_integral(const std::vector<ContractionShell>& basis,
                                                     const Eigen::Ref<const Vec3D>& center,
                                                     const EigenMatrix<int>& orders,
                                                     const CoordSpec& coord);

    std::vector<EigenMatrix<double>> moment_integral(const std::vector<ContractionShell>& basis,
                                                     const Eigen::Ref<const Vec3D>& center,
                                                     const EigenMatrix<int>& orders,
                                                     const CoordSpec& coord,
                                                     const EigenMatrix<double>& transform);

    // All orders with ex + ey + ez <= max_order, by total order then decreasing x, then decreasing y
    EigenMatrix<int> orders_up_to(int max_order);
}

#endif
// End GTOINT_MULTIPOLE
