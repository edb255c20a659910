#ifndef GTOINT_EVAL
#define GTOINT_EVAL

#include "../integrals/gtoint_twoindex.hpp"
#include <vector>

using TWOINDEX::CoordSpec;

namespace EVAL
{
    using Vec3I = Eigen::Vector3i;

    // (x - X)^ax (y - Y)^ay (z - Z)^az exp(-alpha |r - R|^2), no normalization
    double evaluate_primitive(const Vec3D& point, const Vec3D& center, const Vec3I& angmom, const double alpha);

    // d^ox d^oy d^oz / dx^ox dy^oy dz^oz of the primitive above
    double evaluate_deriv_primitive(const Vec3D& point, const Vec3I& orders, const Vec3D& center,
                                    const Vec3I& angmom, const double alpha);

    // sum_k coeffs_k * primitive_k, L angular momentum rows by N points
    EigenMatrix<double> evaluate_contraction(const EigenMatrix<double>& points, const Vec3D& center,
                                             const EigenMatrix<int>& angmoms, const EigenVector<double>& alphas,
                                             const EigenVector<double>& coeffs);

    EigenVector<double> evaluate_contraction(const Vec3D& point, const Vec3D& center,
                                             const EigenMatrix<int>& angmoms, const EigenVector<double>& alphas,
                                             const EigenVector<double>& coeffs);

    EigenMatrix<double> evaluate_deriv_contraction(const EigenMatrix<double>& points, const Vec3I& orders,
                                                   const Vec3D& center, const EigenMatrix<int>& angmoms,
                                                   const EigenVector<double>& alphas,
                                                   const EigenVector<double>& coeffs);

    EigenVector<double> evaluate_deriv_contraction(const Vec3D& point, const Vec3I& orders,
                                                   const Vec3D& center, const EigenMatrix<int>& angmoms,
                                                   const EigenVector<double>& alphas,
                                                   const EigenVector<double>& coeffs);

    // Normalized basis functions, K x N
    EigenMatrix<double> evaluate_basis(const std::vector<ContractionShell>& basis, const EigenMatrix<double>& points,
                                       const CoordSpec& coord);

    EigenMatrix<double> evaluate_basis(const std::vector<ContractionShell>& basis, const EigenMatrix<double>& points,
                                       const CoordSpec& coord, const EigenMatrix<double>& transform);

    EigenMatrix<double> evaluate_deriv_basis(const std::vector<ContractionShell>& basis,
                                             const EigenMatrix<double>& points, const Vec3I& orders,
                                             const CoordSpec& coord);

    EigenMatrix<double> evaluate_deriv_basis(const std::vector<ContractionShell>& basis,
                                             const EigenMatrix<double>& points, const Vec3I& orders,
                                             const CoordSpec& coord, const EigenMatrix<double>& transform);
}

#endif
// End GTOINT_EVAL
