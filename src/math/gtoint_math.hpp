#ifndef GTOINT_MATH
#define GTOINT_MATH
#include <cmath>
#include <Eigen/Core>
#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <numeric>

// Small helpers shared by the integral and evaluation code.
// Do not move these into a cpp file, they sit in the inner loops.

template <typename T>
using EigenVector = Eigen::Matrix<T, Eigen::Dynamic, 1>;

template <typename T>
using EigenMatrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using Vec3D = Eigen::Vector3d;
using Eigen::Index;

namespace gtointmath {

template <typename T>
T Pi() {
    return std::acos(static_cast<T>(-1));
}

inline const double pi = Pi<double>();

// (n)!! with (-1)!! = (0)!! = 1, in double to stay exact past 20!!
constexpr auto dfac(int n) noexcept -> double
{
    double k = 1.0;
    for (int j = n; j > 1; j -= 2) k *= j;
    return k;
}

constexpr auto ncart = [](int L) noexcept -> Index
{
    return (L + 1) * (L + 2) / 2;
};

constexpr auto nsph = [](int L) noexcept -> Index
{
    return 2 * L + 1;
};

// Gaussian product center
inline auto gpc = [](double alpha1, double alpha2, const Eigen::Ref<const Vec3D>& a,
                     const Eigen::Ref<const Vec3D>& b) noexcept -> Vec3D {
    const double denom = alpha1 + alpha2;
    const Vec3D r = (alpha1 * a + alpha2 * b) / denom;
    return r;
};

// Norm
inline auto rab2 = [](const Eigen::Ref<const Vec3D>& a, const Eigen::Ref<const Vec3D>& b) noexcept -> double
{
    return (a - b).squaredNorm();
};

// num / den, or 0 when |den| <= tol. Used where a coincident point must not produce Inf.
constexpr auto safe_divide = [](double num, double den, double tol = 0.0) noexcept -> double
{
    return (std::fabs(den) <= tol) ? 0.0 : num / den;
};

}  // namespace gtointmath

#endif
// End GTOINT_MATH
