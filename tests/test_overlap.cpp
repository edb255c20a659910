#include "integrals/gtoint_overlap.hpp"
#include <gtest/gtest.h>

using BASIS::ContractionShell;
using OVERLAP::overlap_asymmetric;
using OVERLAP::overlap_integral;

namespace
{
    EigenVector<double> vec(std::initializer_list<double> vals)
    {
        EigenVector<double> v(static_cast<Index>(vals.size()));
        Index i = 0;
        for (double x : vals) v(i++) = x;
        return v;
    }

    std::vector<ContractionShell> mixed_basis()
    {
        EigenMatrix<double> gen(3, 2);
        gen << 0.15, 0.0,
               0.55, -0.3,
               0.45, 1.0;

        std::vector<ContractionShell> basis;
        basis.emplace_back(ContractionShell(0, Vec3D(0.0, 0.0, 0.0), vec({0.15, 0.55, 0.45}), vec({5.0, 1.2, 0.3})));
        basis.emplace_back(ContractionShell(1, Vec3D(0.0, 0.0, 0.0), gen, vec({5.0, 1.2, 0.3})));
        basis.emplace_back(ContractionShell(2, Vec3D(0.4, -1.1, 0.7), vec({0.6, 0.5}), vec({1.4, 0.35})));
        basis.emplace_back(ContractionShell(3, Vec3D(-0.8, 0.2, 1.5), vec({1.0}), vec({0.8})));
        return basis;
    }
}

TEST(Overlap, Dimensions)
{
    const auto basis = mixed_basis();

    // 1 + 2 * 3 + 6 + 10 Cartesian, 1 + 2 * 3 + 5 + 7 spherical
    const EigenMatrix<double> Sc = overlap_integral(basis, "cartesian");
    const EigenMatrix<double> Ss = overlap_integral(basis, "spherical");

    EXPECT_EQ(Sc.rows(), 23);
    EXPECT_EQ(Sc.cols(), 23);
    EXPECT_EQ(Ss.rows(), 19);
    EXPECT_EQ(Ss.cols(), 19);
}

TEST(Overlap, SymmetricWithUnitDiagonal)
{
    const auto basis = mixed_basis();

    for (const char* coord : {"cartesian", "spherical"})
    {
        const EigenMatrix<double> S = overlap_integral(basis, coord);
        const EigenMatrix<double> St = S.transpose();

        EXPECT_LT((S - St).cwiseAbs().maxCoeff(), 1.0E-14) << coord;

        for (Index i = 0; i < S.rows(); ++i)
            EXPECT_NEAR(S(i, i), 1.0, 1.0E-10) << coord << " function " << i;
    }
}

TEST(Overlap, TwoCenterS)
{
    const double a = 0.7;
    const double b = 1.9;
    const Vec3D B(0.0, 0.6, -1.2);

    std::vector<ContractionShell> basis;
    basis.emplace_back(ContractionShell(0, Vec3D::Zero(), vec({1.0}), vec({a})));
    basis.emplace_back(ContractionShell(0, B, vec({1.0}), vec({b})));

    const EigenMatrix<double> S = overlap_integral(basis, "spherical");
    const double expected = std::pow(2.0 * std::sqrt(a * b) / (a + b), 1.5)
                          * std::exp(-a * b / (a + b) * B.squaredNorm());

    EXPECT_NEAR(S(0, 1), expected, 1.0E-12);
    EXPECT_NEAR(S(1, 0), expected, 1.0E-12);
}

TEST(Overlap, PShellsOnSameCenterAreOrthogonal)
{
    std::vector<ContractionShell> basis;
    basis.emplace_back(ContractionShell(1, Vec3D(0.1, 0.2, 0.3), vec({0.3, 0.7}), vec({2.0, 0.4})));

    const EigenMatrix<double> S = overlap_integral(basis, "cartesian");

    EXPECT_TRUE(S.isApprox(EigenMatrix<double>::Identity(3, 3), 1.0E-12));
}

TEST(Overlap, AsymmetricIsTransposeOfSwapped)
{
    const auto basis = mixed_basis();
    std::vector<ContractionShell> other;
    other.emplace_back(ContractionShell(1, Vec3D(1.0, 1.0, 0.0), vec({1.0}), vec({0.5})));
    other.emplace_back(ContractionShell(2, Vec3D(0.0, -0.5, 0.5), vec({0.4, 0.7}), vec({2.5, 0.6})));

    const EigenMatrix<double> S12 = overlap_asymmetric(basis, other, "spherical", "cartesian");
    const EigenMatrix<double> S21 = overlap_asymmetric(other, basis, "cartesian", "spherical");

    ASSERT_EQ(S12.rows(), 19);
    ASSERT_EQ(S12.cols(), 9);
    EXPECT_LT((S12 - S21.transpose()).cwiseAbs().maxCoeff(), 1.0E-14);
}

TEST(Overlap, AsymmetricOfSameBasisMatchesSymmetric)
{
    const auto basis = mixed_basis();

    const EigenMatrix<double> S = overlap_integral(basis, "spherical");
    const EigenMatrix<double> S_asym = overlap_asymmetric(basis, basis, "spherical", "spherical");

    EXPECT_LT((S - S_asym).cwiseAbs().maxCoeff(), 1.0E-14);
}

TEST(Overlap, Transformed)
{
    const auto basis = mixed_basis();
    const EigenMatrix<double> S = overlap_integral(basis, "spherical");

    EigenMatrix<double> T = EigenMatrix<double>::Zero(2, 19);
    T(0, 0) = 1.0;
    T(0, 1) = 0.5;
    T(1, 10) = -0.25;
    T(1, 18) = 2.0;

    const EigenMatrix<double> St = overlap_integral(basis, "spherical", T);
    const EigenMatrix<double> expected = T * S * T.transpose();

    ASSERT_EQ(St.rows(), 2);
    ASSERT_EQ(St.cols(), 2);
    EXPECT_LT((St - expected).cwiseAbs().maxCoeff(), 1.0E-12);

    EXPECT_THROW(overlap_integral(basis, "cartesian", T), std::invalid_argument);
}
