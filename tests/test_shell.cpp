#include "integrals/gtoint_shell.hpp"
#include "integrals/gtoint_overlap.hpp"
#include <gtest/gtest.h>

using BASIS::ContractionShell;

namespace
{
    EigenVector<double> vec(std::initializer_list<double> vals)
    {
        EigenVector<double> v(static_cast<Index>(vals.size()));
        Index i = 0;
        for (double x : vals) v(i++) = x;
        return v;
    }

    EigenMatrix<double> generalized_coeffs()
    {
        EigenMatrix<double> c(3, 2);
        c << 0.15, 0.02,
             0.53, -0.40,
             0.44, 1.10;
        return c;
    }
}

TEST(ContractionShell, CartesianComponentOrder)
{
    const ContractionShell sh(2, Vec3D(0.1, 0.2, 0.3), vec({1.0}), vec({0.5}));
    const EigenMatrix<int> comps = sh.cart_components();

    EigenMatrix<int> expected(6, 3);
    expected << 2, 0, 0,
                1, 1, 0,
                1, 0, 1,
                0, 2, 0,
                0, 1, 1,
                0, 0, 2;

    EXPECT_TRUE(comps == expected);
    EXPECT_EQ(sh.get_cirange(), 6);
    EXPECT_EQ(sh.get_sirange(), 5);
    EXPECT_EQ(sh.sph_components(), (std::vector<int>{-2, -1, 0, 1, 2}));
}

TEST(ContractionShell, NumberOfComponents)
{
    for (int L = 0; L < 7; ++L)
    {
        const ContractionShell sh(L, Vec3D::Zero(), vec({1.0}), vec({1.0}));
        EXPECT_EQ(sh.get_cirange(), (L + 1) * (L + 2) / 2);
        EXPECT_EQ(sh.get_sirange(), 2 * L + 1);
        EXPECT_EQ(sh.get_spherical_form().rows(), 2 * L + 1);
        EXPECT_EQ(sh.get_spherical_form().cols(), (L + 1) * (L + 2) / 2);
    }
}

TEST(ContractionShell, PrimitiveNorm)
{
    const double alpha = 1.3;
    const ContractionShell sh(2, Vec3D::Zero(), vec({1.0}), vec({alpha}));
    const double base = std::pow(2.0 * alpha / gtointmath::pi, 0.75) * 4.0 * alpha;

    EXPECT_NEAR(sh.prim_norm()(0, 0), base / std::sqrt(3.0), 1.0E-12); // xx
    EXPECT_NEAR(sh.prim_norm()(1, 0), base, 1.0E-12);                  // xy
    EXPECT_NEAR(sh.prim_norm()(5, 0), base / std::sqrt(3.0), 1.0E-12); // zz
}

TEST(ContractionShell, ContractionNormOfSinglePrimitive)
{
    const ContractionShell sh(1, Vec3D::Zero(), vec({2.0}), vec({0.7}));

    for (Index c = 0; c < 3; ++c)
        EXPECT_NEAR(sh.cont_norm()(0, c), 0.5, 1.0E-12);
}

TEST(ContractionShell, ContractionNormIsComponentIndependent)
{
    const ContractionShell sh(3, Vec3D(0.0, -1.0, 2.0), generalized_coeffs(), vec({5.0, 1.2, 0.3}));

    ASSERT_EQ(sh.cont_norm().rows(), 2);
    ASSERT_EQ(sh.cont_norm().cols(), 10);

    for (Index m = 0; m < 2; ++m)
        for (Index c = 1; c < 10; ++c)
            EXPECT_NEAR(sh.cont_norm()(m, c), sh.cont_norm()(m, 0), 1.0E-10 * sh.cont_norm()(m, 0));
}

TEST(ContractionShell, NormalizedSelfOverlap)
{
    for (int L = 0; L < 6; ++L)
    {
        std::vector<ContractionShell> basis;
        basis.emplace_back(ContractionShell(L, Vec3D(0.2, -0.1, 0.4), generalized_coeffs(), vec({5.0, 1.2, 0.3})));

        const EigenMatrix<double> S = OVERLAP::overlap_integral(basis, "cartesian");
        ASSERT_EQ(S.rows(), 2 * basis[0].get_cirange());

        for (Index i = 0; i < S.rows(); ++i)
            EXPECT_NEAR(S(i, i), 1.0, 1.0E-10) << "L = " << L << " function " << i;
    }
}

TEST(ContractionShell, GeneralizedEqualsSegmented)
{
    const EigenMatrix<double> c = generalized_coeffs();
    const EigenVector<double> alpha = vec({5.0, 1.2, 0.3});
    const ContractionShell gen(2, Vec3D::Zero(), c, alpha);
    const EigenVector<double> c1 = c.col(1);
    const ContractionShell seg(2, Vec3D::Zero(), c1, alpha);

    for (Index ci = 0; ci < 6; ++ci)
        EXPECT_NEAR(gen.cont_norm()(1, ci), seg.cont_norm()(0, ci), 1.0E-12);
}

TEST(ContractionShell, InvalidInput)
{
    EXPECT_THROW(ContractionShell(-1, Vec3D::Zero(), vec({1.0}), vec({1.0})), std::invalid_argument);
    EXPECT_THROW(ContractionShell(0, Vec3D::Zero(), vec({1.0}), vec({0.0})), std::invalid_argument);
    EXPECT_THROW(ContractionShell(0, Vec3D::Zero(), vec({1.0}), vec({-2.0})), std::invalid_argument);
    EXPECT_THROW(ContractionShell(0, Vec3D::Zero(), vec({1.0, 2.0}), vec({1.0})), std::invalid_argument);
    EXPECT_THROW(ContractionShell(0, Vec3D::Zero(), EigenVector<double>(), EigenVector<double>()),
                 std::invalid_argument);
    EXPECT_THROW(ContractionShell(0, Vec3D::Zero(), EigenMatrix<double>(1, 0), vec({1.0})), std::invalid_argument);
    EXPECT_THROW(ContractionShell(0, Vec3D::Zero(), vec({0.0}), vec({1.0})), std::invalid_argument);
}
