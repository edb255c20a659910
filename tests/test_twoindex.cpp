#include "integrals/gtoint_twoindex.hpp"
#include "integrals/gtoint_overlap.hpp"
#include "integrals/gtoint_multipole.hpp"
#include <gtest/gtest.h>

using BASIS::ContractionShell;
using TWOINDEX::CoordSpec;
using TWOINDEX::CoordType;

namespace
{
    EigenVector<double> vec(std::initializer_list<double> vals)
    {
        EigenVector<double> v(static_cast<Index>(vals.size()));
        Index i = 0;
        for (double x : vals) v(i++) = x;
        return v;
    }

    std::vector<ContractionShell> test_basis()
    {
        std::vector<ContractionShell> basis;
        basis.emplace_back(ContractionShell(2, Vec3D(0.0, 0.0, 0.3), vec({0.5, 0.6}), vec({1.6, 0.4})));
        basis.emplace_back(ContractionShell(0, Vec3D(0.9, 0.0, -0.2), vec({1.0}), vec({0.9})));
        basis.emplace_back(ContractionShell(3, Vec3D(-0.4, 0.7, 0.0), vec({1.0}), vec({1.1})));
        return basis;
    }

    EigenMatrix<double> random_transform(Index rows, Index cols, unsigned seed)
    {
        std::srand(seed);
        return EigenMatrix<double>::Random(rows, cols);
    }
}

TEST(CoordSpec, Parse)
{
    EXPECT_EQ(CoordSpec::parse("cartesian"), CoordType::cartesian);
    EXPECT_EQ(CoordSpec::parse("spherical"), CoordType::spherical);
    EXPECT_THROW(CoordSpec::parse("Cartesian"), std::invalid_argument);
    EXPECT_THROW(CoordSpec::parse("pure"), std::invalid_argument);
    EXPECT_THROW(CoordSpec("polar"), std::invalid_argument);
    EXPECT_THROW(CoordSpec(std::vector<std::string>{"spherical", "cart"}), std::invalid_argument);
}

TEST(CoordSpec, NumFunctionsAndOffsets)
{
    const auto basis = test_basis();

    EXPECT_EQ(CoordSpec("cartesian").num_functions(basis), 17);
    EXPECT_EQ(CoordSpec("spherical").num_functions(basis), 13);

    const CoordSpec mixed(std::vector<std::string>{"spherical", "cartesian", "cartesian"});
    EXPECT_TRUE(mixed.is_per_shell());
    EXPECT_EQ(mixed.at(0), CoordType::spherical);
    EXPECT_EQ(mixed.at(2), CoordType::cartesian);

    const std::vector<Index> offs = mixed.offsets(basis);
    ASSERT_EQ(offs.size(), 4u);
    EXPECT_EQ(offs[0], 0);
    EXPECT_EQ(offs[1], 5);
    EXPECT_EQ(offs[2], 6);
    EXPECT_EQ(offs[3], 16);
}

TEST(CoordSpec, PerShellLengthMismatch)
{
    const auto basis = test_basis();
    const CoordSpec too_short(std::vector<std::string>{"spherical", "cartesian"});

    EXPECT_THROW(too_short.num_functions(basis), std::invalid_argument);
    EXPECT_THROW(OVERLAP::overlap_integral(basis, too_short), std::invalid_argument);
}

TEST(TwoIndex, MixedCoordinatesPickBlocks)
{
    const auto basis = test_basis();
    const OVERLAP::Overlap ovlp(basis);

    const EigenMatrix<double> Sc = ovlp.construct_array_cartesian()[0];
    const EigenMatrix<double> Ss = ovlp.construct_array_spherical()[0];
    const EigenMatrix<double> Sm = ovlp.construct_array_mix(
        CoordSpec(std::vector<std::string>{"spherical", "cartesian", "cartesian"}))[0];

    ASSERT_EQ(Sm.rows(), 16);

    // d block spherical, s and f blocks Cartesian
    EXPECT_LT((Sm.block(0, 0, 5, 5) - Ss.block(0, 0, 5, 5)).cwiseAbs().maxCoeff(), 1.0E-14);
    EXPECT_LT((Sm.block(5, 5, 11, 11) - Sc.block(6, 6, 11, 11)).cwiseAbs().maxCoeff(), 1.0E-14);
    EXPECT_LT((Sm.block(0, 5, 5, 1) - Ss.block(0, 5, 5, 1)).cwiseAbs().maxCoeff(), 1.0E-14);
}

TEST(TwoIndex, DifferentCoordinatesPerIndex)
{
    const auto basis = test_basis();
    const OVERLAP::Overlap ovlp(basis);

    const EigenMatrix<double> Sc = ovlp.construct_array_cartesian()[0];
    const EigenMatrix<double> Ss = ovlp.construct_array_spherical()[0];
    const EigenMatrix<double> Ssc = ovlp.construct_array_mix(CoordSpec("spherical"), CoordSpec("cartesian"))[0];

    ASSERT_EQ(Ssc.rows(), 13);
    ASSERT_EQ(Ssc.cols(), 17);

    // the s row is the same in both systems
    EXPECT_LT((Ssc.row(5) - Sc.row(6)).cwiseAbs().maxCoeff(), 1.0E-14);
    EXPECT_LT((Ssc.col(6) - Ss.col(5)).cwiseAbs().maxCoeff(), 1.0E-14);
}

TEST(TwoIndex, LincombSameTransform)
{
    const auto basis = test_basis();
    const EigenMatrix<int> orders = MULTIPOLE::orders_up_to(1);
    const MULTIPOLE::MomentIntegral moments(basis, Vec3D(0.1, 0.2, -0.3), orders);

    const auto plain = moments.construct_array_spherical();
    const EigenMatrix<double> T = random_transform(4, 13, 7);
    const auto transformed = moments.construct_array_lincomb(T, "spherical");

    ASSERT_EQ(transformed.size(), 4u);
    for (size_t c = 0; c < transformed.size(); ++c)
    {
        const EigenMatrix<double> expected = T * plain[c] * T.transpose();
        ASSERT_EQ(transformed[c].rows(), 4);
        ASSERT_EQ(transformed[c].cols(), 4);
        EXPECT_LT((transformed[c] - expected).cwiseAbs().maxCoeff(), 1.0E-12) << "component " << c;
    }
}

TEST(TwoIndex, LincombTwoTransforms)
{
    const auto basis = test_basis();
    const OVERLAP::Overlap ovlp(basis);

    const EigenMatrix<double> S = ovlp.construct_array_mix(CoordSpec("cartesian"), CoordSpec("spherical"))[0];
    const EigenMatrix<double> T1 = random_transform(3, 17, 11);
    const EigenMatrix<double> T2 = random_transform(5, 13, 13);

    const EigenMatrix<double> St = ovlp.construct_array_lincomb(T1, T2, "cartesian", "spherical")[0];
    const EigenMatrix<double> expected = T1 * S * T2.transpose();

    ASSERT_EQ(St.rows(), 3);
    ASSERT_EQ(St.cols(), 5);
    EXPECT_LT((St - expected).cwiseAbs().maxCoeff(), 1.0E-12);
}

TEST(TwoIndex, LincombShapeMismatch)
{
    const auto basis = test_basis();
    const OVERLAP::Overlap ovlp(basis);

    const EigenMatrix<double> T = EigenMatrix<double>::Identity(13, 13);

    EXPECT_NO_THROW(ovlp.construct_array_lincomb(T, "spherical"));
    EXPECT_THROW(ovlp.construct_array_lincomb(T, "cartesian"), std::invalid_argument);
    EXPECT_THROW(ovlp.construct_array_lincomb(T, EigenMatrix<double>::Identity(12, 12), "spherical", "spherical"),
                 std::invalid_argument);
}

TEST(TwoIndex, IdentityTransformIsNoOp)
{
    const auto basis = test_basis();
    const OVERLAP::Overlap ovlp(basis);

    const EigenMatrix<double> S = ovlp.construct_array_cartesian()[0];
    const EigenMatrix<double> I = EigenMatrix<double>::Identity(17, 17);

    EXPECT_LT((ovlp.construct_array_lincomb(I, "cartesian")[0] - S).cwiseAbs().maxCoeff(), 1.0E-15);
}

TEST(TwoIndex, SymmetryFlag)
{
    const auto basis = test_basis();
    const auto other = test_basis();

    EXPECT_TRUE(OVERLAP::Overlap(basis).is_symmetric());
    EXPECT_FALSE(OVERLAP::Overlap(basis, other).is_symmetric());
}
