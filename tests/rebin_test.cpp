#include "test_config.h"

#include "fluxbin/Errors.hpp"
#include "fluxbin/Rebin.hpp"

#include <cmath>
#include <numbers>

namespace fluxbin::Test {

class TrapzRebinTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        x = RebinTestHelper::arange(nx, 1.1);
        y = Vector::Ones(nx);
    }

    static constexpr Eigen::Index nx = 10;
    Vector x;
    Vector y;
};

TEST_F(TrapzRebinTest, ConstantDensityFullRange)
{
    for (Eigen::Index nedge = 3; nedge < 10; ++nedge) {
        const Vector edges = RebinTestHelper::linspace(x.minCoeff(), x.maxCoeff(), nedge);
        const Vector yy = trapz_rebin(x, y, edges);
        ASSERT_EQ(yy.size(), nedge - 1);
        for (Eigen::Index k = 0; k < yy.size(); ++k)
            EXPECT_NEAR(yy[k], 1.0, 1e-12) << "nedge=" << nedge << " bin=" << k;
    }
}

TEST_F(TrapzRebinTest, ConstantDensityInteriorEdges)
{
    Vector single(2);
    single << 0.5, 8.3;
    EXPECT_NEAR(trapz_rebin(x, y, single)[0], 1.0, 1e-12);

    for (Eigen::Index nedge = 3; nedge < 3 * nx; ++nedge) {
        const Vector edges = RebinTestHelper::linspace(0.5, 8.3, nedge);
        const Vector yy = trapz_rebin(x, y, edges);
        EXPECT_TRUE(RebinTestHelper::allclose(yy, Vector::Ones(nedge - 1), 1e-12, 1e-12))
            << "nedge=" << nedge;
    }
}

TEST_F(TrapzRebinTest, ConstantDensityNonUniformEdges)
{
    Vector edges(6);
    edges << 0.0, 0.05, 1.1, 1.2, 7.0, 9.9;
    const Vector yy = trapz_rebin(x, y, edges);
    EXPECT_TRUE(RebinTestHelper::allclose(yy, Vector::Ones(5), 1e-12, 1e-12));
}

TEST_F(TrapzRebinTest, CentersMatchDerivedEdges)
{
    const Vector xi = RebinTestHelper::arange(nx);
    const Vector centers = RebinTestHelper::linspace(0.5, nx - 1.5, 50);

    const Vector by_centers = trapz_rebin(xi, Vector::Ones(nx), BinTarget::centers(centers));
    EXPECT_TRUE(RebinTestHelper::allclose(by_centers, Vector::Ones(50), 1e-12, 1e-12));

    const Vector yq = xi.array().square();
    EXPECT_EQ(trapz_rebin(xi, yq, BinTarget::centers(centers)),
              trapz_rebin(xi, yq, centers_to_edges(centers)));
}

TEST_F(TrapzRebinTest, EdgesOutsideDomainRaiseRangeError)
{
    const Vector xi = RebinTestHelper::arange(nx);
    const Vector yi = Vector::Ones(nx);

    const Vector below = RebinTestHelper::arange(nx).array() - 1.0;    // -1 … 8
    const Vector above = RebinTestHelper::arange(nx).array() + 1.0;    //  1 … 10
    EXPECT_THROW(trapz_rebin(xi, yi, below), RangeError);
    EXPECT_THROW(trapz_rebin(xi, yi, above), RangeError);

    // centres whose derived edges poke past the last sample
    EXPECT_THROW(trapz_rebin(xi, yi, BinTarget::centers(RebinTestHelper::linspace(0.0, 9.0, 10))),
                 RangeError);
}

TEST_F(TrapzRebinTest, MalformedInputs)
{
    Vector edges(2);
    edges << 1.0, 2.0;

    EXPECT_THROW(trapz_rebin(x, Vector::Ones(nx - 1), edges), MalformedInputError);

    Vector x_bad = x;
    std::swap(x_bad[3], x_bad[4]);
    EXPECT_THROW(trapz_rebin(x_bad, y, edges), MalformedInputError);

    Vector one(1);
    one << 0.0;
    EXPECT_THROW(trapz_rebin(one, one, edges), MalformedInputError);

    Vector flat(3);
    flat << 1.0, 2.0, 2.0;
    EXPECT_THROW(trapz_rebin(x, y, flat), MalformedInputError);
}

TEST(TrapzRebin, SineOverFullPeriodIntegratesToZero)
{
    for (Eigen::Index nx = 5; nx < 12; ++nx) {
        const Vector x = RebinTestHelper::linspace(0.0, 2 * std::numbers::pi, nx);
        const Vector y = x.array().sin();
        Vector edges(2);
        edges << 0.0, 2 * std::numbers::pi;
        EXPECT_NEAR(trapz_rebin(x, y, edges)[0], 0.0, 1e-12) << "nx=" << nx;
    }
}

TEST(TrapzRebin, SineQuarterPeriods)
{
    const double pi = std::numbers::pi;
    const Vector x = RebinTestHelper::linspace(0.0, 2 * pi, 100);
    const Vector y = x.array().sin();
    Vector edges(5);
    edges << 0.0, 0.5 * pi, pi, 1.5 * pi, 2 * pi;

    const Vector yy = trapz_rebin(x, y, edges);
    ASSERT_EQ(yy.size(), 4);
    EXPECT_NEAR(yy[0], 2 / pi, 5e-4);
    EXPECT_NEAR(yy[1], 2 / pi, 5e-4);
    EXPECT_NEAR(yy[2], -2 / pi, 5e-4);
    EXPECT_NEAR(yy[3], -2 / pi, 5e-4);
}

TEST(TrapzRebin, LinearDensityIsIntegratedExactly)
{
    // the interpolant of a linear y is y itself: bin mean = value at bin centre
    Vector x(6);
    x << 0.0, 0.3, 1.7, 2.0, 4.5, 5.0;
    const Vector y = 2.0 * x.array() + 1.0;
    Vector edges(4);
    edges << 0.1, 0.2, 3.0, 4.9;

    const Vector yy = trapz_rebin(x, y, edges);
    for (Eigen::Index k = 0; k < 3; ++k)
        EXPECT_NEAR(yy[k], 2.0 * 0.5 * (edges[k] + edges[k + 1]) + 1.0, 1e-12);
}

TEST(TrapzRebin, EdgesOnSamplesAreNotDoubleCounted)
{
    Vector x(4);
    x << 0.0, 1.0, 2.0, 3.0;
    Vector y(4);
    y << 0.0, 2.0, 0.0, 4.0;

    // bins coincide with the sample intervals: mean of each trapezoid
    const Vector yy = trapz_rebin(x, y, x);
    EXPECT_NEAR(yy[0], 1.0, 1e-15);
    EXPECT_NEAR(yy[1], 1.0, 1e-15);
    EXPECT_NEAR(yy[2], 2.0, 1e-15);

    Vector edges(3);
    edges << 0.0, 2.0, 3.0;
    const Vector wide = trapz_rebin(x, y, edges);
    EXPECT_NEAR(wide[0], 1.0, 1e-15);      // (1 + 1) / 2
    EXPECT_NEAR(wide[1], 2.0, 1e-15);
}

TEST(TrapzRebin, BinInsideOneInterval)
{
    Vector x(2);
    x << 0.0, 10.0;
    Vector y(2);
    y << 0.0, 10.0;
    Vector edges(3);
    edges << 2.0, 3.0, 7.0;

    const Vector yy = trapz_rebin(x, y, edges);
    EXPECT_NEAR(yy[0], 2.5, 1e-14);
    EXPECT_NEAR(yy[1], 5.0, 1e-14);
}

TEST(TrapzRebin, FluxIsConservedAcrossBins)
{
    const Vector x = RebinTestHelper::linspace(1.0, 3.0, 37).array().exp();
    const Vector y = (x.array() * 0.7).cos() + 2.0;
    const Vector edges = RebinTestHelper::linspace(x[0], x[x.size() - 1], 11);

    const Vector fine   = trapz_rebin(x, y, edges);
    Vector whole(2);
    whole << edges[0], edges[edges.size() - 1];
    const Vector coarse = trapz_rebin(x, y, whole);

    const Vector widths = edges.tail(10) - edges.head(10);
    const double total  = fine.dot(widths);
    EXPECT_NEAR(total, coarse[0] * (whole[1] - whole[0]), 1e-9 * std::abs(total));
}

} // namespace fluxbin::Test
