#include <gtest/gtest.h>

#include "ClassDistances.hpp"

using namespace DF;

namespace {

const std::vector<DistanceEnum> allDistances{DistanceEnum::Wasserstein,
                                             DistanceEnum::Bhattacharyya,
                                             DistanceEnum::Hellinger,
                                             DistanceEnum::JeffriesMatusita};

}

TEST( SharedHistogram, LastBinIsClosedOnTheRight )
{
    Binning binning( 0.0, 1.0, 10 );
    EXPECT_EQ( binning.bin( 0.0 ), 0u );
    EXPECT_EQ( binning.bin( 0.95 ), 9u );
    EXPECT_EQ( binning.bin( 1.0 ), 9u );
    EXPECT_FALSE( binning.degenerate());
}

TEST( SharedHistogram, ProbabilitiesSumToOne )
{
    const Sample a{0.0, 0.1, 0.5, 0.5, 1.0};
    const Sample b{2.0, 3.0};
    const auto binning = Binning::pooled( a, b, 10 );
    const auto p = Histogram::probabilities( a, binning );
    EXPECT_EQ( p.size(), 10u );
    EXPECT_NEAR( p.sum(), 1.0, 1e-12 );
    EXPECT_DOUBLE_EQ( p[0], 0.4 );
    EXPECT_DOUBLE_EQ( p[1], 0.4 );
}

TEST( SharedHistogram, ConstantPooledValuesAreDegenerate )
{
    const Sample a{3.0, 3.0, 3.0};
    EXPECT_TRUE( Binning::pooled( a, a, 10 ).degenerate());
}

TEST( ClassDistances, SymmetricAndZeroOnIdenticalSamples )
{
    const Sample a{1.0, 2.0, 3.0, 4.0, 5.0};
    const Sample b{2.0, 4.0, 4.0, 5.0, 9.0};
    for (auto distance : allDistances)
    {
        const auto measure = distanceFunction( distance );
        SCOPED_TRACE( distanceLabel( distance ));
        EXPECT_NEAR( measure( a, b, DefaultBins ), measure( b, a, DefaultBins ), 1e-12 );
        EXPECT_NEAR( measure( a, a, DefaultBins ), 0.0, 1e-9 );
        EXPECT_GE( measure( a, b, DefaultBins ), 0.0 );
    }
}

TEST( ClassDistances, WassersteinOfShiftedSamplesIsTheShift )
{
    EXPECT_NEAR( Wasserstein::measure( {0.0, 1.0}, {1.0, 2.0} ), 1.0, 1e-12 );
    EXPECT_NEAR( Wasserstein::measure( {0.0, 0.5, 1.0}, {2.5, 3.0, 3.5} ), 2.5, 1e-12 );
}

TEST( ClassDistances, ConstantFeatureGivesFiniteDistance )
{
    const Sample constant{7.0, 7.0, 7.0, 7.0};
    for (auto distance : allDistances)
    {
        const double d = distanceFunction( distance )( constant, constant, DefaultBins );
        EXPECT_TRUE( std::isfinite( d ));
        EXPECT_EQ( d, 0.0 );
    }
}

TEST( ClassDistances, ZeroVarianceSampleMeasuresZeroWhereverItFalls )
{
    const Sample spread{1.0, 2.0, 3.0};
    // inside and outside the range of the other class
    for (const Sample &pointMass : {Sample{3.0, 3.0, 3.0}, Sample{5.0, 5.0, 5.0}, Sample{-2.0, -2.0}})
    {
        EXPECT_EQ( Bhattacharyya::measure( pointMass, spread ), 0.0 );
        EXPECT_EQ( Hellinger::measure( pointMass, spread ), 0.0 );
        EXPECT_EQ( JeffriesMatusita::measure( pointMass, spread ), 0.0 );
        EXPECT_EQ( Hellinger::measure( spread, pointMass ), 0.0 );
    }
    EXPECT_NEAR( Wasserstein::measure( {5.0, 5.0, 5.0}, spread ), 3.0, 1e-12 );
}

TEST( ClassDistances, DisjointSupportsGiveFiniteSentinel )
{
    const Sample a{0.0, 0.1};
    const Sample b{10.0, 10.1};
    EXPECT_NEAR( Bhattacharyya::measure( a, b ), -std::log( eps ), 1e-9 );
    EXPECT_NEAR( JeffriesMatusita::measure( a, b ), std::sqrt( 2.0 ), 1e-9 );
    EXPECT_NEAR( Hellinger::measure( a, b ), 1.0, 1e-12 );
}

TEST( ClassDistances, SamplesTooSmallMeasureZero )
{
    for (auto distance : allDistances)
    {
        const auto measure = distanceFunction( distance );
        EXPECT_EQ( measure( {1.0}, {5.0, 6.0}, DefaultBins ), 0.0 );
        EXPECT_EQ( measure( {}, {5.0, 6.0}, DefaultBins ), 0.0 );
    }
}

TEST( ClassDistances, LabelsMapToClosedEnumeration )
{
    EXPECT_EQ( distanceFromLabel( "jm" ), DistanceEnum::JeffriesMatusita );
    EXPECT_EQ( distanceFromLabel( "wasserstein" ), DistanceEnum::Wasserstein );
    EXPECT_EQ( distanceLabel( DistanceEnum::Hellinger ), "hellinger" );
    EXPECT_THROW( distanceFromLabel( "euclidean" ), InvalidConfiguration );
}
