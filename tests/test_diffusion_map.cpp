#include <gtest/gtest.h>

#include "DiffusionMap.hpp"
#include "DistanceTable.hpp"
#include "fixtures.hpp"

using namespace DF;

namespace {

dlib::matrix<double> shiftedTable()
{
    return buildDistanceTable( fixtures::shiftedDataset( {0.5, 1.0, 2.0, 4.0} ),
                               DistanceEnum::Wasserstein ).flattened;
}

}

TEST( DiffusionMap, MaxMinEpsilonScalesLargestNearestNeighbour )
{
    dlib::matrix<double> d( 3, 3 );
    d = 0, 1, 3,
        1, 0, 2,
        3, 2, 0;
    EXPECT_DOUBLE_EQ( DiffusionMap::epsilon( d, EpsilonEnum::MaxMin, 10 ), 20.0 );
    EXPECT_DOUBLE_EQ( DiffusionMap::epsilon( d, EpsilonEnum::Fixed, 0.5 ), 0.5 );
}

TEST( DiffusionMap, MaxMinEpsilonFallsBackOnNullDistances )
{
    dlib::matrix<double> d = dlib::zeros_matrix<double>( 4, 4 );
    EXPECT_DOUBLE_EQ( DiffusionMap::epsilon( d, EpsilonEnum::MaxMin, 100 ), FallbackEpsilon );
}

TEST( DiffusionMap, MarkovMatrixRowsSumToOne )
{
    const auto distances = DiffusionMap::pairwiseDistances( shiftedTable());
    const auto k = DiffusionMap::kernel( distances, 2.0 );
    for (long i = 0; i < k.nr(); ++i)
        EXPECT_DOUBLE_EQ( k( i, i ), 1.0 );

    const auto p = DiffusionMap::markovMatrix( DiffusionMap::alphaNormalize( k, 1.0 ));
    for (long i = 0; i < p.nr(); ++i)
        EXPECT_NEAR( dlib::sum( dlib::rowm( p, i )), 1.0, 1e-12 );
}

TEST( DiffusionMap, NullAlphaKeepsKernel )
{
    const auto k = DiffusionMap::kernel( DiffusionMap::pairwiseDistances( shiftedTable()), 1.0 );
    const auto kAlpha = DiffusionMap::alphaNormalize( k, 0.0 );
    EXPECT_LT( dlib::max( dlib::abs( k - kAlpha )), 1e-15 );
}

TEST( DiffusionMap, EmbedsFeaturesAsColumns )
{
    const auto embedding = embed( shiftedTable(), 1.0, EpsilonEnum::MaxMin, 10, 2 );
    EXPECT_EQ( embedding.coordinates.nr(), 2 );
    EXPECT_EQ( embedding.coordinates.nc(), 4 );
    EXPECT_EQ( embedding.dimensions(), 2u );
    EXPECT_EQ( embedding.nFeatures(), 4u );
    EXPECT_GT( embedding.epsilon, 0.0 );

    ASSERT_EQ( embedding.eigenvalues.size(), 2u );
    EXPECT_GE( embedding.eigenvalues[0], embedding.eigenvalues[1] );
    for (auto lambda : embedding.eigenvalues)
    {
        EXPECT_GE( lambda, 0.0 );
        EXPECT_LE( lambda, 1.0 + 1e-9 );
    }

    ASSERT_EQ( embedding.axisRankings.size(), 2u );
    for (auto ranking : embedding.axisRankings)
    {
        std::sort( ranking.begin(), ranking.end());
        EXPECT_EQ( ranking, (std::vector<FeatureIndex>{0, 1, 2, 3}));
    }
}

TEST( DiffusionMap, EmbeddingIsDeterministic )
{
    const auto table = shiftedTable();
    const DiffusionMap dm( {1.0, EpsilonEnum::MaxMin, 10, 2} );
    const auto first = dm.embed( table );
    const auto second = dm.embed( table );
    ASSERT_EQ( first.coordinates.nc(), second.coordinates.nc());
    for (long r = 0; r < first.coordinates.nr(); ++r)
        for (long c = 0; c < first.coordinates.nc(); ++c)
            EXPECT_EQ( first.coordinates( r, c ), second.coordinates( r, c ));
    EXPECT_EQ( first.axisRankings, second.axisRankings );
}

TEST( DiffusionMap, IdenticalRowsDoNotRaise )
{
    const dlib::matrix<double> table = dlib::zeros_matrix<double>( 4, 4 );
    const auto embedding = embed( table, 1.0, EpsilonEnum::MaxMin, 10, 2 );
    EXPECT_DOUBLE_EQ( embedding.epsilon, FallbackEpsilon );
    for (long r = 0; r < embedding.coordinates.nr(); ++r)
        for (long c = 0; c < embedding.coordinates.nc(); ++c)
            EXPECT_TRUE( std::isfinite( embedding.coordinates( r, c )));
}

TEST( DiffusionMap, RejectsInvalidParameters )
{
    const auto table = shiftedTable();
    EXPECT_THROW( embed( table, 1.5, EpsilonEnum::MaxMin, 10, 2 ), InvalidConfiguration );
    EXPECT_THROW( embed( table, 1.0, EpsilonEnum::Fixed, 0, 2 ), InvalidConfiguration );
    EXPECT_THROW( embed( table, 1.0, EpsilonEnum::MaxMin, 10, 0 ), InvalidConfiguration );
    EXPECT_THROW( embed( table, 1.0, EpsilonEnum::MaxMin, 10, 4 ), InvalidConfiguration );

    auto corrupted = table;
    corrupted( 0, 1 ) = nan;
    EXPECT_THROW( embed( corrupted, 1.0, EpsilonEnum::MaxMin, 10, 2 ), InvalidConfiguration );

    EXPECT_EQ( epsilonFromLabel( "fixed" ), EpsilonEnum::Fixed );
    EXPECT_THROW( epsilonFromLabel( "median" ), InvalidConfiguration );
}
