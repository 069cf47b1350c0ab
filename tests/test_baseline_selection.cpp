#include <gtest/gtest.h>

#include "BaselineSelection.hpp"
#include "fixtures.hpp"

using namespace DF;

TEST( BaselineSelection, AllFeaturesEnumeratesIndices )
{
    EXPECT_EQ( allFeatures( 4 ), (std::vector<FeatureIndex>{0, 1, 2, 3}));
    EXPECT_TRUE( allFeatures( 0 ).empty());
}

TEST( BaselineSelection, RandomFeaturesAreDistinctSortedAndSeeded )
{
    const auto selected = randomFeatures( 50, 10, 3 );
    ASSERT_EQ( selected.size(), 10u );
    EXPECT_TRUE( std::is_sorted( selected.cbegin(), selected.cend()));
    EXPECT_EQ( std::set<FeatureIndex>( selected.cbegin(), selected.cend()).size(), 10u );
    EXPECT_LT( selected.back(), 50u );
    EXPECT_EQ( selected, randomFeatures( 50, 10, 3 ));
    EXPECT_THROW( randomFeatures( 5, 5, 3 ), InvalidConfiguration );
}

TEST( BaselineSelection, FisherScoreFavoursSeparatedFeatures )
{
    LabeledDataset dataset( {"separated", "mixed", "constant"},
                            {{0.0, 0.2, 1.0, 1.2},
                             {0.0, 1.0, 0.2, 1.2},
                             {5.0, 5.0, 5.0, 5.0}},
                            {"a", "a", "b", "b"} );
    const auto scores = fisherScores( dataset );
    ASSERT_EQ( scores.size(), 3u );
    EXPECT_NEAR( scores[0], 25.0, 1e-9 );
    EXPECT_NEAR( scores[1], 0.04, 1e-9 );
    EXPECT_EQ( scores[2], 0.0 );
    EXPECT_EQ( fisherRanks( dataset, 2 ), (std::vector<FeatureIndex>{0, 1}));
}

TEST( BaselineSelection, ChiSquareComparesClassSumsOfScaledFeatures )
{
    LabeledDataset dataset( {"separated", "mixed", "constant"},
                            {{0.0, 0.2, 1.0, 1.2},
                             {0.0, 1.0, 0.2, 1.2},
                             {5.0, 5.0, 5.0, 5.0}},
                            {"a", "a", "b", "b"} );
    const auto scores = chiSquareScores( dataset );
    ASSERT_EQ( scores.size(), 3u );
    EXPECT_NEAR( scores[0], 50.0 / 36.0, 1e-9 );
    EXPECT_NEAR( scores[1], 2.0 / 36.0, 1e-9 );
    EXPECT_EQ( scores[2], 0.0 );
    EXPECT_EQ( chiSquareRanks( dataset, 2 ), (std::vector<FeatureIndex>{0, 1}));
    EXPECT_THROW( chiSquareRanks( dataset, 3 ), InvalidConfiguration );
}

TEST( BaselineSelection, ReliefFRewardsFeaturesThatSeparateNeighbours )
{
    LabeledDataset dataset( {"separated", "mixed", "constant"},
                            {{0.0, 0.2, 1.0, 1.2},
                             {0.0, 1.0, 0.2, 1.2},
                             {5.0, 5.0, 5.0, 5.0}},
                            {"a", "a", "b", "b"} );
    const auto weights = reliefFScores( dataset );
    ASSERT_EQ( weights.size(), 3u );
    EXPECT_NEAR( weights[0], 1.0 / 6.0, 1e-9 );
    EXPECT_GT( weights[0], weights[1] );
    EXPECT_EQ( weights[2], 0.0 );

    const auto shifted = fixtures::shiftedDataset( {0.0, 5.0} );
    const auto shiftedWeights = reliefFScores( shifted );
    EXPECT_GT( shiftedWeights[1], 0.0 );
    EXPECT_GT( shiftedWeights[1], shiftedWeights[0] );
    EXPECT_EQ( reliefFRanks( shifted, 1 ), (std::vector<FeatureIndex>{1}));
}

TEST( BaselineSelection, MRMRSkipsRedundantCopies )
{
    LabeledDataset dataset( {"relevant", "copy", "weak"},
                            {{0, 0, 0, 1, 1, 1, 1, 1},
                             {0, 0, 0, 1, 1, 1, 1, 1},
                             {0, 1, 0, 0, 1, 0, 1, 0}},
                            {"a", "a", "a", "a", "b", "b", "b", "b"} );
    EXPECT_EQ( mrmrRanks( dataset, 2, 2 ), (std::vector<FeatureIndex>{0, 2}));
    EXPECT_EQ( fisherRanks( dataset, 2 ), (std::vector<FeatureIndex>{0, 1}));
    EXPECT_EQ( mrmrRanks( dataset, 1, 2 ), (std::vector<FeatureIndex>{0}));
}

TEST( BaselineSelection, SelectBaselineDispatchesByLabel )
{
    const auto dataset = fixtures::shiftedDataset( {0.5, 0.0, 3.0, 1.0} );
    for (auto &[label, baseline] : BaselineLabels)
    {
        EXPECT_EQ( baselineFromLabel( label ), baseline );
        EXPECT_EQ( baselineLabel( baseline ), label );
        const auto selected = selectBaseline( baseline, dataset, 2, 7 );
        EXPECT_EQ( selected.size(), 2u ) << label;
        EXPECT_EQ( std::set<FeatureIndex>( selected.cbegin(), selected.cend()).size(), 2u ) << label;
    }
    EXPECT_EQ( selectBaseline( BaselineEnum::Fisher, dataset, 1, 7 ), (std::vector<FeatureIndex>{2}));
    EXPECT_EQ( selectBaseline( BaselineEnum::ChiSquare, dataset, 1, 7 ), (std::vector<FeatureIndex>{2}));
    EXPECT_THROW( baselineFromLabel( "lasso" ), InvalidConfiguration );
}
