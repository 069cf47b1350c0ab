#include <gtest/gtest.h>

#include "crossvalidation.hpp"

using namespace DF;

namespace {

std::vector<ClassLabel> imbalancedLabels()
{
    std::vector<ClassLabel> labels( 10, "a" );
    labels.insert( labels.end(), 5, "b" );
    return labels;
}

}

TEST( CrossValidation, StratifiedFoldsPartitionRows )
{
    const auto labels = imbalancedLabels();
    const auto folds = kFoldStratifiedSplit( labels, 5, 0 );
    ASSERT_EQ( folds.size(), 5u );

    std::set<size_t> seen;
    for (auto &fold : folds)
    {
        EXPECT_TRUE( std::is_sorted( fold.cbegin(), fold.cend()));
        size_t a = 0, b = 0;
        for (auto r : fold)
        {
            EXPECT_TRUE( seen.insert( r ).second );
            (labels[r] == "a" ? a : b)++;
        }
        EXPECT_EQ( a, 2u );
        EXPECT_EQ( b, 1u );
    }
    EXPECT_EQ( seen.size(), labels.size());
}

TEST( CrossValidation, FoldsAreReproducible )
{
    const auto labels = imbalancedLabels();
    EXPECT_EQ( kFoldStratifiedSplit( labels, 3, 42 ), kFoldStratifiedSplit( labels, 3, 42 ));
}

TEST( CrossValidation, TrainingRowsExcludeValidationFold )
{
    const auto folds = kFoldStratifiedSplit( imbalancedLabels(), 5, 0 );
    const auto training = trainingRows( folds, 0 );
    EXPECT_EQ( training.size(), 12u );
    for (auto r : folds[0])
        EXPECT_FALSE( std::binary_search( training.cbegin(), training.cend(), r ));
}

TEST( CrossValidation, RejectsSingleFold )
{
    EXPECT_THROW( kFoldStratifiedSplit( imbalancedLabels(), 1, 0 ), InvalidConfiguration );
}
