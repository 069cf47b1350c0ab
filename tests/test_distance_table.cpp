#include <gtest/gtest.h>

#include "DistanceTable.hpp"
#include "fixtures.hpp"

using namespace DF;

TEST( DistanceTable, ClassPairMatrixIsSymmetricWithNullDiagonal )
{
    const std::vector<double> column{0.1, 0.3, 0.2, 1.5, 1.1, 1.9, 3.0, 2.2, 2.7};
    const std::vector<ClassLabel> labels{"x", "x", "x", "y", "y", "y", "z", "z", "z"};
    const std::vector<ClassLabel> classes{"x", "y", "z"};

    for (auto &[label, distance] : DistanceLabels)
    {
        SCOPED_TRACE( label );
        const auto m = classPairDistances( column, labels, classes, distance );
        ASSERT_EQ( m.nr(), 3 );
        ASSERT_EQ( m.nc(), 3 );
        for (long i = 0; i < 3; ++i)
        {
            EXPECT_EQ( m( i, i ), 0.0 );
            for (long j = 0; j < 3; ++j)
                EXPECT_NEAR( m( i, j ), m( j, i ), 1e-12 );
        }
    }
}

TEST( DistanceTable, AbsentClassMeasuresZero )
{
    const std::vector<double> column{0.0, 0.5, 2.0, 2.5};
    const std::vector<ClassLabel> labels{"a", "a", "b", "b"};
    const auto m = classPairDistances( column, labels, {"a", "b", "c"}, DistanceEnum::Wasserstein );
    EXPECT_NEAR( m( 0, 1 ), 2.0, 1e-12 );
    EXPECT_EQ( m( 0, 2 ), 0.0 );
    EXPECT_EQ( m( 1, 2 ), 0.0 );
}

TEST( DistanceTable, MismatchedLabelsAreRejected )
{
    EXPECT_THROW( classPairDistances( {1.0, 2.0}, {"a"}, {"a"}, DistanceEnum::Hellinger ),
                  InvalidConfiguration );
}

TEST( DistanceTable, FlattenedRowsMatchPerFeatureMatrices )
{
    const auto dataset = fixtures::shiftedDataset( {0.5, 1.0, 2.0, 4.0} );
    const auto table = buildDistanceTable( dataset, DistanceEnum::Wasserstein );

    EXPECT_EQ( table.flattened.nr(), 4 );
    EXPECT_EQ( table.flattened.nc(), 4 );
    EXPECT_EQ( table.nFeatures(), 4u );
    EXPECT_EQ( table.classes, (std::vector<ClassLabel>{"a", "b"}));
    ASSERT_EQ( table.classPairs.size(), 4u );

    const std::vector<double> shifts{0.5, 1.0, 2.0, 4.0};
    for (long f = 0; f < 4; ++f)
    {
        const auto &m = table.classPairs.at( dataset.featureNames()[f] );
        for (long i = 0; i < 2; ++i)
            for (long j = 0; j < 2; ++j)
                EXPECT_EQ( table.flattened( f, i * 2 + j ), m( i, j ));
        EXPECT_NEAR( table.flattened( f, 1 ), shifts[f], 1e-9 );
    }
}

TEST( DistanceTable, ConstantFeatureStaysFinite )
{
    LabeledDataset dataset( {"constant", "spread"},
                            {{1.0, 1.0, 1.0, 1.0}, {0.0, 1.0, 5.0, 6.0}},
                            {"a", "a", "b", "b"} );
    for (auto &[label, distance] : DistanceLabels)
    {
        const auto table = buildDistanceTable( dataset, distance );
        for (long c = 0; c < table.flattened.nc(); ++c)
        {
            EXPECT_TRUE( std::isfinite( table.flattened( 0, c )));
            EXPECT_EQ( table.flattened( 0, c ), 0.0 );
        }
    }
}

TEST( DistanceTable, RowSubsetKeepsDatasetClassLayout )
{
    LabeledDataset dataset( {"x", "y"},
                            {{0.0, 0.5, 2.0, 2.5, 9.0}, {1.0, 1.5, 1.0, 1.5, 4.0}},
                            {"a", "a", "b", "b", "c"} );
    const auto training = dataset.subset( {0, 1, 2, 3} );
    ASSERT_EQ( training.classes().size(), 2u );

    const auto table = buildDistanceTable( training, dataset.classes(), DistanceEnum::Wasserstein );
    EXPECT_EQ( table.classes, (std::vector<ClassLabel>{"a", "b", "c"}));
    ASSERT_EQ( table.flattened.nc(), 9 );
    EXPECT_NEAR( table.flattened( 0, 1 ), 2.0, 1e-12 );
    for (long f = 0; f < 2; ++f)
        for (long other = 0; other < 3; ++other)
        {
            EXPECT_EQ( table.flattened( f, other * 3 + 2 ), 0.0 );
            EXPECT_EQ( table.flattened( f, 2 * 3 + other ), 0.0 );
        }
}
