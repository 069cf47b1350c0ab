#include <gtest/gtest.h>

#include "ResultsStore.hpp"
#include "fixtures.hpp"

using namespace DF;

TEST( ResultsStore, SummarizeAveragesFolds )
{
    const auto summary = summarize( "toy", 0.1, 3, 2, "fisher",
                                    {0.5, 1.0}, {0.4, 0.8}, {10.0, 30.0}, {3, 2} );
    EXPECT_DOUBLE_EQ( summary.accuracy, 0.75 );
    EXPECT_NEAR( summary.f1, 0.6, 1e-12 );
    EXPECT_DOUBLE_EQ( summary.timeMs, 40.0 );
    EXPECT_DOUBLE_EQ( summary.meanSelected, 2.5 );
    EXPECT_EQ( summary.foldAccuracies.size(), 2u );
}

TEST( ResultsStore, WritesHeaderOnceAndAppendsRows )
{
    const auto workDir = fixtures::scratchDirectory( "results_store" );
    const auto summary = summarize( "toy", 0.2, 4, 2, "random_features",
                                    {0.5}, {0.5}, {1.0}, {4} );
    std::string path;
    {
        ResultsStore store( workDir.string(), "toy" );
        path = store.path();
        store.append( summary );
    }
    {
        ResultsStore store( workDir.string(), "toy" );
        store.append( summary );
    }

    EXPECT_EQ( std::filesystem::path( path ), workDir / "toy" / "toy_results.csv" );
    const auto lines = fixtures::readLines( path );
    ASSERT_EQ( lines.size(), 3u );
    EXPECT_EQ( lines[0], io::join( ResultsStore::header(), "," ));
    EXPECT_EQ( lines[1], ResultsStore::formatRow( summary ));
    EXPECT_EQ( io::split( lines[2], ',' ).size(), ResultsStore::header().size());
}
