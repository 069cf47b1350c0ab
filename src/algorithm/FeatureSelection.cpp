#include "FeatureSelection.hpp"
#include "Clustering.hpp"
#include "DiffusionMap.hpp"
#include "dlib_utilities.hpp"

namespace DF {

void validateFeatureCount( size_t k, size_t nFeatures )
{
    if ( k < 1 || k >= nFeatures )
        throw InvalidConfiguration( fmt::format( "k must lie in [1,{}), given:{}", nFeatures, k ));
}

std::vector<FeatureIndex> rankByAxis( const dlib::matrix<double> &coordinates, size_t k )
{
    struct Entry
    {
        double value;
        FeatureIndex feature;
        long axis;
    };

    std::vector<Entry> entries;
    for (long axis = 0; axis < coordinates.nr(); ++axis)
        for (long i = 0; i < coordinates.nc(); ++i)
            entries.push_back( {coordinates( axis, i ), static_cast<FeatureIndex>( i ), axis} );

    std::sort( entries.begin(), entries.end(), []( const Entry &a, const Entry &b ) {
        return std::tie( a.value, a.feature, a.axis ) < std::tie( b.value, b.feature, b.axis );
    } );

    std::vector<FeatureIndex> selected;
    std::set<FeatureIndex> seen;
    for (auto &e : entries)
    {
        if ( selected.size() == k ) break;
        if ( seen.insert( e.feature ).second )
            selected.push_back( e.feature );
    }
    return selected;
}

std::vector<FeatureIndex> farthestFromOrigin( const dlib::matrix<double> &coordinates, size_t k )
{
    std::vector<double> norms;
    for (long i = 0; i < coordinates.nc(); ++i)
        norms.push_back( dlib::length( dlib::colm( coordinates, i )));

    auto order = argsort( norms.size(), [&]( size_t i ) { return norms[i]; }, true );
    order.resize( std::min( k, order.size()));
    return order;
}

std::vector<FeatureIndex> kMeansNearestToRank( const dlib::matrix<double> &coordinates, size_t k,
                                               unsigned long seed )
{
    const auto clusters = kMeans( dlib_utilities::column_samples( coordinates ), k, seed );
    if ( clusters.assignments.empty())
        return {};

    const auto ranking = axisRankings( coordinates ).front();
    std::vector<FeatureIndex> selected;
    std::set<size_t> represented;
    for (auto feature : ranking)
    {
        if ( represented.size() == k ) break;
        if ( represented.insert( clusters.assignments[feature] ).second )
            selected.push_back( feature );
    }
    return selected;
}

std::vector<FeatureIndex> kMedoidsExactCenter( const dlib::matrix<double> &coordinates, size_t k,
                                               unsigned long seed )
{
    const auto clusters = kMedoids( dlib_utilities::column_samples( coordinates ), k, seed );
    return clusters.medoids;
}

FeatureSelection selectFeatures( const dlib::matrix<double> &coordinates,
                                 size_t k,
                                 SelectionEnum strategy,
                                 unsigned long seed )
{
    validateFeatureCount( k, static_cast<size_t>( coordinates.nc()));
    if ( coordinates.nr() < 1 )
        throw InvalidConfiguration( "embedding has no axes" );

    FeatureSelection selection;
    selection.strategy = strategy;
    selection.requested = k;
    switch (strategy)
    {
        case SelectionEnum::RankByAxis :
            selection.indices = rankByAxis( coordinates, k );
            break;
        case SelectionEnum::FarthestFromOrigin :
            selection.indices = farthestFromOrigin( coordinates, k );
            break;
        case SelectionEnum::KMeansNearestToRank :
            selection.indices = kMeansNearestToRank( coordinates, k, seed );
            break;
        case SelectionEnum::KMedoidsExactCenter :
            selection.indices = kMedoidsExactCenter( coordinates, k, seed );
            break;
    }
    return selection;
}

}
