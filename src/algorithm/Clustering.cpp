#include <dlib/clustering.h>
#include <dlib/svm.h>
#include <dlib/rand.h>

#include "Clustering.hpp"

namespace DF {

static inline double squaredDistance( const Point &a, const Point &b )
{
    return dlib::length_squared( a - b );
}

static size_t nearest( const std::vector<Point> &points, const std::vector<size_t> &centers, const Point &p )
{
    size_t best = 0;
    double bestDistance = inf;
    for (size_t c = 0; c < centers.size(); ++c)
    {
        const double d = squaredDistance( points[centers[c]], p );
        if ( d < bestDistance )
        {
            bestDistance = d;
            best = c;
        }
    }
    return best;
}

std::vector<size_t> kMeansPlusPlusSeeds( const std::vector<Point> &points, size_t k, unsigned long seed )
{
    std::vector<size_t> seeds;
    if ( points.empty() || k == 0 )
        return seeds;

    dlib::rand rnd;
    rnd.set_seed( std::to_string( seed ));

    seeds.push_back( rnd.get_random_32bit_number() % points.size());
    std::vector<double> closest( points.size(), inf );
    while (seeds.size() < k)
    {
        double total = 0;
        for (size_t i = 0; i < points.size(); ++i)
        {
            closest[i] = std::min( closest[i], squaredDistance( points[i], points[seeds.back()] ));
            total += closest[i];
        }
        if ( !(total > 0))
            break;

        const double target = rnd.get_random_double() * total;
        double cumulative = 0;
        size_t chosen = points.size();
        for (size_t i = 0; i < points.size(); ++i)
        {
            if ( closest[i] <= 0 ) continue;
            cumulative += closest[i];
            chosen = i;
            if ( cumulative >= target ) break;
        }
        seeds.push_back( chosen );
    }
    return seeds;
}

Clusters kMeans( const std::vector<Point> &points, size_t k, unsigned long seed, unsigned long maxIterations )
{
    Clusters clusters;
    const auto seeds = kMeansPlusPlusSeeds( points, k, seed );
    if ( seeds.empty())
        return clusters;

    std::vector<Point> centers;
    for (auto s : seeds)
        centers.push_back( points[s] );
    dlib::find_clusters_using_kmeans( points, centers, maxIterations );

    std::set<size_t> used;
    for (auto &p : points)
    {
        const size_t c = dlib::nearest_center( centers, p );
        clusters.assignments.push_back( c );
        used.insert( c );
    }
    clusters.nClusters = used.size();
    return clusters;
}

Clusters kMedoids( const std::vector<Point> &points, size_t k, unsigned long seed, unsigned long maxIterations )
{
    Clusters clusters;
    auto medoids = kMeansPlusPlusSeeds( points, k, seed );
    if ( medoids.empty())
        return clusters;

    std::vector<size_t> assignments( points.size(), 0 );
    for (unsigned long iteration = 0; iteration < maxIterations; ++iteration)
    {
        for (size_t i = 0; i < points.size(); ++i)
            assignments[i] = nearest( points, medoids, points[i] );

        std::vector<std::vector<size_t>> members( medoids.size());
        for (size_t i = 0; i < points.size(); ++i)
            members[assignments[i]].push_back( i );

        bool changed = false;
        for (size_t c = 0; c < medoids.size(); ++c)
        {
            size_t best = medoids[c];
            double bestCost = inf;
            for (auto candidate : members[c])
            {
                double cost = 0;
                for (auto other : members[c])
                    cost += std::sqrt( squaredDistance( points[candidate], points[other] ));
                if ( cost < bestCost )
                {
                    bestCost = cost;
                    best = candidate;
                }
            }
            if ( best != medoids[c] )
            {
                medoids[c] = best;
                changed = true;
            }
        }
        if ( !changed ) break;
    }

    for (size_t i = 0; i < points.size(); ++i)
        assignments[i] = nearest( points, medoids, points[i] );

    clusters.assignments = std::move( assignments );
    clusters.nClusters = medoids.size();
    clusters.medoids = std::move( medoids );
    return clusters;
}

}
