#ifndef DIFFUSION_FEATURES_CLUSTERING_HPP
#define DIFFUSION_FEATURES_CLUSTERING_HPP

#include <dlib/matrix.h>

#include "DFDefs.hpp"

namespace DF {

using Point = dlib::matrix<double, 0, 1>;

struct Clusters
{
    // cluster id of every point
    std::vector<size_t> assignments;

    // point index of every cluster center, only for medoid clustering
    std::vector<size_t> medoids;

    size_t nClusters = 0;
};

/**
 * @brief k-means++ seeding with a seeded generator. Stops early when every
 * remaining point coincides with a chosen seed, so fewer than k seeds
 * are returned when there are fewer than k distinct points.
 */
std::vector<size_t> kMeansPlusPlusSeeds( const std::vector<Point> &points, size_t k, unsigned long seed );

Clusters kMeans( const std::vector<Point> &points, size_t k, unsigned long seed,
                 unsigned long maxIterations = 1000 );

/**
 * @brief k-medoids by alternating assignment and medoid update. Centers are
 * always data points, reported by index in `Clusters::medoids`.
 */
Clusters kMedoids( const std::vector<Point> &points, size_t k, unsigned long seed,
                   unsigned long maxIterations = 300 );

}

#endif //DIFFUSION_FEATURES_CLUSTERING_HPP
