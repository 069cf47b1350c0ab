#ifndef DIFFUSION_FEATURES_DIFFUSIONMAP_HPP
#define DIFFUSION_FEATURES_DIFFUSIONMAP_HPP

#include <dlib/matrix.h>

#include "DFDefs.hpp"

namespace DF {

enum class EpsilonEnum
{
    Fixed,
    MaxMin
};

const std::map<std::string, EpsilonEnum> EpsilonLabels{
        {"fixed",  EpsilonEnum::Fixed},
        {"maxmin", EpsilonEnum::MaxMin}
};

constexpr double FallbackEpsilon = 1e-8;

struct DiffusionMapConfiguration
{
    double alpha = 1.0;
    EpsilonEnum epsType = EpsilonEnum::MaxMin;
    // fixed: the bandwidth itself, maxmin: multiplier of the max-min distance
    double epsFactor = 10.0;
    size_t dimensions = 2;
};

struct Embedding
{
    // d x N, column i is the position of feature i.
    dlib::matrix<double> coordinates;

    // per axis, feature indices ordered by ascending coordinate
    std::vector<std::vector<FeatureIndex>> axisRankings;

    // eigenvalues of the retained axes, in axis order
    std::vector<double> eigenvalues;

    double epsilon = 0;

    inline size_t nFeatures() const
    {
        return static_cast<size_t>( coordinates.nc());
    }

    inline size_t dimensions() const
    {
        return static_cast<size_t>( coordinates.nr());
    }
};

/**
 * @brief Diffusion map over the rows of a distance table: Gaussian kernel on the
 * Euclidean distances between rows, alpha-normalization, Markov normalization and
 * spectral decomposition. The trivial stationary axis is dropped and the next
 * `dimensions` eigenvectors, scaled by their eigenvalues, give the coordinates.
 */
class DiffusionMap
{
public:
    explicit DiffusionMap( DiffusionMapConfiguration configuration );

    Embedding embed( const dlib::matrix<double> &table ) const;

    static dlib::matrix<double> pairwiseDistances( const dlib::matrix<double> &table );

    static double epsilon( const dlib::matrix<double> &distances,
                           EpsilonEnum epsType,
                           double epsFactor );

    static dlib::matrix<double> kernel( const dlib::matrix<double> &distances, double epsilon );

    static dlib::matrix<double> alphaNormalize( const dlib::matrix<double> &kernel, double alpha );

    static dlib::matrix<double> markovMatrix( const dlib::matrix<double> &kernel );

    const DiffusionMapConfiguration &configuration() const
    {
        return _configuration;
    }

private:
    void _validate( long nFeatures ) const;

    DiffusionMapConfiguration _configuration;
};

std::vector<std::vector<FeatureIndex>> axisRankings( const dlib::matrix<double> &coordinates );

Embedding embed( const dlib::matrix<double> &table,
                 double alpha,
                 EpsilonEnum epsType,
                 double epsFactor,
                 size_t dimensions );

inline EpsilonEnum epsilonFromLabel( const std::string &label )
{
    return enumFromLabel( EpsilonLabels, label, "epsilon type" );
}

}

#endif //DIFFUSION_FEATURES_DIFFUSIONMAP_HPP
