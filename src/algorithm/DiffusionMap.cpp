#include "DiffusionMap.hpp"
#include "dlib_utilities.hpp"

namespace DF {

DiffusionMap::DiffusionMap( DiffusionMapConfiguration configuration )
        : _configuration( configuration )
{}

void DiffusionMap::_validate( long nFeatures ) const
{
    const auto &c = _configuration;
    if ( !(c.alpha >= 0.0 && c.alpha <= 1.0))
        throw InvalidConfiguration( fmt::format( "alpha must lie in [0,1], given:{}", c.alpha ));
    if ( !(c.epsFactor > 0.0) || !std::isfinite( c.epsFactor ))
        throw InvalidConfiguration( fmt::format( "epsilon factor must be positive, given:{}", c.epsFactor ));
    if ( c.dimensions < 1 || static_cast<long>( c.dimensions ) >= nFeatures )
        throw InvalidConfiguration( fmt::format( "embedding dimension must lie in [1,{}), given:{}",
                                                 nFeatures, c.dimensions ));
}

dlib::matrix<double> DiffusionMap::pairwiseDistances( const dlib::matrix<double> &table )
{
    const long n = table.nr();
    dlib::matrix<double> distances = dlib::zeros_matrix<double>( n, n );
    for (long i = 0; i < n; ++i)
        for (long j = i + 1; j < n; ++j)
        {
            const double d = dlib::length( dlib::rowm( table, i ) - dlib::rowm( table, j ));
            distances( i, j ) = d;
            distances( j, i ) = d;
        }
    return distances;
}

double DiffusionMap::epsilon( const dlib::matrix<double> &distances,
                              EpsilonEnum epsType,
                              double epsFactor )
{
    switch (epsType)
    {
        case EpsilonEnum::Fixed :
            return epsFactor;
        case EpsilonEnum::MaxMin :
        {
            double maxMin = 0;
            bool found = false;
            for (long i = 0; i < distances.nr(); ++i)
            {
                double rowMin = inf;
                for (long j = 0; j < distances.nc(); ++j)
                    if ( j != i && distances( i, j ) > 0 )
                        rowMin = std::min( rowMin, distances( i, j ));
                if ( rowMin < inf )
                {
                    maxMin = std::max( maxMin, rowMin );
                    found = true;
                }
            }
            if ( !found || !(maxMin > 0))
                return FallbackEpsilon;
            return epsFactor * maxMin;
        }
    }
    throw InvalidConfiguration( "Undefined Epsilon" );
}

dlib::matrix<double> DiffusionMap::kernel( const dlib::matrix<double> &distances, double epsilon )
{
    dlib::matrix<double> k( distances.nr(), distances.nc());
    for (long i = 0; i < distances.nr(); ++i)
        for (long j = 0; j < distances.nc(); ++j)
            k( i, j ) = std::exp( -distances( i, j ) * distances( i, j ) / epsilon );
    return k;
}

dlib::matrix<double> DiffusionMap::alphaNormalize( const dlib::matrix<double> &kernel, double alpha )
{
    const long n = kernel.nr();
    std::vector<double> qAlpha( n );
    for (long i = 0; i < n; ++i)
        qAlpha[i] = std::pow( std::max( dlib::sum( dlib::rowm( kernel, i )), eps ), alpha );

    dlib::matrix<double> kAlpha( n, n );
    for (long i = 0; i < n; ++i)
        for (long j = 0; j < n; ++j)
            kAlpha( i, j ) = kernel( i, j ) / (qAlpha[i] * qAlpha[j]);
    return kAlpha;
}

dlib::matrix<double> DiffusionMap::markovMatrix( const dlib::matrix<double> &kernel )
{
    const long n = kernel.nr();
    dlib::matrix<double> p( n, n );
    for (long i = 0; i < n; ++i)
    {
        const double rowSum = std::max( dlib::sum( dlib::rowm( kernel, i )), eps );
        for (long j = 0; j < n; ++j)
            p( i, j ) = kernel( i, j ) / rowSum;
    }
    return p;
}

Embedding DiffusionMap::embed( const dlib::matrix<double> &table ) const
{
    const long n = table.nr();
    _validate( n );
    if ( !dlib_utilities::all_finite( table ))
        throw InvalidConfiguration( "distance table contains non-finite values" );

    Embedding embedding;
    const auto distances = pairwiseDistances( table );
    embedding.epsilon = epsilon( distances, _configuration.epsType, _configuration.epsFactor );
    const auto kAlpha = alphaNormalize( kernel( distances, embedding.epsilon ), _configuration.alpha );

    const auto p = markovMatrix( kAlpha );

    // P = Q^-1 K_alpha is conjugate to the symmetric S = Q^1/2 P Q^-1/2,
    // eigenvectors of P are Q^-1/2 times those of S.
    std::vector<double> sqrtQ( n );
    for (long i = 0; i < n; ++i)
        sqrtQ[i] = std::sqrt( std::max( dlib::sum( dlib::rowm( kAlpha, i )), eps ));

    dlib::matrix<double> s( n, n );
    for (long i = 0; i < n; ++i)
        for (long j = i; j < n; ++j)
        {
            const double v = p( i, j ) * sqrtQ[i] / sqrtQ[j];
            s( i, j ) = v;
            s( j, i ) = v;
        }

    dlib::eigenvalue_decomposition<dlib::matrix<double>> eig( dlib::make_symmetric( s ));
    // imaginary parts are rounding artifacts of a symmetric problem
    const dlib::matrix<double, 0, 1> lambdas = eig.get_real_eigenvalues();
    const dlib::matrix<double> psi = eig.get_pseudo_v();

    const auto order = argsort( static_cast<size_t>( n ),
                                [&]( size_t i ) { return lambdas( static_cast<long>( i )); },
                                true );

    const long d = static_cast<long>( _configuration.dimensions );
    embedding.coordinates.set_size( d, n );
    for (long axis = 0; axis < d; ++axis)
    {
        // order[0] is the stationary axis with eigenvalue 1
        const long k = static_cast<long>( order[axis + 1] );
        const double lambda = std::max( lambdas( k ), 0.0 );

        dlib::matrix<double, 0, 1> phi( n );
        for (long i = 0; i < n; ++i)
            phi( i ) = psi( i, k ) / sqrtQ[i];
        const double norm = dlib::length( phi );
        if ( norm > 0 ) phi /= norm;

        long pivot = 0;
        for (long i = 1; i < n; ++i)
            if ( std::abs( phi( i )) > std::abs( phi( pivot )))
                pivot = i;
        if ( phi( pivot ) < 0 ) phi = -phi;

        for (long i = 0; i < n; ++i)
            embedding.coordinates( axis, i ) = lambda * phi( i );
        embedding.eigenvalues.push_back( lambda );
    }

    embedding.axisRankings = axisRankings( embedding.coordinates );
    return embedding;
}

std::vector<std::vector<FeatureIndex>> axisRankings( const dlib::matrix<double> &coordinates )
{
    std::vector<std::vector<FeatureIndex>> rankings;
    for (long axis = 0; axis < coordinates.nr(); ++axis)
        rankings.push_back( argsort( static_cast<size_t>( coordinates.nc()),
                                     [&]( size_t i ) { return coordinates( axis, static_cast<long>( i )); } ));
    return rankings;
}

Embedding embed( const dlib::matrix<double> &table,
                 double alpha,
                 EpsilonEnum epsType,
                 double epsFactor,
                 size_t dimensions )
{
    DiffusionMapConfiguration configuration;
    configuration.alpha = alpha;
    configuration.epsType = epsType;
    configuration.epsFactor = epsFactor;
    configuration.dimensions = dimensions;
    return DiffusionMap( configuration ).embed( table );
}

}
