#ifndef DIFFUSION_FEATURES_CLASSDISTANCES_HPP
#define DIFFUSION_FEATURES_CLASSDISTANCES_HPP

#include "DFDefs.hpp"
#include "SharedHistogram.hpp"

namespace DF {

using Sample = std::vector<double>;

constexpr size_t DefaultBins = 10;

template<typename Derived>
struct Criteria
{
    /**
     * @brief Symmetric, non-negative distance between the values of one feature
     * observed under two classes. Samples with less than two values carry no
     * distribution and measure 0, as do non-finite results.
     */
    static double measure( const Sample &a, const Sample &b, size_t nBins = DefaultBins )
    {
        if ( a.size() < 2 || b.size() < 2 )
            return 0;
        const double distance = Derived::apply( a, b, nBins );
        if ( !std::isfinite( distance ))
            return 0;
        return std::max( distance, 0.0 );
    }

protected:
    static bool constant( const Sample &sample )
    {
        const auto[lo, hi] = std::minmax_element( sample.cbegin(), sample.cend());
        return lo == sample.cend() || !(*hi > *lo);
    }

    /**
     * @brief Paired densities over the pooled binning. A zero-variance sample
     * is a point mass whose histogram depends only on the bin it falls in,
     * so any pair involving one has no densities and measures 0.
     */
    static std::optional<std::pair<Histogram, Histogram >>
    densities( const Sample &a, const Sample &b, size_t nBins )
    {
        if ( constant( a ) || constant( b ))
            return std::nullopt;
        auto binning = Binning::pooled( a, b, nBins );
        if ( binning.degenerate())
            return std::nullopt;
        return std::make_pair( Histogram::probabilities( a, binning ),
                               Histogram::probabilities( b, binning ));
    }

    static double bhattacharyyaCoefficient( const Histogram &p, const Histogram &q )
    {
        double sum = 0;
        for (size_t i = 0; i < p.size(); ++i)
            sum += std::sqrt( p[i] * q[i] );
        // disjoint supports would give an infinite distance
        return std::clamp( sum, eps, 1.0 );
    }

private:
    Criteria() = default;

    friend Derived;
};

struct Wasserstein : public Criteria<Wasserstein>
{
    static constexpr const char *label = "wasserstein";

    /**
     * @brief First Wasserstein distance between two empirical samples:
     * the integral of |U(x) - V(x)| where U and V are the empirical CDFs.
     */
    static double apply( const Sample &a, const Sample &b, size_t )
    {
        Sample u( a ), v( b );
        std::sort( u.begin(), u.end());
        std::sort( v.begin(), v.end());

        Sample all;
        all.reserve( u.size() + v.size());
        std::merge( u.cbegin(), u.cend(), v.cbegin(), v.cend(), std::back_inserter( all ));

        double sum = 0;
        for (size_t i = 0; i + 1 < all.size(); ++i)
        {
            const double delta = all[i + 1] - all[i];
            if ( delta <= 0 ) continue;
            const auto uCount = std::upper_bound( u.cbegin(), u.cend(), all[i] ) - u.cbegin();
            const auto vCount = std::upper_bound( v.cbegin(), v.cend(), all[i] ) - v.cbegin();
            const double uCdf = double( uCount ) / u.size();
            const double vCdf = double( vCount ) / v.size();
            sum += std::abs( uCdf - vCdf ) * delta;
        }
        return sum;
    }

private:
    Wasserstein() = default;
};

struct Bhattacharyya : public Criteria<Bhattacharyya>
{
    static constexpr const char *label = "bhattacharyya";

    /**
     * @brief Bhattacharyya Distance: https://en.wikipedia.org/wiki/Bhattacharyya_distance
     */
    static double apply( const Sample &a, const Sample &b, size_t nBins )
    {
        if ( auto d = densities( a, b, nBins ); d )
        {
            auto &[p, q] = d.value();
            return -std::log( bhattacharyyaCoefficient( p, q ));
        } else return 0;
    }

private:
    Bhattacharyya() = default;
};

struct Hellinger : public Criteria<Hellinger>
{
    static constexpr const char *label = "hellinger";

    /**
     * @brief Hellinger Distance: https://en.wikipedia.org/wiki/Hellinger_distance
     */
    static double apply( const Sample &a, const Sample &b, size_t nBins )
    {
        if ( auto d = densities( a, b, nBins ); d )
        {
            auto &[p, q] = d.value();
            double sum = 0;
            for (size_t i = 0; i < p.size(); ++i)
            {
                double u = std::sqrt( p[i] ) - std::sqrt( q[i] );
                sum += u * u;
            }
            const double factor = 1.0 / std::sqrt( 2.0 );
            return factor * std::sqrt( sum );
        } else return 0;
    }

private:
    Hellinger() = default;
};

struct JeffriesMatusita : public Criteria<JeffriesMatusita>
{
    static constexpr const char *label = "jm";

    static double apply( const Sample &a, const Sample &b, size_t nBins )
    {
        const double bhattacharyya = Bhattacharyya::apply( a, b, nBins );
        return std::sqrt( 2.0 * (1.0 - std::exp( -bhattacharyya )));
    }

private:
    JeffriesMatusita() = default;
};

enum class DistanceEnum
{
    Wasserstein,
    Bhattacharyya,
    Hellinger,
    JeffriesMatusita
};

const std::map<std::string, DistanceEnum> DistanceLabels{
        {Wasserstein::label,      DistanceEnum::Wasserstein},
        {Bhattacharyya::label,    DistanceEnum::Bhattacharyya},
        {Hellinger::label,        DistanceEnum::Hellinger},
        {JeffriesMatusita::label, DistanceEnum::JeffriesMatusita}
};

using DistanceFunction = double ( * )( const Sample &, const Sample &, size_t );

inline DistanceFunction distanceFunction( DistanceEnum distance )
{
    switch (distance)
    {
        case DistanceEnum::Wasserstein :
            return Wasserstein::measure;
        case DistanceEnum::Bhattacharyya :
            return Bhattacharyya::measure;
        case DistanceEnum::Hellinger :
            return Hellinger::measure;
        case DistanceEnum::JeffriesMatusita :
            return JeffriesMatusita::measure;
    }
    throw InvalidConfiguration( "Undefined Distance" );
}

inline DistanceEnum distanceFromLabel( const std::string &label )
{
    return enumFromLabel( DistanceLabels, label, "distance" );
}

inline std::string distanceLabel( DistanceEnum distance )
{
    return labelFromEnum( DistanceLabels, distance );
}

}

#endif //DIFFUSION_FEATURES_CLASSDISTANCES_HPP
