#ifndef DIFFUSION_FEATURES_SHAREDHISTOGRAM_HPP
#define DIFFUSION_FEATURES_SHAREDHISTOGRAM_HPP

#include "DFDefs.hpp"

namespace DF {

/**
 * @brief Equal-width binning over [lower, upper], shared by the two samples
 * being compared so that their densities are paired bin by bin.
 */
class Binning
{
public:
    Binning( double lower, double upper, size_t nBins )
            : _lower( lower ), _upper( upper ), _nBins( std::max<size_t>( nBins, 1 ))
    {}

    template<typename Container>
    static Binning pooled( const Container &a, const Container &b, size_t nBins )
    {
        double lower = inf, upper = -inf;
        for (double v : a)
        {
            lower = std::min( lower, v );
            upper = std::max( upper, v );
        }
        for (double v : b)
        {
            lower = std::min( lower, v );
            upper = std::max( upper, v );
        }
        return Binning( lower, upper, nBins );
    }

    inline bool degenerate() const
    {
        return !(_upper > _lower) || !std::isfinite( _upper - _lower );
    }

    inline size_t bin( double value ) const
    {
        if ( degenerate()) return 0;
        const double width = (_upper - _lower) / _nBins;
        auto b = static_cast<long>( std::floor((value - _lower) / width ));
        // right edge belongs to the last bin
        return static_cast<size_t>( std::clamp<long>( b, 0, long( _nBins ) - 1 ));
    }

    inline size_t size() const
    {
        return _nBins;
    }

private:
    double _lower;
    double _upper;
    size_t _nBins;
};

class Histogram
{
public:
    using Buffer = std::vector<double>;
    using BufferConstIterator = typename Buffer::const_iterator;

    explicit Histogram( size_t size, double pseudoCount = 0 )
            : _buffer( size, pseudoCount )
    {}

    template<typename Container>
    static Histogram probabilities( const Container &sample, const Binning &binning )
    {
        Histogram h( binning.size());
        for (double v : sample)
            h.increment( binning.bin( v ));
        return h.normalize();
    }

    inline BufferConstIterator begin() const
    {
        return _buffer.cbegin();
    }

    inline BufferConstIterator end() const
    {
        return _buffer.cend();
    }

    inline BufferConstIterator cbegin() const
    {
        return _buffer.cbegin();
    }

    inline BufferConstIterator cend() const
    {
        return _buffer.cend();
    }

    inline double operator[]( size_t bin ) const
    {
        return _buffer[bin];
    }

    inline void increment( size_t bin )
    {
        ++_buffer.at( bin );
    }

    inline double sum() const
    {
        return std::accumulate( _buffer.cbegin(), _buffer.cend(), double( 0 ));
    }

    inline Histogram &normalize()
    {
        ::normalize( _buffer.begin(), _buffer.end());
        return *this;
    }

    inline size_t size() const
    {
        return _buffer.size();
    }

private:
    Buffer _buffer;
};
}

#endif //DIFFUSION_FEATURES_SHAREDHISTOGRAM_HPP
