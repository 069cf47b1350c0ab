#ifndef DIFFUSION_FEATURES_CONFUSIONMATRIX_HPP
#define DIFFUSION_FEATURES_CONFUSIONMATRIX_HPP

#include "common.hpp"

namespace DF {

template<typename Label = std::string, typename T = int64_t>
class ConfusionMatrix
{
private:
    using Row = std::vector<T>;
    using Matrix = std::vector<Row>;
    static constexpr double eps = std::numeric_limits<double>::epsilon();
public:

    explicit ConfusionMatrix( const std::set<Label> &labels ) :
            _dictionary( _makeDictionary( labels )),
            _order( _dictionary.size()),
            _matrix( Matrix( _order, Row( _order, 0 )))
    {
    }

    void countInstance( const Label &prediction, const Label &actual )
    {
        ++_matrix.at( _getClassIdx( actual )).at( _getClassIdx( prediction ));
    }

    T truePositives( const Label &cl ) const
    {
        return _truePositives( _getClassIdx( cl ));
    }

    T falsePositives( const Label &cl ) const
    {
        return _falsePositives( _getClassIdx( cl ));
    }

    T falseNegatives( const Label &cl ) const
    {
        return _falseNegatives( _getClassIdx( cl ));
    }

    T population() const
    {
        T count = 0;
        for (auto &row : _matrix)
            count += std::accumulate( row.cbegin(), row.cend(), T( 0 ));
        return count;
    }

    double overallAccuracy() const
    {
        const auto n = population();
        if ( n == 0 ) return 0;
        double acc = 0;
        for (size_t i = 0; i < _order; ++i)
            acc += _truePositives( i );
        return acc / n;
    }

    double precision( const Label &cl ) const
    {
        return _precision( _getClassIdx( cl ));
    }

    double recall( const Label &cl ) const
    {
        return _recall( _getClassIdx( cl ));
    }

    double fScore( const Label &cl, double beta = 1 ) const
    {
        return _fScore( _getClassIdx( cl ), beta );
    }

    /**
     * @brief Unweighted mean of the per-class F-scores.
     */
    double macroFScore( double beta = 1 ) const
    {
        if ( _order == 0 ) return 0;
        double sum = 0;
        for (size_t i = 0; i < _order; ++i)
            sum += _fScore( i, beta );
        return sum / _order;
    }

private:
    static std::map<Label, size_t> _makeDictionary( const std::set<Label> &labels )
    {
        std::map<Label, size_t> dictionary;
        size_t idx = 0;
        for (auto &l : labels)
            dictionary.emplace( l, idx++ );
        return dictionary;
    }

    size_t _getClassIdx( const Label &cl ) const
    {
        if ( auto it = _dictionary.find( cl ); it != _dictionary.cend())
            return it->second;
        throw std::runtime_error( fmt::format( "Unexpected label {}", cl ));
    }

    T _truePositives( size_t idx ) const
    {
        return _matrix.at( idx ).at( idx );
    }

    T _falsePositives( size_t idx ) const
    {
        T fp = 0;
        for (size_t i = 0; i < _order; ++i)
            fp += _matrix.at( i ).at( idx );
        return fp - _truePositives( idx );
    }

    T _falseNegatives( size_t idx ) const
    {
        const auto &row = _matrix.at( idx );
        return std::accumulate( row.cbegin(), row.cend(), T( 0 )) - _truePositives( idx );
    }

    double _precision( size_t idx ) const
    {
        const T tp = _truePositives( idx ), fp = _falsePositives( idx );
        return (tp + fp == 0) ? 0.0 : double( tp ) / (tp + fp);
    }

    double _recall( size_t idx ) const
    {
        const T tp = _truePositives( idx ), fn = _falseNegatives( idx );
        return (tp + fn == 0) ? 0.0 : double( tp ) / (tp + fn);
    }

    double _fScore( size_t idx, double beta ) const
    {
        const double p = _precision( idx ), r = _recall( idx );
        beta *= beta;
        const double den = beta * p + r;
        return (den < eps) ? 0.0 : (beta + 1) * p * r / den;
    }

private:
    const std::map<Label, size_t> _dictionary;
    const size_t _order;
    Matrix _matrix;
};

}

#endif //DIFFUSION_FEATURES_CONFUSIONMATRIX_HPP
