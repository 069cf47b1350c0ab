#ifndef DIFFUSION_FEATURES_DLIB_UTILITIES_HPP
#define DIFFUSION_FEATURES_DLIB_UTILITIES_HPP

#include <dlib/matrix.h>

#include "common.hpp"

namespace dlib_utilities {

using ColumnVector = dlib::matrix<double, 0, 1>;

inline ColumnVector to_column_vector( const std::vector<double> &values )
{
    ColumnVector v( static_cast<long>( values.size()));
    for (size_t i = 0; i < values.size(); ++i)
        v( static_cast<long>( i )) = values[i];
    return v;
}

/**
 * @brief Split a d x N matrix into N column samples of dimension d.
 */
inline std::vector<ColumnVector> column_samples( const dlib::matrix<double> &m )
{
    std::vector<ColumnVector> samples;
    samples.reserve( static_cast<size_t>( m.nc()));
    for (long c = 0; c < m.nc(); ++c)
        samples.emplace_back( dlib::colm( m, c ));
    return samples;
}

inline std::vector<double> row_values( const dlib::matrix<double> &m, long r )
{
    std::vector<double> values;
    values.reserve( static_cast<size_t>( m.nc()));
    for (long c = 0; c < m.nc(); ++c)
        values.push_back( m( r, c ));
    return values;
}

inline bool all_finite( const dlib::matrix<double> &m )
{
    for (long r = 0; r < m.nr(); ++r)
        for (long c = 0; c < m.nc(); ++c)
            if ( !std::isfinite( m( r, c )))
                return false;
    return true;
}

template<typename Writer>
inline void write_csv( const dlib::matrix<double> &m, Writer &&out )
{
    for (long r = 0; r < m.nr(); ++r)
        out( io::join2string( row_values( m, r ), "," ));
}

}
#endif //DIFFUSION_FEATURES_DLIB_UTILITIES_HPP
