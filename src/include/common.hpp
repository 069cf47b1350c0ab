#ifndef DIFFUSION_FEATURES_COMMON_HPP
#define DIFFUSION_FEATURES_COMMON_HPP

// STL containers
#include <vector>
#include <array>
#include <numeric>
#include <string>
#include <string_view>
#include <map>
#include <unordered_map>
#include <set>
#include <tuple>
#include <optional>
#include <iterator>

// STL streaming
#include <iostream>
#include <sstream>
#include <fstream>

// STL misc
#include <algorithm>
#include <cmath>
#include <functional>
#include <random>
#include <limits>
#include <stdexcept>
#include <mutex>

#include <fmt/format.h>
#include <chrono>


template<typename I>
inline void normalize( I first, I last )
{
    double sum = 0;
    for (auto it = first; it != last; ++it)
        sum += *it;
    if ( sum <= 0 ) return;
    for (auto it = first; it != last; ++it)
        *it = *it / sum;
}

inline void normalize( std::vector<double> &vec )
{
    normalize( vec.begin(), vec.end());
}

template<typename I>
inline double mean( I first, I last )
{
    const auto n = std::distance( first, last );
    if ( n == 0 ) return 0;
    return std::accumulate( first, last, double( 0 )) / n;
}

template<typename I>
inline double variance( I first, I last )
{
    const auto n = std::distance( first, last );
    if ( n == 0 ) return 0;
    const double mu = mean( first, last );
    return std::accumulate( first, last, double( 0 ), [mu]( double acc, double val ) {
        return acc + (val - mu) * (val - mu);
    } ) / n;
}

/**
 * @brief Indices of a container ordered by a key, ties resolved by index.
 */
template<typename Key>
inline std::vector<size_t> argsort( size_t n, const Key &key, bool descending = false )
{
    std::vector<size_t> indices( n );
    std::iota( indices.begin(), indices.end(), size_t( 0 ));
    std::stable_sort( indices.begin(), indices.end(), [&]( size_t a, size_t b ) {
        return descending ? key( a ) > key( b ) : key( a ) < key( b );
    } );
    return indices;
}

namespace io {

    inline auto split( const std::string &s, char delim )
    {
        std::stringstream ss( s );
        std::vector<std::string> tokens;
        std::string token;
        while (std::getline( ss, token, delim ))
            tokens.push_back( token );
        return tokens;
    }

    template<typename SeqIt>
    inline std::string join( SeqIt first, SeqIt last, const std::string &sep )
    {
        auto binaryJoinString = [sep]( std::string &a, std::string_view b ) -> std::string & {
            return a.append((a.empty()) ? "" : sep ).append( b );
        };
        return std::accumulate( first, last,
                                std::string(), binaryJoinString );
    }

    template<typename Container = std::vector<std::string >>
    inline std::string join( const Container &container,
                             const std::string &sep )
    {
        return join( container.cbegin(), container.cend(), sep );
    }

// trim from start (in place)
    inline void ltrim( std::string &s, const std::string &trimmed )
    {
        s.erase( s.begin(), std::find_if( s.begin(), s.end(), [trimmed]( int ch ) {
            return trimmed.find( ch ) == std::string::npos;
        } ));
    }

// trim from end (in place)
    inline void rtrim( std::string &s, const std::string &trimmed )
    {
        s.erase( std::find_if( s.rbegin(), s.rend(), [trimmed]( int ch ) {
            return trimmed.find( ch ) == std::string::npos;
        } ).base(), s.end());
    }

// trim from both ends (in place)
    inline void trim( std::string &s, const std::string &trimmed = " \t\r\n" )
    {
        ltrim( s, trimmed );
        rtrim( s, trimmed );
    }

    inline std::string trim_copy( std::string s, const std::string &trimmed = " \t\r\n" )
    {
        trim( s, trimmed );
        return s;
    }

    template<typename SeqIt>
    inline std::vector<std::string> asStringsVector( SeqIt firstIt, SeqIt lastIt )
    {
        std::vector<std::string> stringified;
        std::transform( firstIt, lastIt, std::back_inserter( stringified ),
                        []( const auto &element ) { return fmt::format( "{}", element ); } );
        return stringified;
    }

    template<typename Container>
    inline std::string join2string( const Container &container, const std::string &sep )
    {
        auto s = asStringsVector( container.cbegin(), container.cend());
        return join( s, sep );
    }
}

template<typename K, typename V>
inline std::vector<K> keys( const std::map<K, V> &m )
{
    std::vector<K> ks;
    for (auto &[k, v] : m)
        ks.push_back( k );
    return ks;
}

#endif // DIFFUSION_FEATURES_COMMON_HPP
