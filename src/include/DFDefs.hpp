#ifndef DIFFUSION_FEATURES_DFDEFS_HPP
#define DIFFUSION_FEATURES_DFDEFS_HPP

#include "common.hpp"

namespace DF {
using FeatureIndex = size_t;
using ClassLabel = std::string;

constexpr double eps = std::numeric_limits<double>::epsilon();
constexpr double nan = std::numeric_limits<double>::quiet_NaN();
constexpr double inf = std::numeric_limits<double>::infinity();

/**
 * @brief Raised at the boundary of the public functions for parameters
 * that cannot be executed (k out of range, unknown metric or strategy names...).
 */
class InvalidConfiguration : public std::runtime_error
{
public:
    explicit InvalidConfiguration( const std::string &what )
            : std::runtime_error( what )
    {}
};

template<typename Enum>
Enum enumFromLabel( const std::map<std::string, Enum> &labels,
                    const std::string &label,
                    std::string_view kind )
{
    if ( auto it = labels.find( label ); it != labels.cend())
        return it->second;
    else
        throw InvalidConfiguration( fmt::format( "Unsupported {}:{} (supported:{})",
                                                 kind, label, io::join( keys( labels ), "|" )));
}

template<typename Enum>
std::string labelFromEnum( const std::map<std::string, Enum> &labels, Enum e )
{
    for (auto &[label, value] : labels)
        if ( value == e ) return label;
    throw std::runtime_error( "Unlabeled enumeration value" );
}
}

#endif //DIFFUSION_FEATURES_DFDEFS_HPP
