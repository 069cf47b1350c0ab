#ifndef DIFFUSION_FEATURES_TEST_FIXTURES_HPP
#define DIFFUSION_FEATURES_TEST_FIXTURES_HPP

#include <filesystem>

#include "LabeledDataset.hpp"

namespace DF::fixtures {

/**
 * @brief Two classes "a" and "b" with `rowsPerClass` rows each. Feature f holds
 * the same evenly spread values under both classes, shifted by shifts[f] under "b",
 * so that its Wasserstein distance between the classes is exactly shifts[f].
 */
inline LabeledDataset shiftedDataset( const std::vector<double> &shifts, size_t rowsPerClass = 10 )
{
    std::vector<std::string> names;
    std::vector<LabeledDataset::Column> columns;
    std::vector<ClassLabel> labels;
    for (size_t r = 0; r < 2 * rowsPerClass; ++r)
        labels.push_back( r < rowsPerClass ? "a" : "b" );

    for (size_t f = 0; f < shifts.size(); ++f)
    {
        names.push_back( fmt::format( "f{}", f ));
        LabeledDataset::Column column;
        for (size_t r = 0; r < 2 * rowsPerClass; ++r)
        {
            const double base = 0.1 * (r % rowsPerClass);
            column.push_back( r < rowsPerClass ? base : base + shifts[f] );
        }
        columns.push_back( std::move( column ));
    }
    return LabeledDataset( std::move( names ), std::move( columns ), std::move( labels ));
}

inline std::filesystem::path scratchDirectory( const std::string &name )
{
    auto dir = std::filesystem::temp_directory_path() / fmt::format( "diffusion_features_{}", name );
    std::filesystem::remove_all( dir );
    std::filesystem::create_directories( dir );
    return dir;
}

inline std::vector<std::string> readLines( const std::filesystem::path &path )
{
    std::ifstream in( path );
    std::vector<std::string> lines;
    std::string line;
    while (std::getline( in, line ))
        lines.push_back( line );
    return lines;
}

}

#endif //DIFFUSION_FEATURES_TEST_FIXTURES_HPP
