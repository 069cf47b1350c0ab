#include "LabeledDataset.hpp"

namespace DF {

LabeledDataset::LabeledDataset( std::vector<std::string> featureNames,
                                std::vector<Column> columns,
                                std::vector<ClassLabel> labels )
        : _featureNames( std::move( featureNames )),
          _columns( std::move( columns )),
          _labels( std::move( labels ))
{
    if ( _featureNames.size() != _columns.size())
        throw std::runtime_error( fmt::format( "Feature names ({}) and columns ({}) mismatch",
                                               _featureNames.size(), _columns.size()));
    for (size_t f = 0; f < _columns.size(); ++f)
        if ( _columns[f].size() != _labels.size())
            throw std::runtime_error( fmt::format( "Feature {} has {} values for {} labels",
                                                   _featureNames[f], _columns[f].size(), _labels.size()));
}

static double parseCell( const std::string &cell, size_t line, const std::string &column )
{
    try
    {
        size_t consumed = 0;
        const double value = std::stod( cell, &consumed );
        if ( consumed == cell.size() && std::isfinite( value ))
            return value;
    } catch ( const std::logic_error & )
    {}
    throw std::runtime_error( fmt::format( "Non numeric value '{}' at line {} of column {}", cell, line, column ));
}

LabeledDataset LabeledDataset::loadCSV( const std::string &filePath,
                                        const std::string &labelColumn,
                                        std::optional<size_t> nRows )
{
    std::ifstream f( filePath );
    if ( !f )
        throw std::runtime_error( fmt::format( "Failed to open file:{}", filePath ));

    std::string line;
    if ( !std::getline( f, line ))
        throw std::runtime_error( fmt::format( "Empty file:{}", filePath ));

    auto header = io::split( io::trim_copy( line ), ',' );
    for (auto &h : header) io::trim( h, " \t\r\n\"" );

    auto labelIt = std::find( header.cbegin(), header.cend(), labelColumn );
    if ( labelIt == header.cend())
        throw std::runtime_error( fmt::format( "Label column '{}' not found in {}", labelColumn, filePath ));
    const size_t labelIdx = std::distance( header.cbegin(), labelIt );

    std::vector<std::string> names;
    std::set<std::string> uniqueNames;
    for (size_t c = 0; c < header.size(); ++c)
    {
        if ( c == labelIdx ) continue;
        if ( !uniqueNames.insert( header[c] ).second )
            throw std::runtime_error( fmt::format( "Duplicate column '{}' in {}", header[c], filePath ));
        names.push_back( header[c] );
    }

    std::vector<Column> columns( names.size());
    std::vector<ClassLabel> labels;
    size_t lineNumber = 1;
    while ((!nRows || labels.size() < nRows.value()) && std::getline( f, line ))
    {
        ++lineNumber;
        io::trim( line );
        if ( line.empty()) continue;
        auto cells = io::split( line, ',' );
        if ( cells.size() != header.size())
            throw std::runtime_error( fmt::format( "Line {} has {} cells, expected {}",
                                                   lineNumber, cells.size(), header.size()));
        size_t feature = 0;
        for (size_t c = 0; c < cells.size(); ++c)
        {
            io::trim( cells[c], " \t\r\n\"" );
            if ( c == labelIdx )
                labels.push_back( cells[c] );
            else
            {
                columns[feature].push_back( parseCell( cells[c], lineNumber, names[feature] ));
                ++feature;
            }
        }
    }
    return LabeledDataset( std::move( names ), std::move( columns ), std::move( labels ));
}

LabeledDataset LabeledDataset::subset( const std::vector<size_t> &rows ) const
{
    std::vector<Column> columns( _columns.size());
    std::vector<ClassLabel> labels;
    labels.reserve( rows.size());
    for (auto r : rows)
        labels.push_back( _labels.at( r ));
    for (size_t f = 0; f < _columns.size(); ++f)
    {
        columns[f].reserve( rows.size());
        for (auto r : rows)
            columns[f].push_back( _columns[f].at( r ));
    }
    return LabeledDataset( _featureNames, std::move( columns ), std::move( labels ));
}

LabeledDataset LabeledDataset::selectFeatures( const std::vector<FeatureIndex> &features ) const
{
    std::vector<std::string> names;
    std::vector<Column> columns;
    for (auto f : features)
    {
        names.push_back( _featureNames.at( f ));
        columns.push_back( _columns.at( f ));
    }
    return LabeledDataset( std::move( names ), std::move( columns ), _labels );
}

std::vector<ClassLabel> LabeledDataset::classes() const
{
    std::set<ClassLabel> unique( _labels.cbegin(), _labels.cend());
    return std::vector<ClassLabel>( unique.cbegin(), unique.cend());
}

std::map<ClassLabel, size_t> LabeledDataset::labelDistribution() const
{
    std::map<ClassLabel, size_t> counts;
    for (auto &l : _labels)
        ++counts[l];
    return counts;
}

std::vector<double> LabeledDataset::row( size_t r ) const
{
    std::vector<double> values;
    values.reserve( _columns.size());
    for (auto &c : _columns)
        values.push_back( c.at( r ));
    return values;
}
}
