#include "DistanceTable.hpp"

namespace DF {

static std::vector<Sample> classSamples( const std::vector<double> &column,
                                         const std::vector<ClassLabel> &labels,
                                         const std::vector<ClassLabel> &classes )
{
    std::map<std::string_view, size_t> classIndex;
    for (size_t c = 0; c < classes.size(); ++c)
        classIndex.emplace( classes[c], c );

    std::vector<Sample> samples( classes.size());
    for (size_t r = 0; r < column.size(); ++r)
        if ( auto it = classIndex.find( labels[r] ); it != classIndex.cend())
            samples[it->second].push_back( column[r] );
    return samples;
}

dlib::matrix<double> classPairDistances( const std::vector<double> &column,
                                         const std::vector<ClassLabel> &labels,
                                         const std::vector<ClassLabel> &classes,
                                         DistanceEnum distance,
                                         size_t nBins )
{
    if ( column.size() != labels.size())
        throw InvalidConfiguration( fmt::format( "Feature has {} values for {} labels",
                                                 column.size(), labels.size()));

    const auto measure = distanceFunction( distance );
    const auto samples = classSamples( column, labels, classes );
    const long nClasses = static_cast<long>( classes.size());

    dlib::matrix<double> m = dlib::zeros_matrix<double>( nClasses, nClasses );
    for (long i = 0; i < nClasses; ++i)
        for (long j = i + 1; j < nClasses; ++j)
        {
            const double d = measure( samples[i], samples[j], nBins );
            m( i, j ) = d;
            m( j, i ) = d;
        }
    return m;
}

DistanceTable buildDistanceTable( const std::vector<std::vector<double >> &columns,
                                  const std::vector<std::string> &featureNames,
                                  const std::vector<ClassLabel> &labels,
                                  const std::vector<ClassLabel> &classes,
                                  DistanceEnum distance,
                                  size_t nBins )
{
    if ( columns.size() != featureNames.size())
        throw InvalidConfiguration( fmt::format( "{} columns for {} feature names",
                                                 columns.size(), featureNames.size()));

    const long nFeatures = static_cast<long>( columns.size());
    const long nClasses = static_cast<long>( classes.size());

    DistanceTable table;
    table.distance = distance;
    table.classes = classes;
    table.featureNames = featureNames;
    table.flattened.set_size( nFeatures, nClasses * nClasses );

    for (long f = 0; f < nFeatures; ++f)
    {
        auto m = classPairDistances( columns[f], labels, classes, distance, nBins );
        for (long i = 0; i < nClasses; ++i)
            for (long j = 0; j < nClasses; ++j)
                table.flattened( f, i * nClasses + j ) = m( i, j );
        table.classPairs.emplace( featureNames[f], std::move( m ));
    }
    return table;
}

DistanceTable buildDistanceTable( const LabeledDataset &dataset,
                                  DistanceEnum distance,
                                  size_t nBins )
{
    return buildDistanceTable( dataset, dataset.classes(), distance, nBins );
}

DistanceTable buildDistanceTable( const LabeledDataset &dataset,
                                  const std::vector<ClassLabel> &classes,
                                  DistanceEnum distance,
                                  size_t nBins )
{
    return buildDistanceTable( dataset.columns(), dataset.featureNames(), dataset.labels(),
                               classes, distance, nBins );
}

}
