#ifndef DIFFUSION_FEATURES_LABELEDDATASET_HPP
#define DIFFUSION_FEATURES_LABELEDDATASET_HPP

#include "DFDefs.hpp"

namespace DF {

/**
 * @brief Tabular dataset held column-wise: one vector of values per feature
 * and a parallel vector of class labels. Instances are never mutated after
 * construction; row and feature subsets produce new datasets.
 */
class LabeledDataset
{
public:
    using Column = std::vector<double>;

    LabeledDataset() = default;

    LabeledDataset( std::vector<std::string> featureNames,
                    std::vector<Column> columns,
                    std::vector<ClassLabel> labels );

    static LabeledDataset loadCSV( const std::string &filePath,
                                   const std::string &labelColumn,
                                   std::optional<size_t> nRows = std::nullopt );

    LabeledDataset subset( const std::vector<size_t> &rows ) const;

    LabeledDataset selectFeatures( const std::vector<FeatureIndex> &features ) const;

    /**
     * @brief Sorted unique labels. The order is the class order of every
     * class-pairwise distance matrix.
     */
    std::vector<ClassLabel> classes() const;

    std::map<ClassLabel, size_t> labelDistribution() const;

    std::vector<double> row( size_t r ) const;

    inline size_t nRows() const
    {
        return _labels.size();
    }

    inline size_t nFeatures() const
    {
        return _columns.size();
    }

    inline std::pair<size_t, size_t> shape() const
    {
        return {nRows(), nFeatures()};
    }

    inline const std::vector<Column> &columns() const
    {
        return _columns;
    }

    inline const Column &column( FeatureIndex f ) const
    {
        return _columns.at( f );
    }

    inline const std::vector<std::string> &featureNames() const
    {
        return _featureNames;
    }

    inline const std::vector<ClassLabel> &labels() const
    {
        return _labels;
    }

private:
    std::vector<std::string> _featureNames;
    std::vector<Column> _columns;
    std::vector<ClassLabel> _labels;
};
}

#endif //DIFFUSION_FEATURES_LABELEDDATASET_HPP
