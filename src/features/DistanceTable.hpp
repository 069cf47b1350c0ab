#ifndef DIFFUSION_FEATURES_DISTANCETABLE_HPP
#define DIFFUSION_FEATURES_DISTANCETABLE_HPP

#include <dlib/matrix.h>

#include "ClassDistances.hpp"
#include "LabeledDataset.hpp"

namespace DF {

struct DistanceTable
{
    DistanceEnum distance;
    std::vector<ClassLabel> classes;
    std::vector<std::string> featureNames;

    // N x C*C, row f is the row-major flattening of the class-pair matrix of feature f.
    dlib::matrix<double> flattened;

    // C x C class-pair matrix of every feature, kept for heatmap rendering.
    std::map<std::string, dlib::matrix<double>> classPairs;

    inline size_t nFeatures() const
    {
        return static_cast<size_t>( flattened.nr());
    }
};

/**
 * @brief C x C matrix of distances between the values of one feature under
 * every pair of classes. Each unordered pair is computed once and mirrored,
 * the diagonal is 0. A class absent from `labels` has an empty sample and
 * its distances are 0.
 */
dlib::matrix<double> classPairDistances( const std::vector<double> &column,
                                         const std::vector<ClassLabel> &labels,
                                         const std::vector<ClassLabel> &classes,
                                         DistanceEnum distance,
                                         size_t nBins = DefaultBins );

DistanceTable buildDistanceTable( const std::vector<std::vector<double >> &columns,
                                  const std::vector<std::string> &featureNames,
                                  const std::vector<ClassLabel> &labels,
                                  const std::vector<ClassLabel> &classes,
                                  DistanceEnum distance,
                                  size_t nBins = DefaultBins );

DistanceTable buildDistanceTable( const LabeledDataset &dataset,
                                  DistanceEnum distance,
                                  size_t nBins = DefaultBins );

/**
 * @brief Table over an explicit class set, so that row subsets of one dataset
 * share the same C x C layout even when a class has no row in the subset.
 */
DistanceTable buildDistanceTable( const LabeledDataset &dataset,
                                  const std::vector<ClassLabel> &classes,
                                  DistanceEnum distance,
                                  size_t nBins = DefaultBins );

}

#endif //DIFFUSION_FEATURES_DISTANCETABLE_HPP
