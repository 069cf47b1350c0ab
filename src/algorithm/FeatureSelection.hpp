#ifndef DIFFUSION_FEATURES_FEATURESELECTION_HPP
#define DIFFUSION_FEATURES_FEATURESELECTION_HPP

#include <dlib/matrix.h>

#include "DFDefs.hpp"

namespace DF {

enum class SelectionEnum
{
    RankByAxis,
    FarthestFromOrigin,
    KMeansNearestToRank,
    KMedoidsExactCenter
};

const std::map<std::string, SelectionEnum> SelectionLabels{
        {"rank",     SelectionEnum::RankByAxis},
        {"farthest", SelectionEnum::FarthestFromOrigin},
        {"kmeans",   SelectionEnum::KMeansNearestToRank},
        {"kmedoids", SelectionEnum::KMedoidsExactCenter}
};

/**
 * @brief Selected feature indices. Clustering strategies may return fewer
 * indices than requested when the embedding has fewer distinct points or
 * clusters than k; such selections are reported as underfilled, not padded.
 */
struct FeatureSelection
{
    SelectionEnum strategy;
    size_t requested = 0;
    std::vector<FeatureIndex> indices;

    inline bool underfilled() const
    {
        return indices.size() < requested;
    }
};

/**
 * @brief Throws InvalidConfiguration unless 1 <= k < nFeatures.
 */
void validateFeatureCount( size_t k, size_t nFeatures );

std::vector<FeatureIndex> rankByAxis( const dlib::matrix<double> &coordinates, size_t k );

std::vector<FeatureIndex> farthestFromOrigin( const dlib::matrix<double> &coordinates, size_t k );

std::vector<FeatureIndex> kMeansNearestToRank( const dlib::matrix<double> &coordinates, size_t k,
                                               unsigned long seed );

std::vector<FeatureIndex> kMedoidsExactCenter( const dlib::matrix<double> &coordinates, size_t k,
                                               unsigned long seed );

/**
 * @brief Select k features from d x N embedding coordinates.
 */
FeatureSelection selectFeatures( const dlib::matrix<double> &coordinates,
                                 size_t k,
                                 SelectionEnum strategy,
                                 unsigned long seed = 0 );

inline SelectionEnum selectionFromLabel( const std::string &label )
{
    return enumFromLabel( SelectionLabels, label, "selection strategy" );
}

inline std::string selectionLabel( SelectionEnum strategy )
{
    return labelFromEnum( SelectionLabels, strategy );
}

}

#endif //DIFFUSION_FEATURES_FEATURESELECTION_HPP
