#ifndef DIFFUSION_FEATURES_BASELINESELECTION_HPP
#define DIFFUSION_FEATURES_BASELINESELECTION_HPP

#include "LabeledDataset.hpp"

namespace DF {

enum class BaselineEnum
{
    Random,
    Fisher,
    ChiSquare,
    ReliefF,
    MRMR
};

const std::map<std::string, BaselineEnum> BaselineLabels{
        {"random_features", BaselineEnum::Random},
        {"fisher",          BaselineEnum::Fisher},
        {"chi_square",      BaselineEnum::ChiSquare},
        {"relief",          BaselineEnum::ReliefF},
        {"mrmr",            BaselineEnum::MRMR}
};

constexpr size_t ReliefNeighbours = 10;
constexpr size_t MRMRBins = 10;

std::vector<FeatureIndex> allFeatures( size_t nFeatures );

/**
 * @brief k distinct feature indices drawn uniformly with a seeded engine, ascending.
 */
std::vector<FeatureIndex> randomFeatures( size_t nFeatures, size_t k, unsigned long seed );

/**
 * @brief Fisher score of every feature:
 * sum_c n_c (mu_c - mu)^2 / sum_c n_c sigma_c^2, 0 for a null within-class variance.
 */
std::vector<double> fisherScores( const LabeledDataset &dataset );

std::vector<FeatureIndex> fisherRanks( const LabeledDataset &dataset, size_t k );

/**
 * @brief Chi-square statistic of every feature scaled to [0,1]: the per class sums
 * of the feature against their expectation under the class priors.
 * A constant feature scores 0.
 */
std::vector<double> chiSquareScores( const LabeledDataset &dataset );

std::vector<FeatureIndex> chiSquareRanks( const LabeledDataset &dataset, size_t k );

/**
 * @brief ReliefF weights on [0,1] scaled features with Manhattan distances.
 * Every row is an instance; hits and misses are its nNeighbours nearest rows
 * of each class, misses weighted by the class priors.
 */
std::vector<double> reliefFScores( const LabeledDataset &dataset, size_t nNeighbours = ReliefNeighbours );

std::vector<FeatureIndex> reliefFRanks( const LabeledDataset &dataset, size_t k,
                                        size_t nNeighbours = ReliefNeighbours );

/**
 * @brief Minimum redundancy maximum relevance, difference form, on features
 * discretized in nBins equal-width bins. Indices come in selection order.
 */
std::vector<FeatureIndex> mrmrRanks( const LabeledDataset &dataset, size_t k, size_t nBins = MRMRBins );

std::vector<FeatureIndex> selectBaseline( BaselineEnum baseline,
                                          const LabeledDataset &training,
                                          size_t k,
                                          unsigned long seed );

inline BaselineEnum baselineFromLabel( const std::string &label )
{
    return enumFromLabel( BaselineLabels, label, "baseline" );
}

inline std::string baselineLabel( BaselineEnum baseline )
{
    return labelFromEnum( BaselineLabels, baseline );
}

}

#endif //DIFFUSION_FEATURES_BASELINESELECTION_HPP
