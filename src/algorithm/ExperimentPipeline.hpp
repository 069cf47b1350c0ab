#ifndef DIFFUSION_FEATURES_EXPERIMENTPIPELINE_HPP
#define DIFFUSION_FEATURES_EXPERIMENTPIPELINE_HPP

#include "DFDefs.hpp"
#include "LabeledDataset.hpp"
#include "DistanceTable.hpp"
#include "DiffusionMap.hpp"
#include "FeatureSelection.hpp"
#include "BaselineSelection.hpp"
#include "ResultsStore.hpp"

namespace DF {

struct ExperimentConfiguration
{
    size_t kFolds = 5;
    std::vector<double> featuresPercentage{0.02, 0.05, 0.1, 0.2, 0.3};
    std::vector<DistanceEnum> distances{DistanceEnum::Wasserstein,
                                        DistanceEnum::JeffriesMatusita,
                                        DistanceEnum::Hellinger};
    std::vector<size_t> dmDims{2};
    double alpha = 1.0;
    EpsilonEnum epsType = EpsilonEnum::MaxMin;
    std::vector<double> epsFactors{10, 100};
    std::vector<SelectionEnum> strategies{SelectionEnum::RankByAxis,
                                          SelectionEnum::FarthestFromOrigin,
                                          SelectionEnum::KMeansNearestToRank,
                                          SelectionEnum::KMedoidsExactCenter};
    std::vector<BaselineEnum> baselines{BaselineEnum::Random,
                                        BaselineEnum::Fisher,
                                        BaselineEnum::ChiSquare,
                                        BaselineEnum::ReliefF,
                                        BaselineEnum::MRMR};
    unsigned long randomState = 0;
    std::optional<size_t> nRows;
    size_t nBins = DefaultBins;
    size_t nTrees = 100;
    size_t nThreads = 1;
    bool verbose = false;
    std::string workDir = "results";
};

/**
 * @brief Score of one method on one validation fold.
 */
struct ResultRecord
{
    std::string method;
    size_t fold = 0;
    double accuracy = 0;
    double f1 = 0;
    double timeMs = 0;
    size_t selected = 0;
};

/**
 * @brief Cross-validated comparison of the diffusion-map selections against
 * the all-features reference and the configured baselines.
 */
class ExperimentPipeline
{
public:
    explicit ExperimentPipeline( ExperimentConfiguration configuration );

    /**
     * @brief Load `filePath`, name the dataset after the file stem and store
     * the summaries under the configured working directory.
     */
    std::vector<MethodSummary> run( const std::string &filePath, const std::string &labelColumn ) const;

    std::vector<MethodSummary> run( const LabeledDataset &dataset,
                                    const std::string &datasetName,
                                    ResultsStore &store ) const;

    static std::string methodLabel( DistanceEnum distance, double epsFactor, SelectionEnum strategy );

    const ExperimentConfiguration &configuration() const
    {
        return _configuration;
    }

private:
    void _validate() const;

    std::vector<ResultRecord> _embedAndScore( const LabeledDataset &training,
                                              const LabeledDataset &validation,
                                              const DistanceTable &table,
                                              double tableTimeMs,
                                              size_t fold,
                                              double epsFactor,
                                              size_t k,
                                              size_t dmDim ) const;

    ExperimentConfiguration _configuration;
};

}

#endif //DIFFUSION_FEATURES_EXPERIMENTPIPELINE_HPP
