#ifndef DIFFUSION_FEATURES_RANDOMFORESTMODEL_HPP
#define DIFFUSION_FEATURES_RANDOMFORESTMODEL_HPP

// dlib
#include <dlib/random_forest.h>
#include <dlib/svm.h>
#include <dlib/svm_threaded.h>

// local
#include "DFDefs.hpp"
#include "LabeledDataset.hpp"

namespace DF {

struct RandomForestConfiguration
{
    size_t nTrees = 100;
    unsigned long seed = 0;
};

struct SubsetScore
{
    double accuracy = 0;
    double f1 = 0;
};

/**
 * @brief Random forest classifier, one forest per class in a one-vs-all setting.
 */
class RandomForestModel
{
    using SampleType = dlib::matrix<double, 0, 1>;
    using Label = double;
    using FeatureExtractor = dlib::dense_feature_extractor;
    using RFTrainer = dlib::random_forest_regression_trainer<FeatureExtractor>;
    using OneVsAllTrainer = dlib::one_vs_all_trainer<dlib::any_trainer<SampleType>, Label>;
    using DecisionFunction = OneVsAllTrainer::trained_function_type;

public:
    explicit RandomForestModel( RandomForestConfiguration config );

    virtual ~RandomForestModel() = default;

    void fit( const std::vector<ClassLabel> &labels,
              const std::vector<std::vector<double >> &samples );

    ClassLabel predict( const std::vector<double> &sample ) const;

private:
    DecisionFunction _fit( std::vector<Label> &&labels,
                           std::vector<SampleType> &&samples ) const;

    std::vector<Label> _registerLabels( const std::vector<ClassLabel> &labels );

private:
    RandomForestConfiguration _config;
    std::map<ClassLabel, Label> _label2Index;
    std::map<Label, ClassLabel> _index2Label;
    std::optional<DecisionFunction> _decisionFunction;
    std::optional<ClassLabel> _singleLabel;
};

/**
 * @brief Fit on the training rows restricted to `features` and score the
 * predictions on the validation rows.
 */
SubsetScore scoreSubset( const LabeledDataset &training,
                         const LabeledDataset &validation,
                         const std::vector<FeatureIndex> &features,
                         const RandomForestConfiguration &configuration );

}

#endif //DIFFUSION_FEATURES_RANDOMFORESTMODEL_HPP
