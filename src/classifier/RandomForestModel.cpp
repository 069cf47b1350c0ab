#include "RandomForestModel.hpp"
#include "ConfusionMatrix.hpp"
#include "dlib_utilities.hpp"

namespace DF {

RandomForestModel::RandomForestModel( RandomForestConfiguration config )
        : _config( config )
{
}

void RandomForestModel::fit( const std::vector<ClassLabel> &labels,
                             const std::vector<std::vector<double >> &samples )
{
    if ( labels.size() != samples.size() || labels.empty())
        throw std::runtime_error( fmt::format( "Bad training: {} labels for {} samples",
                                               labels.size(), samples.size()));

    auto numericLabels = _registerLabels( labels );
    _decisionFunction.reset();
    _singleLabel.reset();
    if ( _label2Index.size() == 1 )
    {
        _singleLabel = _label2Index.cbegin()->first;
        return;
    }

    std::vector<SampleType> dlibSamples;
    dlibSamples.reserve( samples.size());
    for (auto &s : samples)
        dlibSamples.emplace_back( dlib_utilities::to_column_vector( s ));

    _decisionFunction = _fit( std::move( numericLabels ), std::move( dlibSamples ));
}

ClassLabel RandomForestModel::predict( const std::vector<double> &sample ) const
{
    if ( _singleLabel )
        return _singleLabel.value();
    if ( !_decisionFunction )
        throw std::runtime_error( "Prediction requested before fitting" );
    return _index2Label.at( _decisionFunction.value()( dlib_utilities::to_column_vector( sample )));
}

std::vector<RandomForestModel::Label> RandomForestModel::_registerLabels( const std::vector<ClassLabel> &labels )
{
    _label2Index.clear();
    _index2Label.clear();
    const std::set<ClassLabel> unique( labels.cbegin(), labels.cend());

    Label i = 0;
    for (auto &label : unique)
    {
        _label2Index.emplace( label, i );
        _index2Label.emplace( i, label );
        ++i;
    }

    std::vector<Label> dlibLabels;
    for (auto &label : labels)
        dlibLabels.push_back( _label2Index.at( label ));
    return dlibLabels;
}

RandomForestModel::DecisionFunction RandomForestModel::_fit( std::vector<Label> &&labels,
                                                             std::vector<SampleType> &&samples ) const
{
    RFTrainer btrainer;
    btrainer.set_num_trees( _config.nTrees );
    btrainer.set_seed( fmt::format( "random forest {}", _config.seed ));

    OneVsAllTrainer trainer;
    trainer.set_trainer( btrainer );
    trainer.set_num_threads( 1 );
    return trainer.train( samples, labels );
}

SubsetScore scoreSubset( const LabeledDataset &training,
                         const LabeledDataset &validation,
                         const std::vector<FeatureIndex> &features,
                         const RandomForestConfiguration &configuration )
{
    const auto train = training.selectFeatures( features );
    const auto test = validation.selectFeatures( features );

    std::vector<std::vector<double >> samples;
    for (size_t r = 0; r < train.nRows(); ++r)
        samples.push_back( train.row( r ));

    RandomForestModel model( configuration );
    model.fit( train.labels(), samples );

    std::set<ClassLabel> labels( training.labels().cbegin(), training.labels().cend());
    labels.insert( validation.labels().cbegin(), validation.labels().cend());
    ConfusionMatrix<ClassLabel> confusion( labels );
    for (size_t r = 0; r < test.nRows(); ++r)
        confusion.countInstance( model.predict( test.row( r )), test.labels()[r] );

    return {confusion.overallAccuracy(), confusion.macroFScore()};
}

}
