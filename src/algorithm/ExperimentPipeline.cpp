#include <dlib/threads.h>

#include "ExperimentPipeline.hpp"
#include "BaselineSelection.hpp"
#include "RandomForestModel.hpp"
#include "crossvalidation.hpp"
#include "Timers.hpp"

namespace DF {

namespace {

struct FoldData
{
    LabeledDataset training;
    LabeledDataset validation;
};

struct TableJob
{
    std::optional<DistanceTable> table;
    double timeMs = 0;
};

}

ExperimentPipeline::ExperimentPipeline( ExperimentConfiguration configuration )
        : _configuration( std::move( configuration ))
{
    _validate();
}

void ExperimentPipeline::_validate() const
{
    const auto &c = _configuration;
    if ( c.kFolds < 2 )
        throw InvalidConfiguration( fmt::format( "k-fold needs at least 2 folds, given:{}", c.kFolds ));
    for (auto pct : c.featuresPercentage)
        if ( !(pct > 0 && pct <= 1))
            throw InvalidConfiguration( fmt::format( "Features percentage out of (0,1]:{}", pct ));
    for (auto d : c.dmDims)
        if ( d < 1 )
            throw InvalidConfiguration( "Diffusion map dimension must be at least 1" );
    if ( !(c.alpha >= 0 && c.alpha <= 1))
        throw InvalidConfiguration( fmt::format( "alpha out of [0,1]:{}", c.alpha ));
    for (auto f : c.epsFactors)
        if ( !(f > 0) || !std::isfinite( f ))
            throw InvalidConfiguration( fmt::format( "Non-positive epsilon factor:{}", f ));
    if ( c.nBins < 1 || c.nTrees < 1 || c.nThreads < 1 )
        throw InvalidConfiguration( "Bins, trees and threads must be positive" );
}

std::string ExperimentPipeline::methodLabel( DistanceEnum distance, double epsFactor, SelectionEnum strategy )
{
    return fmt::format( "{}_eps{}_{}", distanceLabel( distance ), epsFactor, selectionLabel( strategy ));
}

std::vector<MethodSummary> ExperimentPipeline::run( const std::string &filePath,
                                                    const std::string &labelColumn ) const
{
    const auto dataset = LabeledDataset::loadCSV( filePath, labelColumn, _configuration.nRows );
    const auto datasetName = std::filesystem::path( filePath ).stem().string();
    ResultsStore store( _configuration.workDir, datasetName );
    fmt::print( "[Results][path:{}]\n", store.path());
    return run( dataset, datasetName, store );
}

std::vector<ResultRecord> ExperimentPipeline::_embedAndScore( const LabeledDataset &training,
                                                              const LabeledDataset &validation,
                                                              const DistanceTable &table,
                                                              double tableTimeMs,
                                                              size_t fold,
                                                              double epsFactor,
                                                              size_t k,
                                                              size_t dmDim ) const
{
    const auto &c = _configuration;
    const RandomForestConfiguration forest{c.nTrees, c.randomState};

    const auto timedEmbedding = Timers::timed_invoke_ms( [&]() {
        return DiffusionMap( {c.alpha, c.epsType, epsFactor, dmDim} ).embed( table.flattened );
    } );
    const auto &embedding = timedEmbedding.first;
    const double embedTimeMs = timedEmbedding.second;

    if ( c.verbose )
        fmt::print( "[Embedding][fold:{}][metric:{}][eps:{}][lambdas:{}]\n",
                    fold, distanceLabel( table.distance ), embedding.epsilon,
                    io::join2string( embedding.eigenvalues, "," ));

    std::vector<ResultRecord> records;
    for (auto strategy : c.strategies)
    {
        const auto method = methodLabel( table.distance, epsFactor, strategy );
        auto[selection, selectionTimeMs] = Timers::timed_invoke_ms( [&]() {
            return selectFeatures( embedding.coordinates, k, strategy, c.randomState );
        } );

        if ( selection.underfilled())
            fmt::print( stderr, "[Warning][Underfilled][method:{}][fold:{}][requested:{}][selected:{}]\n",
                        method, fold, selection.requested, selection.indices.size());

        auto score = scoreSubset( training, validation, selection.indices, forest );
        records.push_back( {method, fold, score.accuracy, score.f1,
                            tableTimeMs + embedTimeMs + selectionTimeMs,
                            selection.indices.size()} );
    }
    return records;
}

std::vector<MethodSummary> ExperimentPipeline::run( const LabeledDataset &dataset,
                                                    const std::string &datasetName,
                                                    ResultsStore &store ) const
{
    const auto &c = _configuration;
    const size_t nFeatures = dataset.nFeatures();
    const RandomForestConfiguration forest{c.nTrees, c.randomState};

    fmt::print( "[Dataset][name:{}][rows:{}][features:{}]\n", datasetName, dataset.nRows(), nFeatures );
    for (auto &[label, count] : dataset.labelDistribution())
        fmt::print( "[Label][{}:{}]\n", label, count );

    const auto folds = kFoldStratifiedSplit( dataset.labels(), c.kFolds, c.randomState );
    std::vector<FoldData> foldData;
    for (size_t i = 0; i < folds.size(); ++i)
        foldData.push_back( {dataset.subset( trainingRows( folds, i )), dataset.subset( folds[i] )} );

    std::vector<ResultRecord> reference;
    Timers::tic( "all features" );
    for (size_t i = 0; i < foldData.size(); ++i)
    {
        auto[score, timeMs] = Timers::timed_invoke_ms( [&]() {
            return scoreSubset( foldData[i].training, foldData[i].validation, allFeatures( nFeatures ), forest );
        } );
        reference.push_back( {"all_features", i, score.accuracy, score.f1, timeMs, nFeatures} );
        if ( c.verbose )
            fmt::print( "[Fold:{}][all_features][accuracy:{}][f1:{}]\n", i, score.accuracy, score.f1 );
    }
    Timers::toc( "all features" );

    // Distance tables depend only on the training rows and the metric. The class
    // set is the dataset's, so every fold has the same table width.
    const auto classes = dataset.classes();
    const size_t nTables = foldData.size() * c.distances.size();
    std::vector<TableJob> tables( nTables );
    Timers::tic( "distance tables" );
    dlib::parallel_for( c.nThreads, 0, static_cast<long>( nTables ), [&]( long job ) {
        const size_t fold = static_cast<size_t>( job ) / c.distances.size();
        const auto distance = c.distances.at( static_cast<size_t>( job ) % c.distances.size());
        try
        {
            auto[table, timeMs] = Timers::timed_invoke_ms( [&]() {
                return buildDistanceTable( foldData[fold].training, classes, distance, c.nBins );
            } );
            tables[job].table = std::move( table );
            tables[job].timeMs = timeMs;
        }
        catch (const std::exception &e)
        {
            fmt::print( stderr, "[Warning][fold:{}][metric:{}][{}]\n", fold, distanceLabel( distance ), e.what());
        }
    } );
    Timers::toc( "distance tables" );
    Timers::report_ms( "distance tables" );

    std::vector<MethodSummary> summaries;
    for (auto pct : c.featuresPercentage)
    {
        for (auto dmDim : c.dmDims)
        {
            const auto k = static_cast<size_t>( std::floor( pct * nFeatures ));
            if ( k < 1 || k == nFeatures )
            {
                fmt::print( stderr, "[Warning][Skipped][pct:{}][k:{}][features:{}]\n", pct, k, nFeatures );
                continue;
            }
            fmt::print( "[Params][pct:{}][k:{}][dm_dim:{}]\n", pct, k, dmDim );

            std::vector<ResultRecord> records = reference;
            for (size_t i = 0; i < foldData.size(); ++i)
            {
                const auto &training = foldData[i].training;
                const auto &validation = foldData[i].validation;
                for (auto baseline : c.baselines)
                {
                    const auto method = baselineLabel( baseline );
                    try
                    {
                        auto[score, timeMs] = Timers::timed_invoke_ms( [&]() {
                            return scoreSubset( training, validation,
                                                selectBaseline( baseline, training, k, c.randomState ), forest );
                        } );
                        records.push_back( {method, i, score.accuracy, score.f1, timeMs, k} );
                    }
                    catch (const std::exception &e)
                    {
                        fmt::print( stderr, "[Warning][fold:{}][method:{}][k:{}][{}]\n", i, method, k, e.what());
                    }
                }
            }

            const size_t nJobs = nTables * c.epsFactors.size();
            std::vector<std::vector<ResultRecord >> jobRecords( nJobs );
            dlib::parallel_for( c.nThreads, 0, static_cast<long>( nJobs ), [&]( long job ) {
                const auto &tableJob = tables.at( static_cast<size_t>( job ) / c.epsFactors.size());
                const double epsFactor = c.epsFactors.at( static_cast<size_t>( job ) % c.epsFactors.size());
                const size_t fold = static_cast<size_t>( job ) / c.epsFactors.size() / c.distances.size();
                if ( !tableJob.table ) return;
                try
                {
                    jobRecords[job] = _embedAndScore( foldData[fold].training, foldData[fold].validation,
                                                      tableJob.table.value(), tableJob.timeMs,
                                                      fold, epsFactor, k, dmDim );
                }
                catch (const std::exception &e)
                {
                    fmt::print( stderr, "[Warning][fold:{}][metric:{}][eps_factor:{}][k:{}][dm_dim:{}][{}]\n",
                                fold, distanceLabel( tableJob.table->distance ), epsFactor, k, dmDim, e.what());
                }
            } );
            for (auto &jr : jobRecords)
                records.insert( records.end(), jr.cbegin(), jr.cend());

            std::map<std::string, std::vector<ResultRecord>> perMethod;
            for (auto &record : records)
                perMethod[record.method].push_back( record );

            for (auto &[method, methodRecords] : perMethod)
            {
                std::vector<double> accuracies, f1s, times;
                std::vector<size_t> selected;
                for (auto &r : methodRecords)
                {
                    accuracies.push_back( r.accuracy );
                    f1s.push_back( r.f1 );
                    times.push_back( r.timeMs );
                    selected.push_back( r.selected );
                }
                auto summary = summarize( datasetName, pct, k, dmDim, method,
                                          std::move( accuracies ), std::move( f1s ), times, selected );
                fmt::print( "[Result][method:{}][k:{}][dm_dim:{}][accuracy:{:.2f}%][f1:{:.4f}]\n",
                            method, k, dmDim, summary.accuracy * 100, summary.f1 );
                store.append( summary );
                summaries.push_back( std::move( summary ));
            }
        }
    }
    return summaries;
}

}
