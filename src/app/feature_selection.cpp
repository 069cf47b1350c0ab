#include "ExperimentPipeline.hpp"
#include "Timers.hpp"
#include "clara.hpp"


std::vector<std::string> splitParameters( std::string params )
{
    io::trim( params, "[({})]" );
    auto tokens = io::split( params, ',' );
    for (auto &token : tokens)
        io::trim( token );
    return tokens;
}

template<typename T, typename Parser>
std::vector<T> parseParameters( const std::string &params, Parser parser )
{
    std::vector<T> values;
    for (auto &p : splitParameters( params ))
        values.push_back( parser( p ));
    return values;
}

int main(
        int argc,
        char *argv[]
)
{
    using namespace DF;
    using io::join;

    ExperimentConfiguration config;

    std::string input;
    std::string labelColumn = "label";
    std::string percentages = io::join2string( config.featuresPercentage, "," );
    std::string distances = "wasserstein,jm,hellinger";
    std::string dims = io::join2string( config.dmDims, "," );
    std::string epsType = "maxmin";
    std::string epsFactors = io::join2string( config.epsFactors, "," );
    std::string strategies = join( keys( SelectionLabels ), "," );
    std::string baselines = join( keys( BaselineLabels ), "," );
    size_t nRows = 0;
    bool showHelp = false;

    auto cli
            = clara::Arg( input, "input" )
                      ( "CSV dataset, one row per sample" )
              | clara::Opt( labelColumn, "label column" )
              ["-l"]["--label"]
                      ( fmt::format( "name of the label column, default:{}", labelColumn ))
              | clara::Opt( config.kFolds, "k-fold" )
              ["-k"]["--k-fold"]
                      ( fmt::format( "cross validation k-fold, default:{}", config.kFolds ))
              | clara::Opt( percentages, "percentages" )
              ["-p"]["--percentages"]
                      ( fmt::format( "selected features percentages, default:{}", percentages ))
              | clara::Opt( distances, join( keys( DistanceLabels ), "|" ))
              ["-d"]["--distances"]
                      ( fmt::format( "class distance metrics, default:{}", distances ))
              | clara::Opt( dims, "dimensions" )
              ["-D"]["--dm-dims"]
                      ( fmt::format( "diffusion map dimensions, default:{}", dims ))
              | clara::Opt( config.alpha, "alpha" )
              ["-a"]["--alpha"]
                      ( fmt::format( "density normalization in [0,1], default:{}", config.alpha ))
              | clara::Opt( epsType, join( keys( EpsilonLabels ), "|" ))
              ["-e"]["--eps-type"]
                      ( fmt::format( "kernel bandwidth strategy, default:{}", epsType ))
              | clara::Opt( epsFactors, "factors" )
              ["-E"]["--eps-factors"]
                      ( fmt::format( "kernel bandwidth factors, default:{}", epsFactors ))
              | clara::Opt( strategies, join( keys( SelectionLabels ), "|" ))
              ["-s"]["--strategies"]
                      ( fmt::format( "selection strategies, default:{}", strategies ))
              | clara::Opt( baselines, join( keys( BaselineLabels ), "|" ))
              ["-B"]["--baselines"]
                      ( fmt::format( "baseline selections, default:{}", baselines ))
              | clara::Opt( config.randomState, "seed" )
              ["-r"]["--random-state"]
                      ( fmt::format( "random state, default:{}", config.randomState ))
              | clara::Opt( nRows, "rows" )
              ["-n"]["--nrows"]
                      ( "read at most n rows, default:all" )
              | clara::Opt( config.nBins, "bins" )
              ["-b"]["--bins"]
                      ( fmt::format( "histogram bins, default:{}", config.nBins ))
              | clara::Opt( config.nTrees, "trees" )
              ["-t"]["--trees"]
                      ( fmt::format( "random forest trees, default:{}", config.nTrees ))
              | clara::Opt( config.nThreads, "threads" )
              ["-j"]["--threads"]
                      ( fmt::format( "worker threads, default:{}", config.nThreads ))
              | clara::Opt( config.workDir, "directory" )
              ["-w"]["--workdir"]
                      ( fmt::format( "results directory, default:{}", config.workDir ))
              | clara::Opt( config.verbose )
              ["-v"]["--verbose"]
                      ( "per fold details" )
              | clara::Help( showHelp );

    auto result = cli.parse( clara::Args( argc, argv ));
    if ( !result )
    {
        fmt::print( "Error in command line:{}\n", result.errorMessage());
        exit( 1 );
    } else if ( showHelp || input.empty())
    {
        cli.writeToStream( std::cout );
        return 0;
    }

    fmt::print( "[Args][input:{}]"
                "[label:{}]"
                "[k-fold:{}]"
                "[percentages:{}]"
                "[distances:{}]"
                "[dm-dims:{}]"
                "[alpha:{}]"
                "[eps-type:{}]"
                "[eps-factors:{}]"
                "[strategies:{}]"
                "[baselines:{}]"
                "[threads:{}]\n",
                input, labelColumn, config.kFolds, percentages, distances, dims,
                config.alpha, epsType, epsFactors, strategies, baselines, config.nThreads );

    try
    {
        auto toDouble = []( const std::string &s ) { return std::stod( s ); };
        config.featuresPercentage = parseParameters<double>( percentages, toDouble );
        config.epsFactors = parseParameters<double>( epsFactors, toDouble );
        config.dmDims = parseParameters<size_t>( dims, []( const std::string &s ) {
            return static_cast<size_t>( std::stoul( s ));
        } );
        config.distances = parseParameters<DistanceEnum>( distances, distanceFromLabel );
        config.strategies = parseParameters<SelectionEnum>( strategies, selectionFromLabel );
        config.baselines = parseParameters<BaselineEnum>( baselines, baselineFromLabel );
        config.epsType = epsilonFromLabel( epsType );
        if ( nRows > 0 ) config.nRows = nRows;

        ExperimentPipeline pipeline( std::move( config ));
        Timers::reported_invoke_s( [&]() {
            return pipeline.run( input, labelColumn );
        }, "experiment" );
    }
    catch (const std::exception &e)
    {
        fmt::print( stderr, "[Error][{}]\n", e.what());
        return 1;
    }
    return 0;
}
