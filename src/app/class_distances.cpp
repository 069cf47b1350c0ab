#include <filesystem>

#include "DistanceTable.hpp"
#include "DiffusionMap.hpp"
#include "FeatureSelection.hpp"
#include "dlib_utilities.hpp"
#include "Timers.hpp"
#include "clara.hpp"

void writeMatrix( const std::filesystem::path &path, const dlib::matrix<double> &m,
                  const std::vector<std::string> &header )
{
    std::ofstream out( path );
    if ( !out )
        throw std::runtime_error( fmt::format( "Cannot write {}", path.string()));
    if ( !header.empty())
        out << io::join( header, "," ) << '\n';
    dlib_utilities::write_csv( m, [&out]( const std::string &line ) {
        out << line << '\n';
    } );
}

int main(
        int argc,
        char *argv[]
)
{
    using namespace DF;
    using io::join;

    std::string input;
    std::string labelColumn = "label";
    std::string distance = "wasserstein";
    std::string epsType = "maxmin";
    std::string output = "distances";
    DiffusionMapConfiguration dmConfig;
    size_t k = 2;
    size_t nRows = 0;
    size_t nBins = DefaultBins;
    unsigned long seed = 0;
    bool showHelp = false;

    auto cli
            = clara::Arg( input, "input" )
                      ( "CSV dataset, one row per sample" )
              | clara::Opt( labelColumn, "label column" )
              ["-l"]["--label"]
                      ( fmt::format( "name of the label column, default:{}", labelColumn ))
              | clara::Opt( distance, join( keys( DistanceLabels ), "|" ))
              ["-d"]["--distance"]
                      ( fmt::format( "class distance metric, default:{}", distance ))
              | clara::Opt( dmConfig.dimensions, "dimensions" )
              ["-D"]["--dm-dim"]
                      ( fmt::format( "diffusion map dimension, default:{}", dmConfig.dimensions ))
              | clara::Opt( dmConfig.alpha, "alpha" )
              ["-a"]["--alpha"]
                      ( fmt::format( "density normalization in [0,1], default:{}", dmConfig.alpha ))
              | clara::Opt( epsType, join( keys( EpsilonLabels ), "|" ))
              ["-e"]["--eps-type"]
                      ( fmt::format( "kernel bandwidth strategy, default:{}", epsType ))
              | clara::Opt( dmConfig.epsFactor, "factor" )
              ["-E"]["--eps-factor"]
                      ( fmt::format( "kernel bandwidth factor, default:{}", dmConfig.epsFactor ))
              | clara::Opt( k, "k" )
              ["-k"]["--features"]
                      ( fmt::format( "number of selected features, default:{}", k ))
              | clara::Opt( nBins, "bins" )
              ["-b"]["--bins"]
                      ( fmt::format( "histogram bins, default:{}", nBins ))
              | clara::Opt( nRows, "rows" )
              ["-n"]["--nrows"]
                      ( "read at most n rows, default:all" )
              | clara::Opt( seed, "seed" )
              ["-r"]["--random-state"]
                      ( fmt::format( "clustering seed, default:{}", seed ))
              | clara::Opt( output, "directory" )
              ["-o"]["--output"]
                      ( fmt::format( "output directory, default:{}", output ))
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

    fmt::print( "[Args][input:{}][label:{}][distance:{}][dm-dim:{}][alpha:{}][eps-type:{}][eps-factor:{}][k:{}]\n",
                input, labelColumn, distance, dmConfig.dimensions, dmConfig.alpha,
                epsType, dmConfig.epsFactor, k );

    try
    {
        dmConfig.epsType = epsilonFromLabel( epsType );
        const auto metric = distanceFromLabel( distance );
        const auto dataset = LabeledDataset::loadCSV( input, labelColumn,
                                                      nRows > 0 ? std::optional<size_t>( nRows ) : std::nullopt );

        const auto table = Timers::reported_invoke_s( [&]() {
            return buildDistanceTable( dataset, metric, nBins );
        }, "distance table" );

        const std::filesystem::path outDir = std::filesystem::path( output ) / distance;
        std::filesystem::create_directories( outDir );

        std::vector<std::string> pairHeader;
        for (auto &a : table.classes)
            for (auto &b : table.classes)
                pairHeader.push_back( fmt::format( "{}|{}", a, b ));
        writeMatrix( outDir / "table.csv", table.flattened, pairHeader );

        const auto heatmaps = outDir / "heatmaps";
        std::filesystem::create_directories( heatmaps );
        for (auto &[feature, pairs] : table.classPairs)
            writeMatrix( heatmaps / fmt::format( "{}.csv", feature ), pairs, table.classes );

        const auto embedding = DiffusionMap( dmConfig ).embed( table.flattened );
        writeMatrix( outDir / "coordinates.csv", embedding.coordinates, table.featureNames );
        fmt::print( "[Embedding][eps:{}][lambdas:{}]\n", embedding.epsilon,
                    io::join2string( embedding.eigenvalues, "," ));

        for (auto &[label, strategy] : SelectionLabels)
        {
            const auto selection = selectFeatures( embedding.coordinates, k, strategy, seed );
            std::vector<std::string> names;
            for (auto f : selection.indices)
                names.push_back( table.featureNames.at( f ));
            fmt::print( "[Selection][strategy:{}][requested:{}][selected:{}][{}]\n",
                        label, selection.requested, selection.indices.size(), join( names, "," ));
        }
        fmt::print( "[Output][{}]\n", outDir.string());
    }
    catch (const std::exception &e)
    {
        fmt::print( stderr, "[Error][{}]\n", e.what());
        return 1;
    }
    return 0;
}
