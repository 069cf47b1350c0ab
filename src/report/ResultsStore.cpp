#include "ResultsStore.hpp"

namespace DF {

MethodSummary summarize( std::string dataset, double featuresPercentage, size_t k, size_t dmDim,
                         std::string method,
                         std::vector<double> foldAccuracies,
                         std::vector<double> foldF1s,
                         const std::vector<double> &foldTimesMs,
                         const std::vector<size_t> &foldSelected )
{
    MethodSummary summary;
    summary.dataset = std::move( dataset );
    summary.featuresPercentage = featuresPercentage;
    summary.k = k;
    summary.dmDim = dmDim;
    summary.method = std::move( method );
    summary.accuracy = mean( foldAccuracies.cbegin(), foldAccuracies.cend());
    summary.f1 = mean( foldF1s.cbegin(), foldF1s.cend());
    summary.foldAccuracies = std::move( foldAccuracies );
    summary.foldF1s = std::move( foldF1s );
    summary.timeMs = std::accumulate( foldTimesMs.cbegin(), foldTimesMs.cend(), 0.0 );
    summary.meanSelected = mean( foldSelected.cbegin(), foldSelected.cend());
    return summary;
}

ResultsStore::ResultsStore( const std::string &workDir, const std::string &dataset )
        : _path( std::filesystem::path( workDir ) / dataset / fmt::format( "{}_results.csv", dataset ))
{
    std::error_code ec;
    std::filesystem::create_directories( _path.parent_path(), ec );
    if ( ec )
        throw std::runtime_error( fmt::format( "Cannot create results directory {}:{}",
                                               _path.parent_path().string(), ec.message()));

    if ( std::filesystem::exists( _path ) && std::filesystem::file_size( _path ) > 0 )
        return;

    std::ofstream out( _path );
    if ( !out )
        throw std::runtime_error( fmt::format( "Cannot write results file {}", _path.string()));
    out << io::join( header(), "," ) << '\n';
}

void ResultsStore::append( const MethodSummary &summary )
{
    const auto row = formatRow( summary );
    std::lock_guard<std::mutex> lock( _mutex );
    std::ofstream out( _path, std::ios::app );
    if ( !out )
        throw std::runtime_error( fmt::format( "Cannot append to results file {}", _path.string()));
    out << row << '\n';
}

std::vector<std::string> ResultsStore::header()
{
    return {"dataset", "features_percentage", "k", "dm_dim", "method",
            "accuracy", "f1", "fold_accuracies", "fold_f1s", "time_ms", "mean_selected"};
}

std::string ResultsStore::formatRow( const MethodSummary &summary )
{
    // fold lists are ';' separated to stay within one CSV field
    return fmt::format( "{},{},{},{},{},{:.4f},{:.4f},{},{},{:.1f},{:.2f}",
                        summary.dataset, summary.featuresPercentage, summary.k, summary.dmDim,
                        summary.method, summary.accuracy, summary.f1,
                        io::join2string( summary.foldAccuracies, ";" ),
                        io::join2string( summary.foldF1s, ";" ),
                        summary.timeMs, summary.meanSelected );
}

}
