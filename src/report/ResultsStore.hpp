#ifndef DIFFUSION_FEATURES_RESULTSSTORE_HPP
#define DIFFUSION_FEATURES_RESULTSSTORE_HPP

#include <filesystem>

#include "DFDefs.hpp"

namespace DF {

/**
 * @brief Fold results of one method averaged over the cross-validation.
 */
struct MethodSummary
{
    std::string dataset;
    double featuresPercentage = 0;
    size_t k = 0;
    size_t dmDim = 0;
    std::string method;
    double accuracy = 0;
    double f1 = 0;
    std::vector<double> foldAccuracies;
    std::vector<double> foldF1s;
    double timeMs = 0;
    double meanSelected = 0;
};

MethodSummary summarize( std::string dataset, double featuresPercentage, size_t k, size_t dmDim,
                         std::string method,
                         std::vector<double> foldAccuracies,
                         std::vector<double> foldF1s,
                         const std::vector<double> &foldTimesMs,
                         const std::vector<size_t> &foldSelected );

/**
 * @brief Appends method summaries as rows of `<workDir>/<dataset>/<dataset>_results.csv`.
 * The header is written when the file is created. Safe to share between workers.
 */
class ResultsStore
{
public:
    ResultsStore( const std::string &workDir, const std::string &dataset );

    void append( const MethodSummary &summary );

    std::string path() const
    {
        return _path.string();
    }

    static std::vector<std::string> header();

    static std::string formatRow( const MethodSummary &summary );

private:
    std::filesystem::path _path;
    std::mutex _mutex;
};

}

#endif //DIFFUSION_FEATURES_RESULTSSTORE_HPP
