#ifndef DIFFUSION_FEATURES_CROSSVALIDATION_HPP
#define DIFFUSION_FEATURES_CROSSVALIDATION_HPP

#include "DFDefs.hpp"

namespace DF {

using Fold = std::vector<size_t>;

template<typename T>
std::vector<std::vector<T >>
kFoldSplit( std::vector<T> input, size_t k, std::mt19937 &rng )
{
    std::shuffle( input.begin(), input.end(), rng );
    std::vector<std::vector<T >> folds( k, std::vector<T>());
    for (size_t i = 0; i < input.size(); ++i)
        folds.at( i * k / input.size()).push_back( input.at( i ));
    return folds;
}

/**
 * @brief Row indices per fold, every class spread evenly over the folds.
 * The shuffle is seeded so that folds are reproducible across runs.
 */
template<typename Label = ClassLabel>
std::vector<Fold> kFoldStratifiedSplit( const std::vector<Label> &labels, size_t k, unsigned long seed )
{
    if ( k < 2 )
        throw InvalidConfiguration( fmt::format( "k-fold needs at least 2 folds, given:{}", k ));

    std::map<Label, std::vector<size_t >> rowsPerClass;
    for (size_t r = 0; r < labels.size(); ++r)
        rowsPerClass[labels[r]].push_back( r );

    std::mt19937 rng( seed );
    std::vector<Fold> folds( k );
    size_t offset = 0;
    for (auto &[label, rows] : rowsPerClass)
    {
        auto sFolds = kFoldSplit( rows, k, rng );
        // rotate so that small classes do not all land in the first folds
        for (size_t i = 0; i < sFolds.size(); ++i)
        {
            auto &fold = folds.at((i + offset) % k );
            fold.insert( fold.end(), sFolds[i].cbegin(), sFolds[i].cend());
        }
        offset += rows.size() % k;
    }
    for (auto &fold : folds)
        std::sort( fold.begin(), fold.end());
    return folds;
}

inline Fold trainingRows( const std::vector<Fold> &folds, size_t k )
{
    Fold joined;
    for (size_t i = 0; i < folds.size(); ++i)
    {
        if ( i == k ) continue;
        joined.insert( joined.end(), folds[i].cbegin(), folds[i].cend());
    }
    std::sort( joined.begin(), joined.end());
    return joined;
}

}

#endif //DIFFUSION_FEATURES_CROSSVALIDATION_HPP
