#include "BaselineSelection.hpp"
#include "FeatureSelection.hpp"
#include "SharedHistogram.hpp"

namespace DF {

static std::vector<double> minMaxScaled( const std::vector<double> &column )
{
    const auto[lo, hi] = std::minmax_element( column.cbegin(), column.cend());
    std::vector<double> scaled( column.size(), 0.0 );
    if ( lo == column.cend() || !(*hi > *lo))
        return scaled;
    const double range = *hi - *lo;
    for (size_t r = 0; r < column.size(); ++r)
        scaled[r] = (column[r] - *lo) / range;
    return scaled;
}

static std::vector<FeatureIndex> topRanks( const std::vector<double> &scores, size_t k )
{
    validateFeatureCount( k, scores.size());
    auto order = argsort( scores.size(), [&]( size_t i ) { return scores[i]; }, true );
    order.resize( k );
    return order;
}

std::vector<FeatureIndex> allFeatures( size_t nFeatures )
{
    std::vector<FeatureIndex> indices( nFeatures );
    std::iota( indices.begin(), indices.end(), FeatureIndex( 0 ));
    return indices;
}

std::vector<FeatureIndex> randomFeatures( size_t nFeatures, size_t k, unsigned long seed )
{
    validateFeatureCount( k, nFeatures );
    auto indices = allFeatures( nFeatures );
    std::mt19937 rng( seed );
    std::shuffle( indices.begin(), indices.end(), rng );
    indices.resize( k );
    std::sort( indices.begin(), indices.end());
    return indices;
}

std::vector<double> fisherScores( const LabeledDataset &dataset )
{
    std::vector<double> scores;
    for (auto &column : dataset.columns())
    {
        const double mu = mean( column.cbegin(), column.cend());
        std::map<ClassLabel, std::vector<double>> byClass;
        for (size_t r = 0; r < column.size(); ++r)
            byClass[dataset.labels()[r]].push_back( column[r] );

        double between = 0, within = 0;
        for (auto &[label, values] : byClass)
        {
            const double n = values.size();
            const double muC = mean( values.cbegin(), values.cend());
            between += n * (muC - mu) * (muC - mu);
            within += n * variance( values.cbegin(), values.cend());
        }
        scores.push_back((within > 0) ? between / within : 0.0 );
    }
    return scores;
}

std::vector<FeatureIndex> fisherRanks( const LabeledDataset &dataset, size_t k )
{
    return topRanks( fisherScores( dataset ), k );
}

std::vector<double> chiSquareScores( const LabeledDataset &dataset )
{
    const auto distribution = dataset.labelDistribution();
    const double n = dataset.nRows();

    std::vector<double> scores;
    for (auto &column : dataset.columns())
    {
        const auto scaled = minMaxScaled( column );
        std::map<ClassLabel, double> observed;
        for (size_t r = 0; r < scaled.size(); ++r)
            observed[dataset.labels()[r]] += scaled[r];
        const double total = std::accumulate( scaled.cbegin(), scaled.cend(), 0.0 );

        double chi2 = 0;
        for (auto &[label, count] : distribution)
        {
            const double expected = total * count / n;
            if ( expected <= 0 ) continue;
            const double diff = observed[label] - expected;
            chi2 += diff * diff / expected;
        }
        scores.push_back( chi2 );
    }
    return scores;
}

std::vector<FeatureIndex> chiSquareRanks( const LabeledDataset &dataset, size_t k )
{
    return topRanks( chiSquareScores( dataset ), k );
}

std::vector<double> reliefFScores( const LabeledDataset &dataset, size_t nNeighbours )
{
    const size_t m = dataset.nRows();
    const auto &labels = dataset.labels();

    std::vector<std::vector<double>> scaled;
    for (auto &column : dataset.columns())
        scaled.push_back( minMaxScaled( column ));

    std::map<ClassLabel, double> prior;
    for (auto &[label, count] : dataset.labelDistribution())
        prior[label] = double( count ) / m;

    std::vector<double> weights( scaled.size(), 0.0 );
    if ( m < 2 || nNeighbours == 0 ) return weights;

    for (size_t r = 0; r < m; ++r)
    {
        std::vector<double> distance( m, 0.0 );
        for (auto &feature : scaled)
            for (size_t o = 0; o < m; ++o)
                distance[o] += std::abs( feature[r] - feature[o] );

        std::map<ClassLabel, std::vector<size_t>> neighbours;
        for (auto o : argsort( m, [&]( size_t i ) { return distance[i]; } ))
        {
            if ( o == r ) continue;
            auto &nearest = neighbours[labels[o]];
            if ( nearest.size() < nNeighbours )
                nearest.push_back( o );
        }

        const double missMass = 1.0 - prior.at( labels[r] );
        for (auto &[label, nearest] : neighbours)
        {
            const bool hit = label == labels[r];
            if ( !hit && !(missMass > 0)) continue;
            const double factor = hit ? -1.0 : prior.at( label ) / missMass;
            for (size_t f = 0; f < scaled.size(); ++f)
            {
                double diff = 0;
                for (auto o : nearest)
                    diff += std::abs( scaled[f][r] - scaled[f][o] );
                weights[f] += factor * diff / (m * nearest.size());
            }
        }
    }
    return weights;
}

std::vector<FeatureIndex> reliefFRanks( const LabeledDataset &dataset, size_t k, size_t nNeighbours )
{
    return topRanks( reliefFScores( dataset, nNeighbours ), k );
}

static std::vector<size_t> discretized( const std::vector<double> &column, size_t nBins )
{
    const auto binning = Binning::pooled( column, std::vector<double>(), nBins );
    std::vector<size_t> bins;
    for (auto v : column)
        bins.push_back( binning.bin( v ));
    return bins;
}

static double mutualInformation( const std::vector<size_t> &x, const std::vector<size_t> &y )
{
    std::map<std::pair<size_t, size_t>, double> joint;
    std::map<size_t, double> px, py;
    for (size_t r = 0; r < x.size(); ++r)
    {
        ++joint[{x[r], y[r]}];
        ++px[x[r]];
        ++py[y[r]];
    }
    const double n = x.size();
    double mi = 0;
    for (auto &[xy, count] : joint)
        mi += count / n * std::log( count * n / (px[xy.first] * py[xy.second]));
    return std::max( mi, 0.0 );
}

std::vector<FeatureIndex> mrmrRanks( const LabeledDataset &dataset, size_t k, size_t nBins )
{
    const size_t nFeatures = dataset.nFeatures();
    validateFeatureCount( k, nFeatures );

    std::vector<size_t> classes;
    const auto labels = dataset.classes();
    for (auto &l : dataset.labels())
        classes.push_back( std::lower_bound( labels.cbegin(), labels.cend(), l ) - labels.cbegin());

    std::vector<std::vector<size_t>> bins;
    std::vector<double> relevance;
    for (auto &column : dataset.columns())
    {
        bins.push_back( discretized( column, nBins ));
        relevance.push_back( mutualInformation( bins.back(), classes ));
    }

    std::vector<FeatureIndex> selected;
    std::vector<bool> taken( nFeatures, false );
    std::vector<double> redundancy( nFeatures, 0.0 );
    while (selected.size() < k)
    {
        FeatureIndex best = nFeatures;
        double bestScore = -inf;
        for (FeatureIndex f = 0; f < nFeatures; ++f)
        {
            if ( taken[f] ) continue;
            const double score = selected.empty() ? relevance[f]
                                                  : relevance[f] - redundancy[f] / selected.size();
            if ( score > bestScore )
            {
                bestScore = score;
                best = f;
            }
        }
        taken[best] = true;
        selected.push_back( best );
        for (FeatureIndex f = 0; f < nFeatures; ++f)
            if ( !taken[f] )
                redundancy[f] += mutualInformation( bins[f], bins[best] );
    }
    return selected;
}

std::vector<FeatureIndex> selectBaseline( BaselineEnum baseline,
                                          const LabeledDataset &training,
                                          size_t k,
                                          unsigned long seed )
{
    switch (baseline)
    {
        case BaselineEnum::Random :
            return randomFeatures( training.nFeatures(), k, seed );
        case BaselineEnum::Fisher :
            return fisherRanks( training, k );
        case BaselineEnum::ChiSquare :
            return chiSquareRanks( training, k );
        case BaselineEnum::ReliefF :
            return reliefFRanks( training, k );
        case BaselineEnum::MRMR :
            return mrmrRanks( training, k );
    }
    throw InvalidConfiguration( "Undefined Baseline" );
}

}
