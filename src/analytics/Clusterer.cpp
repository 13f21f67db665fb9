#include "analytics/Clusterer.h"
#include "analytics/MetricsComputer.h"

namespace quantpulse {
namespace analytics {

Clusterer::Clusterer(ClusterConfig config)
    : config_(config) {}

CorrelationMatrix Clusterer::buildMatrix(const std::vector<HistorySnapshot>& histories) {
    CorrelationMatrix matrix;
    const size_t n = histories.size();
    matrix.values.assign(n, std::vector<double>(n, 0.0));

    for (size_t i = 0; i < n; ++i) {
        matrix.instruments.push_back(histories[i].instrument_id);
        matrix.values[i][i] = 1.0;

        for (size_t j = i + 1; j < n; ++j) {
            const auto& a = histories[i].prices;
            const auto& b = histories[j].prices;
            if (a.empty() || a.size() != b.size()) {
                continue;
            }
            auto corr = MetricsComputer::calculateCorrelation(a, b);
            if (corr) {
                matrix.values[i][j] = *corr;
                matrix.values[j][i] = *corr;
            }
        }
    }
    return matrix;
}

std::vector<std::vector<std::string>> Clusterer::cluster(const std::vector<HistorySnapshot>& histories) const {
    return cluster(buildMatrix(histories));
}

std::vector<std::vector<std::string>> Clusterer::cluster(const CorrelationMatrix& matrix) const {
    const size_t n = matrix.instruments.size();
    std::vector<std::vector<std::string>> clusters;
    std::vector<bool> assigned(n, false);

    for (size_t i = 0; i < n; ++i) {
        if (assigned[i]) {
            continue;
        }

        std::vector<std::string> group{matrix.instruments[i]};
        assigned[i] = true;

        for (size_t j = 0; j < n; ++j) {
            if (!assigned[j] && matrix.values[i][j] >= config_.min_correlation) {
                group.push_back(matrix.instruments[j]);
                assigned[j] = true;
            }
        }
        clusters.push_back(std::move(group));
    }
    return clusters;
}

} // namespace analytics
} // namespace quantpulse
