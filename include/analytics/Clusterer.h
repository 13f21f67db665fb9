#pragma once

#include <string>
#include <vector>

#include "analytics/AnalyticsConfig.h"
#include "analytics/HistoryStore.h"

namespace quantpulse {
namespace analytics {

struct CorrelationMatrix {
    std::vector<std::string> instruments;
    std::vector<std::vector<double>> values;   // values[i][j], symmetric, diagonal 1.0
};

// Greedy single-pass grouping of instruments by price correlation.
// Deterministic for a given instrument order; not an optimal clustering.
class Clusterer {
public:
    explicit Clusterer(ClusterConfig config = ClusterConfig());

    // Undefined pairs (length mismatch, empty or flat history) become 0.0
    static CorrelationMatrix buildMatrix(const std::vector<HistorySnapshot>& histories);

    std::vector<std::vector<std::string>> cluster(const std::vector<HistorySnapshot>& histories) const;
    std::vector<std::vector<std::string>> cluster(const CorrelationMatrix& matrix) const;

private:
    ClusterConfig config_;
};

} // namespace analytics
} // namespace quantpulse
