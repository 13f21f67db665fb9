#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"

namespace quantpulse {
namespace backtest {

struct BacktestConfig {
    int period = 20;               // trailing window length
    double entry_threshold = 2.0;  // |z| needed to open
    double exit_threshold = 0.0;   // |z| below this closes
};

struct BacktestTrade {
    PositionSide side = PositionSide::LONG;
    size_t entry_index = 0;
    size_t exit_index = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double pnl = 0.0;
};

struct BacktestResult {
    int trade_count = 0;
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;
    double total_pnl = 0.0;
    double avg_pnl = 0.0;
    std::vector<BacktestTrade> trades;
};

// Mean-reversion replay over one price history. Each step recomputes the
// trailing mean/std from scratch (no incremental update); at most one
// position is open; a position still open at the end is dropped unrealized.
class BacktestSimulator {
public:
    explicit BacktestSimulator(BacktestConfig config = BacktestConfig());

    BacktestResult run(const std::vector<double>& prices) const;

    const BacktestConfig& config() const { return config_; }

private:
    static double closePnl(const Position& position, double exit_price);

    BacktestConfig config_;
};

} // namespace backtest
} // namespace quantpulse
