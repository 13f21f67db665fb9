#include "backtest/BacktestSimulator.h"
#include "analytics/MetricsComputer.h"
#include "common/Logger.h"

#include <cmath>

namespace quantpulse {
namespace backtest {

using analytics::MetricsComputer;

BacktestSimulator::BacktestSimulator(BacktestConfig config)
    : config_(config) {}

double BacktestSimulator::closePnl(const Position& position, double exit_price) {
    return (position.side == PositionSide::LONG)
        ? (exit_price - position.entry_price)
        : (position.entry_price - exit_price);
}

BacktestResult BacktestSimulator::run(const std::vector<double>& prices) const {
    BacktestResult result;
    if (config_.period <= 0 || prices.size() < static_cast<size_t>(config_.period)) {
        return result;
    }

    const size_t period = static_cast<size_t>(config_.period);
    std::optional<Position> position;

    for (size_t i = period; i < prices.size(); ++i) {
        // trailing window excludes the current point
        std::vector<double> recent(prices.begin() + (i - period), prices.begin() + i);
        const double mean = MetricsComputer::calculateMean(recent);
        const double std_dev = MetricsComputer::calculateStdDev(recent, mean);
        const double z = MetricsComputer::calculateZScore(prices[i], mean, std_dev);

        if (!position) {
            if (z > config_.entry_threshold) {
                position = Position{PositionSide::SHORT, prices[i], i};
            } else if (z < -config_.entry_threshold) {
                position = Position{PositionSide::LONG, prices[i], i};
            }
        } else if (std::abs(z) < config_.exit_threshold) {
            BacktestTrade trade;
            trade.side = position->side;
            trade.entry_index = position->entry_index;
            trade.exit_index = i;
            trade.entry_price = position->entry_price;
            trade.exit_price = prices[i];
            trade.pnl = closePnl(*position, prices[i]);
            result.trades.push_back(trade);
            position.reset();
        }
    }

    for (const auto& trade : result.trades) {
        result.total_pnl += trade.pnl;
        if (trade.pnl > 0.0) {
            result.wins++;
        } else {
            result.losses++;
        }
    }

    result.trade_count = static_cast<int>(result.trades.size());
    if (result.trade_count > 0) {
        result.win_rate = static_cast<double>(result.wins) / result.trade_count;
        result.avg_pnl = result.total_pnl / result.trade_count;
    }

    LOG_DEBUG("Backtest: {} points, {} trades, pnl={:.4f}", prices.size(), result.trade_count, result.total_pnl);
    return result;
}

} // namespace backtest
} // namespace quantpulse
