#include "backtest/BacktestSimulator.h"

#include <cmath>
#include <iostream>
#include <vector>

#define CHECK(cond, msg) \
    do { if (!(cond)) { std::cerr << "[TEST] " << msg << "\n"; return 1; } } while (0)

namespace {
// 20 points alternating 100/101: trailing mean 100.5, std 0.5
std::vector<double> calmHistory() {
    std::vector<double> prices;
    for (int i = 0; i < 20; ++i) {
        prices.push_back(i % 2 == 0 ? 100.0 : 101.0);
    }
    return prices;
}
}

int main() {
    using quantpulse::PositionSide;
    using namespace quantpulse::backtest;

    // too little history
    {
        BacktestSimulator simulator;
        const auto result = simulator.run(std::vector<double>(19, 100.0));
        CHECK(result.trade_count == 0 && result.wins == 0 && result.losses == 0, "short history has no trades");
        CHECK(result.win_rate == 0.0 && result.total_pnl == 0.0 && result.avg_pnl == 0.0, "short history zeros");
    }

    // spike opens a short, reversion closes it with a profit
    {
        BacktestConfig config;
        config.exit_threshold = 0.5;
        BacktestSimulator simulator(config);

        auto prices = calmHistory();
        prices.push_back(110.0);    // z = 19
        prices.push_back(100.5);    // z ~ -0.24

        const auto result = simulator.run(prices);
        CHECK(result.trade_count == 1, "one round trip, got " << result.trade_count);
        CHECK(result.trades[0].side == PositionSide::SHORT, "spike opens a short");
        CHECK(result.trades[0].entry_index == 20 && result.trades[0].exit_index == 21, "entry/exit indices");
        CHECK(std::abs(result.total_pnl - 9.5) < 1e-9, "short pnl = entry - exit");
        CHECK(result.wins == 1 && result.losses == 0 && result.win_rate == 1.0, "winning trade");
        CHECK(std::abs(result.avg_pnl - 9.5) < 1e-9, "avg pnl");
    }

    // dip opens a long
    {
        BacktestConfig config;
        config.exit_threshold = 0.5;
        BacktestSimulator simulator(config);

        auto prices = calmHistory();
        prices.push_back(91.0);
        prices.push_back(100.5);

        const auto result = simulator.run(prices);
        CHECK(result.trade_count == 1 && result.trades[0].side == PositionSide::LONG, "dip opens a long");
        CHECK(std::abs(result.total_pnl - 9.5) < 1e-9, "long pnl = exit - entry");
    }

    // losing short
    {
        BacktestConfig config;
        config.exit_threshold = 5.0;
        BacktestSimulator simulator(config);

        auto prices = calmHistory();
        prices.push_back(110.0);
        prices.push_back(111.0);    // z ~ 4.71 < 5 closes at a loss

        const auto result = simulator.run(prices);
        CHECK(result.trade_count == 1, "one trade");
        CHECK(std::abs(result.total_pnl + 1.0) < 1e-9, "loss of 1.0");
        CHECK(result.wins == 0 && result.losses == 1 && result.win_rate == 0.0, "losing trade counted");
    }

    // default exit threshold never closes; open position at the end is dropped
    {
        BacktestSimulator simulator;
        auto prices = calmHistory();
        prices.push_back(110.0);
        prices.push_back(100.5);
        prices.push_back(100.5);

        const auto result = simulator.run(prices);
        CHECK(result.trade_count == 0 && result.total_pnl == 0.0, "unrealized position is not counted");
    }

    std::cout << "[TEST] BacktestSimulator PASSED\n";
    return 0;
}
