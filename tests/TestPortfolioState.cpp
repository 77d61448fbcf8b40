#include "portfolio/PortfolioState.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace regimegate;
using portfolio::PortfolioState;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

Fill fill(const std::string& order_id, int seq, OrderSide side, double qty, double price, double fee,
          TimestampMs ts = 0) {
    Fill f;
    f.order_id = order_id;
    f.fill_seq = seq;
    f.symbol = "BTC-USD";
    f.side = side;
    f.quantity = qty;
    f.price = price;
    f.fee = fee;
    f.timestamp = ts;
    return f;
}
}

int main() {
    std::cout << "[TEST] Starting PortfolioState Test..." << std::endl;

    // 1. Average cost accounting
    {
        PortfolioState portfolio(100000.0);
        auto r1 = portfolio.applyFill(fill("o-1", 1, OrderSide::BUY, 1.0, 100.0, 0.1, 10), 1.0);
        assert(r1.applied && !r1.duplicate);
        assert(near(portfolio.cash(), 100000.0 - 100.1));
        assert(near(portfolio.equity(), 100000.0 - 0.1));

        portfolio.applyFill(fill("o-2", 1, OrderSide::BUY, 1.0, 200.0, 0.2, 20), 1.0);
        auto position = portfolio.position("BTC-USD");
        assert(position.has_value());
        assert(near(position->quantity, 2.0));
        assert(near(position->avg_entry_price, 150.0));
        assert(position->side == PositionSide::LONG);

        portfolio.markToMarket("BTC-USD", 300.0);
        assert(portfolio.lastPrice("BTC-USD") == 300.0);
        assert(!portfolio.lastPrice("ETH-USD"));
        // (300 - 150) * 2 less 0.3 of entry fees
        assert(near(portfolio.position("BTC-USD")->unrealized_pnl, 299.7));

        auto r3 = portfolio.applyFill(fill("o-3", 1, OrderSide::SELL, 1.0, 300.0, 0.3, 30), 1.0);
        // 150 gross, half the entry fees, full exit fee
        assert(near(r3.realized_pnl, 150.0 - 0.15 - 0.3));
        assert(r3.closed_trade.has_value());
        assert(r3.closed_trade->entry_time == 10);
        assert(r3.closed_trade->exit_time == 30);
        assert(near(r3.closed_trade->entry_price, 150.0));
        assert(near(portfolio.positionQuantity("BTC-USD"), 1.0));
        assert(near(portfolio.realizedPnl(), 149.55));

        const auto snapshot = portfolio.recordSnapshot(40);
        assert(near(snapshot.equity, snapshot.cash + snapshot.positions_value));
        assert(near(snapshot.equity, portfolio.equity()));
        assert(near(snapshot.realized_pnl, 149.55));
    }

    // 2. Idempotent fills
    {
        PortfolioState portfolio(10000.0);
        const auto first = fill("o-9", 1, OrderSide::BUY, 2.0, 100.0, 0.2);
        portfolio.applyFill(first, 4.0);
        const double cash_after = portfolio.cash();

        const auto replay = portfolio.applyFill(first, 4.0);
        assert(replay.duplicate);
        assert(!replay.applied);
        assert(portfolio.cash() == cash_after);
        assert(near(portfolio.positionQuantity("BTC-USD"), 2.0));

        bool threw = false;
        try {
            portfolio.applyFill(fill("o-9", 1, OrderSide::BUY, 2.5, 100.0, 0.2), 4.0);
        } catch (const IdempotencyViolation&) {
            threw = true;
        }
        assert(threw);
        assert(portfolio.cash() == cash_after);

        // second slice fits, a third would overfill
        portfolio.applyFill(fill("o-9", 2, OrderSide::BUY, 2.0, 101.0, 0.2), 4.0);
        threw = false;
        try {
            portfolio.applyFill(fill("o-9", 3, OrderSide::BUY, 0.5, 101.0, 0.05), 4.0);
        } catch (const IdempotencyViolation&) {
            threw = true;
        }
        assert(threw);
        assert(near(portfolio.positionQuantity("BTC-USD"), 4.0));

        threw = false;
        try {
            portfolio.applyFill(fill("o-10", 1, OrderSide::BUY, -1.0, 100.0, 0.0), 1.0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // 3. Reducing through zero flips the position
    {
        PortfolioState portfolio(10000.0);
        portfolio.applyFill(fill("a", 1, OrderSide::BUY, 1.0, 100.0, 0.0), 1.0);
        const auto flip = portfolio.applyFill(fill("b", 1, OrderSide::SELL, 3.0, 110.0, 0.0), 3.0);
        assert(near(flip.realized_pnl, 10.0));
        const auto position = portfolio.position("BTC-USD");
        assert(near(position->quantity, -2.0));
        assert(position->side == PositionSide::SHORT);
        assert(near(position->avg_entry_price, 110.0));
        portfolio.markToMarket("BTC-USD", 110.0);
        assert(near(portfolio.equity(), 10010.0));
    }

    // 4. Drawdown from snapshots, seeded peak
    {
        PortfolioState portfolio(1000.0, 1200.0);
        assert(near(portfolio.peakEquity(), 1200.0));
        const auto first = portfolio.recordSnapshot(1);
        assert(near(first.drawdown_pct, 200.0 / 1200.0));

        portfolio.applyFill(fill("c", 1, OrderSide::BUY, 5.0, 100.0, 0.0), 5.0);
        portfolio.markToMarket("BTC-USD", 180.0);   // equity 1400
        assert(near(portfolio.recordSnapshot(2).drawdown_pct, 0.0));
        portfolio.markToMarket("BTC-USD", 110.0);   // equity 1050
        assert(near(portfolio.recordSnapshot(3).drawdown_pct, 350.0 / 1400.0));
        assert(near(portfolio.maxDrawdown(), 0.25));

        portfolio.rebasePeak();
        assert(near(portfolio.peakEquity(), 1050.0));
        assert(near(portfolio.recordSnapshot(4).drawdown_pct, 0.0));
        assert(portfolio.snapshots().size() == 4);
        assert(portfolio.recentSnapshots(2).front().timestamp == 3);

        const auto view = portfolio.exposureView();
        assert(near(view.equity, 1050.0));
        assert(near(view.exposure("BTC-USD"), 550.0));
        assert(near(view.grossExposure(), 550.0));
    }

    // 5. Concurrent readers never see a torn state
    {
        PortfolioState portfolio(100000.0);
        std::thread writer([&portfolio]() {
            for (int i = 1; i <= 500; ++i) {
                portfolio.applyFill(fill("w-" + std::to_string(i), 1, OrderSide::BUY, 0.01, 100.0 + i * 0.01, 0.001), 0.01);
                portfolio.markToMarket("BTC-USD", 100.0 + i * 0.01);
            }
        });
        for (int i = 0; i < 500; ++i) {
            const auto view = portfolio.exposureView();
            assert(near(view.equity, view.cash + view.quantity("BTC-USD") * view.price("BTC-USD"), 1e-6));
        }
        writer.join();
        assert(near(portfolio.positionQuantity("BTC-USD"), 5.0, 1e-9));
    }

    std::cout << "[TEST] PortfolioState Test PASSED!" << std::endl;
    return 0;
}
