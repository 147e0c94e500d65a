// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Plotter tests
 *
 * Runs are idempotent by index, extend incrementally as the piece set
 * grows, retry failed writes and stop on a malformed piece set.
 */

#include <boost/test/unit_test.hpp>

#include <plot/plot_store.h>
#include <plot/plotter.h>
#include <sloth/sloth.h>
#include <test/test_helpers.h>

#include <algorithm>
#include <map>
#include <mutex>
#include <set>

namespace {

uint256 TestFarmer() {
    uint8_t seed[6] = {'p', 'l', 'o', 't', 'e', 'r'};
    return Hash256(seed, sizeof(seed));
}

/** Store whose Put fails a configurable number of times per index */
class FlakyPlotStore : public CPlotStore {
public:
    PlotStoreResult Put(uint64_t index, const std::vector<uint8_t>& encoded) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_attempts[index]++;
            if (m_alwaysFail.count(index) > 0) {
                return PlotStoreResult::IO_FAILURE;
            }
            if (m_failuresLeft[index] > 0) {
                m_failuresLeft[index]--;
                return PlotStoreResult::IO_FAILURE;
            }
        }
        return CPlotStore::Put(index, encoded);
    }

    void FailTimes(uint64_t index, int n) { m_failuresLeft[index] = n; }
    void FailAlways(uint64_t index) { m_alwaysFail.insert(index); }
    int Attempts(uint64_t index) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_attempts[index];
    }

private:
    std::mutex m_mutex;
    std::map<uint64_t, int> m_failuresLeft;
    std::map<uint64_t, int> m_attempts;
    std::set<uint64_t> m_alwaysFail;
};

/** Piece set that hands out a short piece at one index */
class BrokenPieceSet : public CPieceSet {
public:
    BrokenPieceSet(uint64_t size, uint64_t badIndex) : m_size(size), m_badIndex(badIndex) {}

    uint64_t Size() const override { return m_size; }
    uint64_t Version() const override { return 1; }
    PieceSetResult GetPiece(uint64_t index, Piece& piece) const override {
        if (index >= m_size) {
            return PieceSetResult::NOT_FOUND;
        }
        uint8_t seed[1] = {7};
        piece = CChainPieceSet::ExpandPiece(Hash256(seed, 1), index);
        if (index == m_badIndex) {
            piece.resize(PIECE_SIZE / 2);
        }
        return PieceSetResult::OK;
    }

private:
    uint64_t m_size;
    uint64_t m_badIndex;
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(plotter_tests)

BOOST_AUTO_TEST_CASE(plot_writes_verifiable_replicas) {
    TestDirectory dir("plotter");
    Plotchain::ChainParams params = TestParams(6);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);

    CPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), TestFarmer(), 2, error));
    store.SetSyncWrites(false);

    uint64_t lastDone = 0;
    CPlotter plotter(3, 3);
    plotter.SetProgressCallback([&lastDone](uint64_t done, uint64_t) { lastDone = std::max(lastDone, done); });
    CPlotReport report = plotter.Plot(pieces, TestFarmer(), store);

    BOOST_CHECK(report.result == PlotResult::OK);
    BOOST_CHECK_EQUAL(report.nEncoded, 6u);
    BOOST_CHECK_EQUAL(lastDone, 6u);
    BOOST_CHECK_EQUAL(store.CompletedRange().end, 6u);

    for (uint64_t i = 0; i < 6; i++) {
        Piece piece;
        std::vector<uint8_t> encoded;
        pieces.GetPiece(i, piece);
        BOOST_REQUIRE(store.Get(i, encoded) == PlotStoreResult::OK);
        BOOST_CHECK_NO_THROW(sloth::verify(piece, encoded, TestFarmer(), i, 2));
    }
}

BOOST_AUTO_TEST_CASE(plot_is_idempotent) {
    TestDirectory dir("plotter");
    Plotchain::ChainParams params = TestParams(5);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);

    CPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), TestFarmer(), 1, error));

    CPlotter plotter(2);
    BOOST_CHECK(plotter.Plot(pieces, TestFarmer(), store).result == PlotResult::OK);

    std::vector<uint8_t> first;
    store.Get(3, first);

    CPlotReport again = plotter.Plot(pieces, TestFarmer(), store);
    BOOST_CHECK(again.result == PlotResult::OK);
    BOOST_CHECK_EQUAL(again.nEncoded, 0u);
    BOOST_CHECK_EQUAL(again.nSkipped, 5u);

    std::vector<uint8_t> second;
    store.Get(3, second);
    BOOST_CHECK(first == second);
    BOOST_CHECK_EQUAL(plotter.GetTotalEncoded(), 5u);
}

BOOST_AUTO_TEST_CASE(extend_plots_only_new_pieces) {
    TestDirectory dir("plotter");
    Plotchain::ChainParams params = TestParams(4);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);

    CPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), TestFarmer(), 1, error));

    CPlotter plotter(2);
    BOOST_CHECK(plotter.Plot(pieces, TestFarmer(), store).result == PlotResult::OK);

    uint8_t a[1] = {1};
    uint8_t b[1] = {2};
    pieces.AppendFromBlock(Hash256(a, 1));
    pieces.AppendFromBlock(Hash256(b, 1));

    CPlotReport report = plotter.Extend(pieces, TestFarmer(), store, 4);
    BOOST_CHECK(report.result == PlotResult::OK);
    BOOST_CHECK_EQUAL(report.nEncoded, 2u);
    BOOST_CHECK_EQUAL(report.nSkipped, 0u);
    BOOST_CHECK_EQUAL(store.CompletedRange().end, 6u);
    BOOST_CHECK_CLOSE(store.CompletionPercent(pieces.Size()), 100.0, 0.001);
}

BOOST_AUTO_TEST_CASE(transient_write_failures_retried) {
    TestDirectory dir("plotter");
    Plotchain::ChainParams params = TestParams(4);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);

    FlakyPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), TestFarmer(), 1, error));
    store.FailTimes(1, 2);

    CPlotter plotter(1, 3);
    CPlotReport report = plotter.Plot(pieces, TestFarmer(), store);
    BOOST_CHECK(report.result == PlotResult::OK);
    BOOST_CHECK(report.failed.empty());
    BOOST_CHECK_EQUAL(store.Attempts(1), 3);
    BOOST_CHECK_EQUAL(store.Attempts(0), 1);
}

BOOST_AUTO_TEST_CASE(persistent_write_failure_reported) {
    TestDirectory dir("plotter");
    Plotchain::ChainParams params = TestParams(4);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);

    FlakyPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), TestFarmer(), 1, error));
    store.FailAlways(2);

    CPlotter plotter(2, 2);
    CPlotReport report = plotter.Plot(pieces, TestFarmer(), store);
    BOOST_CHECK(report.result == PlotResult::PARTIAL);
    BOOST_REQUIRE_EQUAL(report.failed.size(), 1u);
    BOOST_CHECK_EQUAL(report.failed[0], 2u);
    BOOST_CHECK_EQUAL(store.Attempts(2), 2);
    BOOST_CHECK_EQUAL(report.nEncoded, 3u);

    // Later pieces still got plotted; the prefix stops at the hole
    BOOST_CHECK(store.Has(3));
    BOOST_CHECK_EQUAL(store.CompletedRange().end, 2u);
}

BOOST_AUTO_TEST_CASE(malformed_piece_set_aborts) {
    TestDirectory dir("plotter");
    BrokenPieceSet pieces(8, 0);

    CPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), TestFarmer(), 1, error));

    CPlotter plotter(1);
    CPlotReport report = plotter.Plot(pieces, TestFarmer(), store);
    BOOST_CHECK(report.result == PlotResult::MALFORMED_PIECE_SET);
    BOOST_CHECK(!report.error.empty());
    BOOST_CHECK(!store.Has(0));
    BOOST_CHECK(!report.fStopped);
}

BOOST_AUTO_TEST_CASE(store_for_another_farmer_refused) {
    TestDirectory dir("plotter");
    Plotchain::ChainParams params = TestParams(2);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);

    CPlotter plotter(1);
    CPlotStore closed;
    BOOST_CHECK(plotter.Plot(pieces, TestFarmer(), closed).result == PlotResult::STORE_UNAVAILABLE);

    CPlotStore store;
    std::string error;
    uint8_t other[1] = {0};
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), Hash256(other, 1), 1, error));
    CPlotReport report = plotter.Plot(pieces, TestFarmer(), store);
    BOOST_CHECK(report.result == PlotResult::STORE_UNAVAILABLE);
    BOOST_CHECK_EQUAL(store.CompletedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(pool_size_bounds) {
    CPlotter automatic(0, 0);
    BOOST_CHECK_GE(automatic.GetThreadCount(), 1u);
    BOOST_CHECK_LE(automatic.GetThreadCount(), 64u);
    BOOST_CHECK_EQUAL(automatic.GetRetryCount(), 1u);

    CPlotter oversized(1000, 5);
    BOOST_CHECK_EQUAL(oversized.GetThreadCount(), 64u);
    BOOST_CHECK_EQUAL(oversized.GetRetryCount(), 5u);
}

BOOST_AUTO_TEST_SUITE_END()
