/**
 * @file test_scangeneration.cpp
 * @brief Unit tests for the ScanGeneration ticket counter
 *
 * The browser posts scan results to the UI thread as closures. These tests
 * replay that queue by hand: a result posted by a superseded scan must not
 * clear the loading flag of the scan that replaced it.
 *
 * @see ScanGeneration
 */

#include "scangeneration.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace {

/** @brief Minimal stand-in for the UI state touched by a posted result */
struct FakeBrowser {
    ScanGeneration generation;
    std::vector<std::function<void()>> posted;
    bool loading = false;
    std::string status;

    ScanGeneration::Ticket start() {
        auto ticket = generation.advance();
        loading = true;
        status.clear();
        return ticket;
    }

    void postResult(ScanGeneration::Ticket ticket, const std::string& summary) {
        posted.push_back([this, ticket, summary]() {
            if (!generation.isCurrent(ticket)) {
                return;
            }
            status = summary;
            loading = false;
        });
    }

    void drain() {
        for (auto& task : posted) {
            task();
        }
        posted.clear();
    }
};

} // namespace

/**
 * @test TicketsIncrease
 */
TEST(ScanGenerationTest, TicketsIncrease) {
    ScanGeneration generation;
    EXPECT_EQ(generation.current(), 0u);

    auto first = generation.advance();
    auto second = generation.advance();

    EXPECT_LT(first, second);
    EXPECT_FALSE(generation.isCurrent(first));
    EXPECT_TRUE(generation.isCurrent(second));
}

/**
 * @test StaleResultKeepsNewScanLoading
 * @brief A result still queued from the previous scan is dropped
 */
TEST(ScanGenerationTest, StaleResultKeepsNewScanLoading) {
    FakeBrowser ui;

    auto first = ui.start();
    ui.postResult(first, "first scan");

    // Rescan before the UI thread has run the queued result
    auto second = ui.start();
    ui.drain();

    EXPECT_TRUE(ui.loading);
    EXPECT_TRUE(ui.status.empty());

    ui.postResult(second, "second scan");
    ui.drain();

    EXPECT_FALSE(ui.loading);
    EXPECT_EQ(ui.status, "second scan");
}

/**
 * @test CurrentResultIsApplied
 */
TEST(ScanGenerationTest, CurrentResultIsApplied) {
    FakeBrowser ui;

    ui.postResult(ui.start(), "done");
    ui.drain();

    EXPECT_FALSE(ui.loading);
    EXPECT_EQ(ui.status, "done");
}

/**
 * @test TicketTakenOnWorkerThread
 * @brief A ticket compared from another thread sees the latest advance
 */
TEST(ScanGenerationTest, TicketTakenOnWorkerThread) {
    ScanGeneration generation;
    auto ticket = generation.advance();

    bool currentBefore = false;
    std::thread worker([&]() { currentBefore = generation.isCurrent(ticket); });
    worker.join();
    generation.advance();

    EXPECT_TRUE(currentBefore);
    EXPECT_FALSE(generation.isCurrent(ticket));
}
