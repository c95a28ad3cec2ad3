// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "sidecar/SidecarHandle.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace {

struct ChildJournal {
    std::atomic<int> kills{0};
    std::atomic<int> waits{0};
};

class FakeChild final : public Sidecar::ISidecarChild
{
public:
    explicit FakeChild(std::shared_ptr<ChildJournal> journal) : m_journal(std::move(journal)) {}

    qint64 processId() const override { return 4242; }
    void kill() override { ++m_journal->kills; }
    int waitForExit() override
    {
        ++m_journal->waits;
        return 9;
    }

private:
    std::shared_ptr<ChildJournal> m_journal;
};

Sidecar::SidecarHandle makeHandle(const std::shared_ptr<ChildJournal>& journal)
{
    return Sidecar::SidecarHandle(std::make_unique<FakeChild>(journal));
}

} // namespace

TEST(SidecarHandleTests, DestroyingHandleKillsAndWaits)
{
    auto journal = std::make_shared<ChildJournal>();
    {
        auto handle = makeHandle(journal);
        EXPECT_EQ(handle.processId(), 4242);
    }
    EXPECT_EQ(journal->kills, 1);
    EXPECT_EQ(journal->waits, 1);
}

TEST(SidecarHandleTests, MovingTransfersOwnership)
{
    auto journal = std::make_shared<ChildJournal>();
    {
        auto first = makeHandle(journal);
        Sidecar::SidecarHandle second(std::move(first));
        EXPECT_TRUE(first.isEmpty());
        EXPECT_FALSE(second.isEmpty());
        EXPECT_EQ(second.terminate(), 9);
        EXPECT_EQ(second.terminate(), std::nullopt);
    }
    EXPECT_EQ(journal->kills, 1);
    EXPECT_EQ(journal->waits, 1);
}

TEST(SidecarHandleTests, ExitThenDropTerminatesExactlyOnce)
{
    auto journal = std::make_shared<ChildJournal>();
    auto state = std::make_shared<Sidecar::SidecarSlot>(makeHandle(journal));
    {
        Sidecar::SidecarProcessGuard guard(state);
        EXPECT_TRUE(state->holdsHandle());
        EXPECT_TRUE(Sidecar::terminateSidecar(state, "on exit"));
        EXPECT_FALSE(state->holdsHandle());
        EXPECT_FALSE(Sidecar::terminateSidecar(state, "on exit"));
    }
    EXPECT_EQ(journal->kills, 1);
    EXPECT_EQ(journal->waits, 1);
}

TEST(SidecarHandleTests, DropAloneTerminates)
{
    auto journal = std::make_shared<ChildJournal>();
    auto state = std::make_shared<Sidecar::SidecarSlot>(makeHandle(journal));
    {
        Sidecar::SidecarProcessGuard guard(state);
    }
    EXPECT_EQ(journal->kills, 1);
    EXPECT_EQ(journal->waits, 1);
    EXPECT_FALSE(state->take().has_value());
}

TEST(SidecarHandleTests, ConcurrentTakersHaveOneWinner)
{
    auto journal = std::make_shared<ChildJournal>();
    auto state = std::make_shared<Sidecar::SidecarSlot>(makeHandle(journal));

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&state, &winners] {
            if (Sidecar::terminateSidecar(state, "on exit"))
                ++winners;
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(winners, 1);
    EXPECT_EQ(journal->kills, 1);
    EXPECT_EQ(journal->waits, 1);
}

TEST(SidecarHandleTests, EmptyStateIsHarmless)
{
    EXPECT_FALSE(Sidecar::terminateSidecar(nullptr, "on exit"));

    auto state = std::make_shared<Sidecar::SidecarSlot>();
    EXPECT_FALSE(state->holdsHandle());
    EXPECT_FALSE(Sidecar::terminateSidecar(state, "on drop"));
}
