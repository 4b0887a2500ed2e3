#include "gtest/gtest.h"
#include "Runner/AdmissionController.h"

#include <stdexcept>

using namespace taskpool;

TEST(AdmissionController, FillsUpToTheCapInInputOrder)
{
    AdmissionController ac(5, 3, {});
    std::vector<size_t> admitted;
    ac.fill(admitted);

    EXPECT_EQ(admitted, (std::vector<size_t>{ 0, 1, 2 }));
    EXPECT_EQ(ac.running(), (RunningSet{ 0, 1, 2 }));
    EXPECT_EQ(ac.pending(), (std::vector<size_t>{ 3, 4 }));
    EXPECT_FALSE(ac.stuck());

    admitted.clear();
    ac.fill(admitted);
    EXPECT_TRUE(admitted.empty());
}

TEST(AdmissionController, FinishFreesASlot)
{
    AdmissionController ac(3, 1, {});
    std::vector<size_t> admitted;
    ac.fill(admitted);
    ac.finish(0);

    admitted.clear();
    ac.fill(admitted);
    EXPECT_EQ(admitted, (std::vector<size_t>{ 1 }));
}

TEST(AdmissionController, RejectedCandidatesStayPendingInOrder)
{
    AdmissionController ac(4, 4, [](size_t i, const RunningSet&) { return i % 2 == 1; });
    std::vector<size_t> admitted;
    ac.fill(admitted);

    EXPECT_EQ(admitted, (std::vector<size_t>{ 1, 3 }));
    EXPECT_EQ(ac.pending(), (std::vector<size_t>{ 0, 2 }));
    EXPECT_FALSE(ac.stuck());

    ac.finish(1);
    ac.finish(3);
    EXPECT_TRUE(ac.stuck());
    EXPECT_TRUE(ac.has_predicate());
}

TEST(AdmissionController, RescanAfterEachAdmission)
{
    // 0 needs 2 to be running, 2 is always fine
    AdmissionController ac(3, 3, [](size_t i, const RunningSet& r) { return i != 0 || r.count(2) > 0; });
    std::vector<size_t> admitted;
    ac.fill(admitted);

    // 1 first, then 2, and the restarted scan picks up 0
    EXPECT_EQ(admitted, (std::vector<size_t>{ 1, 2, 0 }));
}

TEST(AdmissionController, PredicateNotConsultedWhenFull)
{
    int calls = 0;
    AdmissionController ac(3, 1, [&](size_t, const RunningSet&) { ++calls; return true; });
    std::vector<size_t> admitted;
    ac.fill(admitted);
    EXPECT_EQ(calls, 1);
    ac.fill(admitted);
    EXPECT_EQ(calls, 1);
}

TEST(AdmissionController, UnadmitRestoresPendingOrder)
{
    int seen = 0;
    AdmissionController ac(4, 4, [&](size_t, const RunningSet&) {
        if (++seen == 3) throw std::runtime_error("boom");
        return true;
    });
    std::vector<size_t> admitted;
    EXPECT_THROW(ac.fill(admitted), std::runtime_error);
    EXPECT_EQ(admitted, (std::vector<size_t>{ 0, 1 }));

    ac.unadmit(admitted);
    EXPECT_TRUE(ac.running().empty());
    EXPECT_EQ(ac.pending(), (std::vector<size_t>{ 0, 1, 2, 3 }));
}

TEST(AdmissionController, NothingToDoIsNotStuck)
{
    AdmissionController ac(0, 2, [](size_t, const RunningSet&) { return false; });
    std::vector<size_t> admitted;
    ac.fill(admitted);
    EXPECT_TRUE(admitted.empty());
    EXPECT_FALSE(ac.stuck());
}
