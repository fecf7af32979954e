// salvage headers
#include "core/SessionStore.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <vector>

namespace salvage::test {

  using namespace salvage::core;

  RecoverableFile file(const std::string& id) {
    RecoverableFile f;
    f.id = id;
    f.type = "png";
    f.extension = "png";
    return f;
  }

  TEST(session_store, startsIdle) {
    SessionStore store(SessionKind::Recovery);

    EXPECT_EQ(store.status(), SessionStatus::Idle);
    EXPECT_EQ(store.snapshot().kind, SessionKind::Recovery);
    EXPECT_FALSE(store.sessionId());
    EXPECT_TRUE(store.snapshot().files.empty());
  }

  TEST(session_store, statusNames) {
    EXPECT_STREQ(toString(SessionKind::Scan, SessionStatus::Running), "scanning");
    EXPECT_STREQ(toString(SessionKind::Recovery, SessionStatus::Running), "recovering");
    EXPECT_STREQ(toString(SessionKind::Scan, SessionStatus::Cancelled), "cancelled");
    EXPECT_TRUE(isTerminal(SessionStatus::Error));
    EXPECT_FALSE(isTerminal(SessionStatus::Paused));
  }

  TEST(session_store, sessionIdNeverChangesOnceSet) {
    SessionStore store(SessionKind::Scan);

    EXPECT_TRUE(store.setSessionId("s1"));
    EXPECT_TRUE(store.setSessionId("s1"));
    EXPECT_FALSE(store.setSessionId("s2"));
    EXPECT_EQ(store.sessionId(), std::optional<std::string>("s1"));

    store.reset();
    EXPECT_FALSE(store.sessionId());
    EXPECT_TRUE(store.setSessionId("s2"));
  }

  TEST(session_store, scanProgressIsMonotonic) {
    SessionStore store(SessionKind::Scan);
    ScanProgress first;
    first.bytesScanned = 800;
    first.totalBytes = 1000;
    first.percentage = 80.0;
    first.filesFound = 4;
    first.estimatedSecondsRemaining = 10.0;
    ScanProgress late = first;
    late.bytesScanned = 600;
    late.percentage = 60.0;
    late.filesFound = 2;
    late.estimatedSecondsRemaining = 12.0;

    store.mergeProgress(first);
    store.mergeProgress(late);

    const auto& p = *store.snapshot().scanProgress;
    EXPECT_EQ(p.bytesScanned, 800u);
    EXPECT_DOUBLE_EQ(p.percentage, 80.0);
    EXPECT_EQ(p.filesFound, 4u);
    EXPECT_EQ(p.estimatedSecondsRemaining, std::optional<double>(12.0));
  }

  TEST(session_store, recoveryErrorsAreAppendOnly) {
    SessionStore store(SessionKind::Recovery);
    RecoveryProgress one;
    one.bytesWritten = 10;
    one.errors = { { "f1", "a.jpg", "short read" } };
    RecoveryProgress two = one;
    two.bytesWritten = 20;
    two.errors.push_back({ "f2", "b.jpg", "destination full" });

    store.mergeProgress(one);
    store.mergeProgress(two);
    store.mergeProgress(one); // older resend shrinks nothing

    const auto& p = *store.snapshot().recoveryProgress;
    ASSERT_EQ(p.errors.size(), 2u);
    EXPECT_EQ(p.errors[1].fileId, "f2");
    EXPECT_EQ(p.bytesWritten, 20u);
  }

  TEST(session_store, filesAppendInArrivalOrder) {
    SessionStore store(SessionKind::Scan);

    store.appendFiles({ file("c"), file("a") });
    store.appendFiles({});
    store.appendFiles({ file("b") });

    const auto& files = store.snapshot().files;
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].id, "c");
    EXPECT_EQ(files[1].id, "a");
    EXPECT_EQ(files[2].id, "b");
  }

  TEST(session_store, listenersSeeEveryEffectiveChange) {
    SessionStore store(SessionKind::Scan);
    std::vector<SessionStatus> seen;
    auto sub = store.subscribe([&](const SessionSnapshot& s) { seen.push_back(s.status); });

    store.setStatus(SessionStatus::Running);
    store.setStatus(SessionStatus::Running); // no change, no notification
    store.setStatus(SessionStatus::Paused);
    sub.dispose();
    store.setStatus(SessionStatus::Running);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], SessionStatus::Running);
    EXPECT_EQ(seen[1], SessionStatus::Paused);
  }

  TEST(session_store, disposingAfterStoreIsGoneIsSafe) {
    Subscription sub;
    {
      SessionStore store(SessionKind::Scan);
      sub = store.subscribe([](const SessionSnapshot&) {});
    }
    EXPECT_NO_THROW(sub.dispose());
  }

} // namespace salvage::test
