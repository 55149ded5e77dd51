#include <cstdint>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

#include "core/config.hpp"
#include "core/track_manager.hpp"

namespace {

pcc::Detection Det(float x, float y) {
  pcc::Detection d;
  d.bbox = pcc::BBox{x, y, 20.f, 20.f};
  d.confidence = 0.9f;
  return d;
}

pcc::TrackingConfig Config(int n, int max_missed, int grace) {
  pcc::TrackingConfig cfg;
  cfg.min_confirmed_frames = n;
  cfg.max_missed_frames = max_missed;
  cfg.lost_grace_frames = grace;
  return cfg;
}

} // namespace

TEST(TrackManagerTest, ConfirmsAfterExactlyN) {
  pcc::TrackManager tm(Config(3, 5, 10));
  const pcc::TrackId id = tm.spawn(Det(0.f, 0.f), 0);
  EXPECT_EQ(id, 1u);
  EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Tentative);

  tm.predict();
  tm.update(0, Det(0.f, 0.f), 1);
  EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Tentative);

  tm.predict();
  tm.update(0, Det(0.f, 0.f), 2);
  EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Confirmed);
  EXPECT_EQ(tm.tracks()[0].hits, 3);
  EXPECT_EQ(tm.tracks()[0].age_frames, 2);
  EXPECT_EQ(tm.counts().confirmed, 1u);
}

TEST(TrackManagerTest, SingleHitConfirmsImmediately) {
  pcc::TrackManager tm(Config(1, 5, 10));
  tm.spawn(Det(0.f, 0.f), 0);
  EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Confirmed);
}

TEST(TrackManagerTest, TentativeMissIsDeleted) {
  pcc::TrackManager tm(Config(3, 5, 10));
  tm.spawn(Det(0.f, 0.f), 0);
  tm.predict();
  tm.update(0, Det(0.f, 0.f), 1);   // N - 1 hits

  tm.predict();
  tm.mark_missed(0);
  EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Deleted);
  EXPECT_EQ(tm.counts().live(), 0u);

  // Deleted tracks can't be touched again
  EXPECT_THROW(tm.update(0, Det(0.f, 0.f), 2), std::logic_error);
  EXPECT_THROW(tm.mark_missed(0), std::logic_error);

  const std::vector<pcc::TrackId> removed = tm.sweep();
  ASSERT_EQ(removed.size(), 1u);
  EXPECT_EQ(removed[0], 1u);
  EXPECT_TRUE(tm.tracks().empty());
  EXPECT_EQ(tm.find(1), nullptr);
}

TEST(TrackManagerTest, OutOfRangeIndexThrows) {
  pcc::TrackManager tm(Config(3, 5, 10));
  EXPECT_THROW(tm.update(0, Det(0.f, 0.f), 0), std::logic_error);
  tm.spawn(Det(0.f, 0.f), 0);
  EXPECT_THROW(tm.mark_missed(3), std::logic_error);
}

TEST(TrackManagerTest, ConfirmedToLostAndBack) {
  pcc::TrackManager tm(Config(1, 2, 3));
  tm.spawn(Det(0.f, 0.f), 0);

  // Misses up to max_missed are tolerated
  for (int miss = 1; miss <= 2; ++miss) {
    tm.predict();
    tm.mark_missed(0);
    EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Confirmed) << "miss " << miss;
  }

  tm.predict();
  tm.mark_missed(0);
  EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Lost);
  EXPECT_EQ(tm.counts().lost, 1u);
  EXPECT_TRUE(tm.sweep().empty());

  // Re-matched inside the grace window: same identity, confirmed again
  tm.predict();
  tm.update(0, Det(0.f, 0.f), 4);
  EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Confirmed);
  EXPECT_EQ(tm.tracks()[0].id, 1u);
  EXPECT_EQ(tm.tracks()[0].time_since_update, 0);
}

TEST(TrackManagerTest, LostExpiresAfterGrace) {
  pcc::TrackManager tm(Config(1, 2, 3));
  tm.spawn(Det(0.f, 0.f), 0);

  // Lost after 3 misses, deleted once misses exceed 2 + 3
  for (int miss = 1; miss <= 5; ++miss) {
    tm.predict();
    tm.mark_missed(0);
    EXPECT_TRUE(tm.sweep().empty()) << "miss " << miss;
  }
  EXPECT_TRUE(tm.tracks()[0].state == pcc::TrackState::Lost);

  tm.predict();
  tm.mark_missed(0);
  const std::vector<pcc::TrackId> removed = tm.sweep();
  EXPECT_EQ(removed.size(), 1u);
  EXPECT_TRUE(tm.tracks().empty());
}

TEST(TrackManagerTest, IdsNeverReused) {
  pcc::TrackManager tm(Config(3, 5, 10));

  pcc::TrackId last = 0;
  for (int round = 0; round < 4; ++round) {
    // Same place every time, each one dies tentative
    const pcc::TrackId id = tm.spawn(Det(10.f, 10.f), static_cast<std::uint64_t>(round));
    EXPECT_GT(id, last);
    last = id;

    tm.predict();
    tm.mark_missed(0);
    tm.sweep();
  }
  EXPECT_EQ(last, 4u);
  EXPECT_EQ(tm.next_id(), 5u);
}

TEST(TrackManagerTest, HistoryBounded) {
  pcc::TrackingConfig cfg = Config(1, 5, 10);
  cfg.history_length = 4;
  pcc::TrackManager tm(cfg);
  tm.spawn(Det(0.f, 0.f), 0);

  for (std::uint64_t f = 1; f < 10; ++f) {
    tm.predict();
    tm.update(0, Det(static_cast<float>(f), 0.f), f);
  }

  const pcc::Track& t = tm.tracks()[0];
  ASSERT_EQ(t.history.size(), 4u);
  EXPECT_EQ(t.history.front().frame_id, 6u);
  EXPECT_EQ(t.history.back().frame_id, 9u);
  EXPECT_EQ(t.history.back().seq, 10u);
  EXPECT_NEAR(t.history.back().centroid.x, 19.0, 1e-5);
}

TEST(TrackManagerTest, EmbeddingKeptWhenMissing) {
  pcc::TrackManager tm(Config(3, 5, 10));
  pcc::Detection first = Det(0.f, 0.f);
  first.embedding = pcc::Embedding{1.f, 0.f};
  tm.spawn(first, 0);

  tm.predict();
  tm.update(0, Det(0.f, 0.f), 1);
  ASSERT_TRUE(tm.tracks()[0].embedding.has_value());
  EXPECT_NEAR((*tm.tracks()[0].embedding)[0], 1.0, 1e-6);
}

TEST(TrackManagerTest, FindAndCounts) {
  pcc::TrackManager tm(Config(2, 5, 10));
  tm.spawn(Det(0.f, 0.f), 0);
  tm.spawn(Det(100.f, 0.f), 0);
  tm.spawn(Det(200.f, 0.f), 0);

  tm.predict();
  tm.update(1, Det(100.f, 0.f), 1);

  ASSERT_NE(tm.find(2), nullptr);
  EXPECT_TRUE(tm.find(2)->state == pcc::TrackState::Confirmed);
  EXPECT_EQ(tm.find(7), nullptr);

  const pcc::TrackStateCounts c = tm.counts();
  EXPECT_EQ(c.tentative, 2u);
  EXPECT_EQ(c.confirmed, 1u);
  EXPECT_EQ(c.live(), 3u);
}
