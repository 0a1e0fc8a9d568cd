#include <gtest/gtest.h>
#include <thread>
#include "mbt/transfer/progress.h"

using namespace mbt::transfer;
using namespace std::chrono_literals;

namespace {
ProgressEvent event(uint32_t done) {
  ProgressEvent e;
  e.transfer_id = "t1";
  e.chunks_done = done;
  e.chunk_count = 10;
  return e;
}
} // namespace

TEST(ProgressChannel, UnreadEventsAreReplacedByNewerOnes) {
  ProgressChannel ch;
  ch.push(event(1));
  ch.push(event(2));
  ch.push(event(3));
  auto e = ch.try_pop();
  ASSERT_TRUE(e);
  EXPECT_EQ(e->chunks_done, 3u);
  EXPECT_EQ(ch.coalesced(), 2u);
  EXPECT_FALSE(ch.try_pop());
}

TEST(ProgressChannel, WaitPopTimesOutAndWakesOnPush) {
  ProgressChannel ch;
  EXPECT_FALSE(ch.wait_pop(10ms));

  std::thread producer([&] {
    std::this_thread::sleep_for(20ms);
    ch.push(event(5));
  });
  auto e = ch.wait_pop(5s);
  producer.join();
  ASSERT_TRUE(e);
  EXPECT_EQ(e->chunks_done, 5u);
}

TEST(ProgressChannel, CloseDrainsThenEnds) {
  ProgressChannel ch;
  ch.push(event(7));
  ch.close();
  EXPECT_TRUE(ch.closed());
  auto e = ch.wait_pop(1s);
  ASSERT_TRUE(e);
  EXPECT_FALSE(ch.wait_pop(1s));
}
