#include <thread>
#include <vector>

#include <autojudge/result_cache.h>
#include "utils.h"

TEST(ResultCacheTest, PopRemovesEntry) {
  ResultCache cache;
  cache.Put(7, {.status = SubmissionStatus::ACCEPTED, .value = 2.5, .message = "ok"});
  EXPECT_EQ(cache.Size(), 1u);
  auto res = cache.Pop(7);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->message, "ok");
  EXPECT_EQ(res->value, 2.5);
  EXPECT_FALSE(cache.Pop(7));
  EXPECT_EQ(cache.Size(), 0u);
}

TEST(ResultCacheTest, PutOverwrites) {
  ResultCache cache;
  cache.Put(1, {.message = "first"});
  cache.Put(1, {.message = "second", .success = false});
  auto res = cache.Pop(1);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->message, "second");
  EXPECT_FALSE(res->success);
}

TEST(ResultCacheTest, ConcurrentPut) {
  ResultCache cache;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; t++) {
    threads.emplace_back([&cache, t]() {
      for (int i = 0; i < 100; i++) cache.Put(t * 100 + i, {.value = (double)i});
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(cache.Size(), 400u);
  EXPECT_EQ(cache.Pop(399)->value, 99.0);
}
