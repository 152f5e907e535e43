#include "alloc/sync_blink_alloc.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <random>
#include <thread>
#include <vector>

#include "alloc/local_blink_alloc.hpp"
#include "core/align.hpp"
#include "test_common.hpp"

using namespace blink;
using namespace blink::testing;

namespace {

struct tagged_block {
  core::allocation block_;
  std::byte tag_;
};

void expect_disjoint(std::vector<tagged_block> all) {
  for (const auto& entry : all) {
    ASSERT_TRUE(std::ranges::all_of(entry.block_, [&](std::byte v) { return v == entry.tag_; }));
  }
  std::ranges::sort(all, [](const auto& lhs, const auto& rhs) { return lhs.block_.data() < rhs.block_.data(); });
  for (std::size_t i = 1; i < all.size(); ++i) {
    ASSERT_FALSE(overlaps(all[i - 1].block_.data(), all[i - 1].block_.size(), all[i].block_.data(),
                          all[i].block_.size()));
  }
}

}  // namespace

TEST(SyncBlinkAllocTest, ThreadsShareOneAllocator) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 2000;

  tracking_stats stats;
  std::vector<std::vector<tagged_block>> results(kThreads);
  {
    alloc::sync_blink_alloc<tracking_allocator> shared{tracking_allocator{stats}};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&shared, &results, t] {
        std::mt19937_64 rng(static_cast<std::uint64_t>(t) * 977);
        for (int i = 0; i < kPerThread; ++i) {
          const std::size_t size = random_u64_rng(rng, 1, 200);
          const std::size_t align = std::size_t{1} << random_u64_rng(rng, 0, 6);
          auto block = shared.allocate(size, align);
          ASSERT_TRUE(block.has_value());
          ASSERT_TRUE(core::is_aligned_to(block->data(), align));
          const auto tag = static_cast<std::byte>(t + 1);
          std::memset(block->data(), static_cast<int>(tag), block->size());
          results[t].push_back({*block, tag});
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }

    std::vector<tagged_block> all;
    for (const auto& mine : results) {
      all.insert(all.end(), mine.begin(), mine.end());
    }
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads) * kPerThread);
    expect_disjoint(std::move(all));
  }
  EXPECT_EQ(stats.live_chunks(), 0);
}

TEST(SyncBlinkAllocTest, ResetUncheckedReleasesChunks) {
  tracking_stats stats;
  alloc::sync_blink_alloc<tracking_allocator> shared{tracking_allocator{stats}};
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(shared.allocate(128).has_value());
  }
  ASSERT_GT(stats.live_chunks(), 1);

  shared.reset_unchecked();
  EXPECT_EQ(stats.live_chunks(), 1);

  shared.reset(false);
  EXPECT_EQ(stats.live_chunks(), 0);
}

TEST(SyncBlinkAllocTest, ResizeAndZeroedVariants) {
  alloc::sync_blink_alloc<> shared;
  auto block = shared.allocate_zeroed(48, 16);
  ASSERT_TRUE(block.has_value());
  EXPECT_TRUE(std::ranges::all_of(*block, [](std::byte v) { return v == std::byte{0}; }));
  std::memset(block->data(), 0x21, block->size());

  auto grown = shared.resize_zeroed(block->data(), 48, 16, 96, 16);
  ASSERT_TRUE(grown.has_value());
  EXPECT_EQ(grown->data(), block->data());
  EXPECT_TRUE(std::all_of(grown->begin(), grown->begin() + 48, [](std::byte v) { return v == std::byte{0x21}; }));
  EXPECT_TRUE(std::all_of(grown->begin() + 48, grown->end(), [](std::byte v) { return v == std::byte{0}; }));

  shared.deallocate(grown->data(), grown->size());
  auto again = shared.allocate(16, 16);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->data(), block->data());
}

TEST(LocalBlinkAllocTest, ProxyCarvesChunksFromShared) {
  tracking_stats stats;
  alloc::sync_blink_alloc<tracking_allocator> shared{tracking_allocator{stats}};
  {
    alloc::local_blink_alloc proxy{shared};
    EXPECT_EQ(&proxy.shared(), &shared);

    auto first = proxy.allocate(8, 8);
    auto second = proxy.allocate(8, 8);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(second->data(), first->data() + 8);

    // One proxy chunk, itself served by one shared chunk.
    EXPECT_EQ(proxy.engine().chunk_count(), 1);
    EXPECT_EQ(shared.engine().chunk_count(), 1);
    EXPECT_EQ(stats.allocations_, 1);
  }

  // The proxy handed its only chunk back, so the shared cursor rewound.
  auto block = shared.allocate(8, 8);
  ASSERT_TRUE(block.has_value());
  EXPECT_EQ(stats.allocations_, 1);

  shared.reset(false);
  EXPECT_EQ(stats.live_chunks(), 0);
}

TEST(LocalBlinkAllocTest, ProxiesPerThreadAreDisjoint) {
  constexpr int kThreads = 6;
  constexpr int kPerThread = 3000;

  tracking_stats stats;
  alloc::sync_blink_alloc<tracking_allocator> shared{tracking_allocator{stats}};
  std::vector<alloc::local_blink_alloc<tracking_allocator>> proxies;
  proxies.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    proxies.emplace_back(shared);
  }

  std::vector<std::vector<tagged_block>> results(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&proxies, &results, t] {
      auto& proxy = proxies[t];
      std::mt19937_64 rng(static_cast<std::uint64_t>(t) + 11);
      for (int i = 0; i < kPerThread; ++i) {
        const std::size_t size = random_u64_rng(rng, 1, 300);
        const std::size_t align = std::size_t{1} << random_u64_rng(rng, 0, 5);
        auto block = proxy.allocate(size, align);
        ASSERT_TRUE(block.has_value());
        ASSERT_TRUE(core::is_aligned_to(block->data(), align));
        const auto tag = static_cast<std::byte>(0x40 + t);
        std::memset(block->data(), static_cast<int>(tag), block->size());
        results[t].push_back({*block, tag});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::vector<tagged_block> all;
  for (const auto& mine : results) {
    all.insert(all.end(), mine.begin(), mine.end());
  }
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads) * kPerThread);
  expect_disjoint(std::move(all));

  proxies.clear();
  shared.reset(false);
  EXPECT_EQ(stats.live_chunks(), 0);
}

template <typename T>
concept shared_usable = requires(T& alloc) {
  alloc.allocate(8, 8);
  alloc.deallocate(nullptr, 8);
  alloc.reset_unchecked(false);
};

template <typename T>
concept exclusively_resettable = requires(T& alloc) {
  alloc.reset(false);
  alloc.reset_leak(false);
};

// Concurrent operations go through a const reference, reset needs the allocator itself.
static_assert(shared_usable<const alloc::sync_blink_alloc<>>);
static_assert(exclusively_resettable<alloc::sync_blink_alloc<>>);
static_assert(!exclusively_resettable<const alloc::sync_blink_alloc<>>);

TEST(SyncBlinkAllocTest, SharedReferenceCanResetUnchecked) {
  tracking_stats stats;
  alloc::sync_blink_alloc<tracking_allocator> owner{tracking_allocator{stats}};
  const alloc::sync_blink_alloc<tracking_allocator>& shared = owner;

  std::thread worker([&shared] {
    for (int i = 0; i < 100; ++i) {
      ASSERT_TRUE(shared.allocate(128).has_value());
    }
  });
  worker.join();
  ASSERT_GT(stats.live_chunks(), 1);

  shared.reset_unchecked(true);
  EXPECT_EQ(stats.live_chunks(), 1);
  EXPECT_EQ(shared.engine().chunk_count(), 1);

  shared.reset_unchecked(false);
  EXPECT_EQ(stats.live_chunks(), 0);
}

TEST(SyncBlinkAllocTest, ResetLeakForgetsChunks) {
  tracking_stats stats;
  alloc::sync_blink_alloc<tracking_allocator> shared{tracking_allocator{stats}};
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(shared.allocate(128).has_value());
  }
  const std::size_t held = stats.live_chunks();
  ASSERT_GT(held, 1);

  shared.reset_leak(true);
  EXPECT_EQ(shared.engine().chunk_count(), 1);
  EXPECT_EQ(stats.deallocations_, 0);

  shared.reset_leak(false);
  EXPECT_EQ(shared.engine().chunk_count(), 0);
  EXPECT_EQ(stats.deallocations_, 0);
  EXPECT_EQ(stats.live_chunks(), held);

  shared.backing().release_leaked();
  EXPECT_EQ(stats.live_chunks(), 0);
}

TEST(LocalBlinkAllocTest, ProxyResizeZeroedAndResetLeak) {
  tracking_stats stats;
  alloc::sync_blink_alloc<tracking_allocator> shared{tracking_allocator{stats}};
  {
    alloc::local_blink_alloc proxy{shared};

    auto block = proxy.allocate(32, 8);
    ASSERT_TRUE(block.has_value());
    std::memset(block->data(), 0x3E, block->size());

    auto grown = proxy.resize_zeroed(block->data(), 32, 8, 80, 8);
    ASSERT_TRUE(grown.has_value());
    EXPECT_EQ(grown->data(), block->data());
    EXPECT_TRUE(std::all_of(grown->begin(), grown->begin() + 32, [](std::byte v) { return v == std::byte{0x3E}; }));
    EXPECT_TRUE(std::all_of(grown->begin() + 32, grown->end(), [](std::byte v) { return v == std::byte{0}; }));

    auto fresh = proxy.resize_zeroed(nullptr, 0, 1, 16, 8);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_TRUE(std::ranges::all_of(*fresh, [](std::byte v) { return v == std::byte{0}; }));

    // The proxy forgets its chunk; it stays allocated inside the shared one.
    proxy.reset_leak(false);
    EXPECT_EQ(proxy.engine().chunk_count(), 0);
  }
  EXPECT_EQ(shared.engine().chunk_count(), 1);
  EXPECT_EQ(stats.deallocations_, 0);

  shared.reset(false);
  EXPECT_EQ(stats.live_chunks(), 0);
}
