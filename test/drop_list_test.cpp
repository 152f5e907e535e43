#include "arena/drop_list.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "alloc/blink_alloc.hpp"
#include "core/align.hpp"
#include "test_common.hpp"

using namespace blink;
using namespace blink::arena;

namespace {

struct tracer {
  tracer(std::vector<std::string>* log, std::string name) : log_{log}, name_{std::move(name)} {}
  ~tracer() { log_->push_back(name_); }

  tracer(const tracer&) = delete;
  tracer& operator=(const tracer&) = delete;

  std::vector<std::string>* log_;
  std::string name_;
};

struct alignas(64) wide {
  explicit wide(int* counter) : counter_{counter} {}
  ~wide() { ++*counter_; }

  int* counter_;
};

template <typename T>
void* record_memory(alloc::blink_alloc<>& alloc, std::size_t count = 1) {
  auto l = drop_list::item_layout<T>(count);
  EXPECT_TRUE(l.has_value());
  auto block = alloc.allocate(l->size_, l->align_);
  EXPECT_TRUE(block.has_value());
  return block->data();
}

}  // namespace

TEST(DropListTest, ItemLayoutPlacesValueAfterHeader) {
  EXPECT_EQ(drop_list::value_offset<std::uint8_t>(), sizeof(drops));
  EXPECT_EQ(drop_list::value_offset<wide>(), 64);

  auto scalar = drop_list::item_layout<std::uint64_t>();
  ASSERT_TRUE(scalar.has_value());
  EXPECT_EQ(scalar->size_, sizeof(drops) + sizeof(std::uint64_t));
  EXPECT_EQ(scalar->align_, alignof(drops));

  auto slice = drop_list::item_layout<wide>(3);
  ASSERT_TRUE(slice.has_value());
  EXPECT_EQ(slice->size_, 64 + 3 * sizeof(wide));
  EXPECT_EQ(slice->align_, 64);

  auto overflow = drop_list::item_layout<wide>(std::numeric_limits<std::size_t>::max() / 32);
  ASSERT_FALSE(overflow.has_value());
  EXPECT_EQ(overflow.error(), core::alloc_error::layout_overflow);
}

TEST(DropListTest, ResetRunsDestructorsInReverseOrder) {
  std::vector<std::string> log;
  alloc::blink_alloc<> alloc;
  drop_list list;

  for (const char* name : {"A", "B", "C"}) {
    auto* record = drop_list::emplace_value<tracer>(record_memory<tracer>(alloc), &log, name);
    auto* value = list.add<tracer>(record);
    EXPECT_EQ(value->name_, name);
  }
  EXPECT_FALSE(list.empty());
  EXPECT_TRUE(log.empty());

  list.reset();
  EXPECT_TRUE(list.empty());
  EXPECT_EQ(log, (std::vector<std::string>{"C", "B", "A"}));

  // A second reset has nothing left to finalize.
  list.reset();
  EXPECT_EQ(log.size(), 3);
}

TEST(DropListTest, SliceRecordsDestroyEveryElement) {
  int destroyed = 0;
  alloc::blink_alloc<> alloc;
  drop_list list;

  constexpr std::size_t kCount = 5;
  void* memory = record_memory<wide>(alloc, kCount);
  ASSERT_TRUE(core::is_aligned_to(memory, alignof(wide)));

  auto* first = reinterpret_cast<wide*>(static_cast<std::byte*>(memory) + drop_list::value_offset<wide>());
  for (std::size_t i = 0; i < kCount; ++i) {
    ::new (static_cast<void*>(first + i)) wide(&destroyed);
  }
  auto* record = drop_list::make_record<wide>(memory, kCount);
  wide* values = list.add<wide>(record);
  EXPECT_EQ(values, drop_list::values<wide>(record));
  EXPECT_TRUE(core::is_aligned_to(values, 64));
  EXPECT_EQ(record->count_, kCount);

  list.reset();
  EXPECT_EQ(destroyed, static_cast<int>(kCount));
}

TEST(DropListTest, ValuesStayUsableUntilReset) {
  alloc::blink_alloc<> alloc;
  drop_list list;

  auto* record = drop_list::emplace_value<std::string>(record_memory<std::string>(alloc), 64, 'x');
  std::string* text = list.add<std::string>(record);
  text->append("yz");
  EXPECT_EQ(text->size(), 66);

  auto* shared = drop_list::emplace_value<std::shared_ptr<int>>(record_memory<std::shared_ptr<int>>(alloc),
                                                                std::make_shared<int>(7));
  std::weak_ptr<int> observer = *list.add<std::shared_ptr<int>>(shared);
  EXPECT_FALSE(observer.expired());

  list.reset();
  EXPECT_TRUE(observer.expired());
}

TEST(DropListTest, MoveTransfersRecords) {
  std::vector<std::string> log;
  alloc::blink_alloc<> alloc;

  drop_list source;
  source.add<tracer>(drop_list::emplace_value<tracer>(record_memory<tracer>(alloc), &log, "moved"));

  drop_list target{std::move(source)};
  EXPECT_TRUE(source.empty());
  EXPECT_FALSE(target.empty());

  target.reset();
  EXPECT_EQ(log, (std::vector<std::string>{"moved"}));
}

TEST(DropListDeathTest, DestroyingNonEmptyListFails) {
#if BL_ASSERT_LEVEL >= 3
  EXPECT_DEATH(
      {
        alloc::blink_alloc<> alloc;
        drop_list list;
        list.add<std::uint64_t>(drop_list::emplace_value<std::uint64_t>(record_memory<std::uint64_t>(alloc), 1u));
      },
      "drop_list destroyed with pending records");
#else
  GTEST_SKIP() << "debug assertions are compiled out";
#endif
}
