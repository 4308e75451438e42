#include <gtest/gtest.h>
#include <dbvh/containers/keyIndex.hpp>

#include <string>
#include <vector>

namespace dbvh {
namespace test {

TEST(KeyIndexTest, SetTryGetOverwrite) {
  KeyIndex<std::string> index;
  EXPECT_FALSE(index.TryGet("a").has_value());

  index.Set("a", 3);
  ASSERT_TRUE(index.TryGet("a").has_value());
  EXPECT_EQ(*index.TryGet("a"), 3);

  index.Set("a", 8);
  EXPECT_EQ(*index.TryGet("a"), 8);
  EXPECT_EQ(index.Size(), 1u);
}

TEST(KeyIndexTest, RemoveReportsPresence) {
  KeyIndex<int> index(16);
  index.Set(1, 0);
  index.Set(2, 1);

  EXPECT_TRUE(index.Remove(1));
  EXPECT_FALSE(index.Remove(1));
  EXPECT_FALSE(index.Contains(1));
  EXPECT_TRUE(index.Contains(2));
}

TEST(KeyIndexTest, ClearAndForEach) {
  KeyIndex<int> index;
  for (int i = 0; i < 10; ++i)
    index.Set(i, i * 2);

  int sum = 0;
  index.ForEach([&sum](int key, int node) { sum += node - key; });
  EXPECT_EQ(sum, 45);

  index.Clear();
  EXPECT_EQ(index.Size(), 0u);
}

} // namespace test
} // namespace dbvh
