#include <gtest/gtest.h>
#include <dbvh/containers/bvhSnapshot.hpp>
#include <dbvh/core/compression.hpp>
#include <dbvh/core/errors.hpp>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace dbvh {
namespace test {

using physics3D::BoundingVolume;
using math::Vec3;

class SnapshotTest : public ::testing::Test {
protected:
  void SetUp() override {
    Debug::SetMinimumLevel(LogLevel::Error);
    for (int i = 0; i < 50; ++i) {
      const float f = static_cast<float>(i) * 1.5f;
      source_.Insert("body-" + std::to_string(i), BoundingVolume(Vec3(f, -f, 0.25f), Vec3(f + 2.0f, -f + 1.0f, 3.0f)));
    }
  }

  void TearDown() override {
    Debug::SetMinimumLevel(LogLevel::Info);
  }

  static void expectSameEntries(const DynamicBVH<std::string>& a, const DynamicBVH<std::string>& b) {
    ASSERT_EQ(a.Count(), b.Count());
    std::vector<std::string> keys;
    a.GetAllItems(keys);
    for (const auto& key : keys) {
      const auto bounds = b.TryGetBounds(key);
      ASSERT_TRUE(bounds.has_value()) << key;
      EXPECT_EQ(*bounds, *a.TryGetBounds(key)) << key;
    }
  }

  DynamicBVH<std::string> source_;
};

TEST_F(SnapshotTest, JsonDocumentLayout) {
  const nlohmann::json j = source_.ToJson();
  EXPECT_EQ(j.at("version").get<int>(), 1);
  EXPECT_EQ(j.at("count").get<size_t>(), 50u);
  ASSERT_EQ(j.at("entries").size(), 50u);

  const auto& first = j.at("entries").front();
  EXPECT_TRUE(first.at("key").is_string());
  EXPECT_EQ(first.at("min").size(), 3u);
  EXPECT_EQ(first.at("max").size(), 3u);
}

TEST_F(SnapshotTest, JsonRoundTrip) {
  DynamicBVH<std::string> restored;
  restored.Insert("stale", BoundingVolume(Vec3(0.0f), Vec3(1.0f)));

  restored.FromJson(source_.ToJson());
  EXPECT_FALSE(restored.Contains("stale"));
  expectSameEntries(source_, restored);
  EXPECT_TRUE(restored.ValidateStructure());
}

TEST_F(SnapshotTest, MalformedJsonLeavesTreeUnchanged) {
  DynamicBVH<std::string> target;
  target.Insert("keep", BoundingVolume(Vec3(0.0f), Vec3(1.0f)));

  nlohmann::json wrongVersion = source_.ToJson();
  wrongVersion["version"] = 2;
  EXPECT_THROW(target.FromJson(wrongVersion), SnapshotError);

  nlohmann::json inverted = source_.ToJson();
  inverted["entries"][3]["min"] = { 10, 10, 10 };
  inverted["entries"][3]["max"] = { 0, 0, 0 };
  EXPECT_THROW(target.FromJson(inverted), SnapshotError);

  nlohmann::json missingKey = source_.ToJson();
  missingKey["entries"][0].erase("key");
  EXPECT_THROW(target.FromJson(missingKey), SnapshotError);

  nlohmann::json shortVector = source_.ToJson();
  shortVector["entries"][1]["max"] = { 1, 2 };
  EXPECT_THROW(target.FromJson(shortVector), SnapshotError);

  nlohmann::json wrongCount = source_.ToJson();
  wrongCount["count"] = 7;
  EXPECT_THROW(target.FromJson(wrongCount), SnapshotError);

  EXPECT_THROW(target.FromJson(nlohmann::json::array()), SnapshotError);

  EXPECT_EQ(target.Count(), 1u);
  EXPECT_TRUE(target.Contains("keep"));
  EXPECT_TRUE(target.ValidateStructure());
}

TEST_F(SnapshotTest, CompressedRoundTrip) {
  const std::vector<uint8_t> bytes = snapshot::SaveSnapshot(source_);
  ASSERT_GT(bytes.size(), snapshot::HeaderSize);
  EXPECT_TRUE(std::equal(snapshot::Magic.begin(), snapshot::Magic.end(), bytes.begin()));

  DynamicBVH<std::string> restored;
  snapshot::LoadSnapshot(restored, bytes);
  expectSameEntries(source_, restored);
}

TEST_F(SnapshotTest, EmptyTreeRoundTrip) {
  DynamicBVH<std::string> empty;
  const std::vector<uint8_t> bytes = snapshot::SaveSnapshot(empty);

  DynamicBVH<std::string> restored;
  restored.Insert("x", BoundingVolume(Vec3(0.0f), Vec3(1.0f)));
  snapshot::LoadSnapshot(restored, bytes);
  EXPECT_TRUE(restored.Empty());
}

TEST_F(SnapshotTest, CorruptedSnapshotsAreRejected) {
  const std::vector<uint8_t> good = snapshot::SaveSnapshot(source_);
  DynamicBVH<std::string> target;
  target.Insert("keep", BoundingVolume(Vec3(0.0f), Vec3(1.0f)));

  std::vector<uint8_t> badMagic = good;
  badMagic[0] = 'X';
  EXPECT_THROW(snapshot::LoadSnapshot(target, badMagic), SnapshotError);

  std::vector<uint8_t> badVersion = good;
  badVersion[4] = 9;
  EXPECT_THROW(snapshot::LoadSnapshot(target, badVersion), SnapshotError);

  std::vector<uint8_t> truncated(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(good.size() / 2));
  EXPECT_THROW(snapshot::LoadSnapshot(target, truncated), SnapshotError);

  std::vector<uint8_t> headerOnly(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(snapshot::HeaderSize));
  EXPECT_THROW(snapshot::LoadSnapshot(target, headerOnly), SnapshotError);

  std::vector<uint8_t> badPayload = good;
  for (size_t i = snapshot::HeaderSize; i < badPayload.size(); ++i)
    badPayload[i] ^= 0x5A;
  EXPECT_THROW(snapshot::LoadSnapshot(target, badPayload), SnapshotError);

  // Tamanho declarado acima do limite
  EXPECT_THROW(snapshot::LoadSnapshot(target, good, 16), SnapshotError);

  EXPECT_EQ(target.Count(), 1u);
  EXPECT_TRUE(target.Contains("keep"));
}

TEST_F(SnapshotTest, FileRoundTrip) {
  const auto path = std::filesystem::temp_directory_path() / "dbvh_snapshot_test.bin";
  snapshot::WriteSnapshotFile(path, snapshot::SaveSnapshot(source_));

  DynamicBVH<std::string> restored;
  snapshot::LoadSnapshot(restored, snapshot::ReadSnapshotFile(path));
  expectSameEntries(source_, restored);

  std::filesystem::remove(path);
  EXPECT_THROW(snapshot::ReadSnapshotFile(path), SnapshotError);
}

TEST(CompressionTest, RoundTripAndLimits) {
  std::vector<uint8_t> data(4096);
  for (size_t i = 0; i < data.size(); ++i)
    data[i] = static_cast<uint8_t>(i % 17);

  const auto packed = compression::CompressData(data, 9);
  ASSERT_FALSE(packed.empty());
  EXPECT_LT(packed.size(), data.size());

  EXPECT_EQ(compression::UncompressData(packed, data.size()), data);

  Debug::SetMinimumLevel(LogLevel::Error);
  EXPECT_TRUE(compression::UncompressData(packed, data.size() - 1).empty());
  EXPECT_TRUE(compression::UncompressData(packed, data.size(), 1024).empty());
  EXPECT_TRUE(compression::CompressData({}).empty());
  Debug::SetMinimumLevel(LogLevel::Info);
}

} // namespace test
} // namespace dbvh
