/**
 * @file tests/unit/test_user_info_writer.cpp
 * @brief Unit tests for the user info mirror and its writer.
 */
#include "../tests_common.h"

#include "src/user_info_writer.h"

#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using livesync::value_map_t;

TEST(UserInfoEncoding, MultilineRoundTrip) {
  EXPECT_EQ(livesync::encode_multiline("a\r\nb\rc\nd"), "a\\nb\\nc\\nd");
  EXPECT_EQ(livesync::encode_multiline("single"), "single");
  EXPECT_EQ(livesync::decode_multiline("a\\nb\\nc"), "a\nb\nc");
  EXPECT_EQ(livesync::decode_multiline(livesync::encode_multiline("line 1\r\nline 2")), "line 1\nline 2");
}

TEST(UserInfoEncoding, MapsUserKeysToMirrorKeys) {
  const auto mapped = livesync::to_mirror_values({
    {"modname", "My Mod"},
    {"VERSION", "1.2"},
    {"Date", "2026-10-18"},
    {"Notes", "first\nsecond"},
    {"Template", "ignored"},
  });

  EXPECT_EQ(mapped, (value_map_t {
                      {"UI_Date", "2026-10-18"},
                      {"UI_Modname", "My Mod"},
                      {"UI_Notes", "first\\nsecond"},
                      {"UI_Version", "1.2"},
                    }));
}

TEST(MirrorStore, OrdersKeys) {
  const value_map_t values {
    {"Zeta", "1"},
    {"Alpha", "2"},
    {"GameplayTag", "3"},
    {"CodePrefix", "4"},
    {"UI_Notes", "5"},
    {"UI_Modname", "6"},
  };

  EXPECT_EQ(livesync::MirrorStore::ordered_keys(values),
            (std::vector<std::string> {"UI_Modname", "UI_Notes", "CodePrefix", "GameplayTag", "Alpha", "Zeta"}));
}

class MirrorStoreTest: public TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    path = root / "my_AImod_files" / "user_mission_info.json";
  }

  std::filesystem::path path;
};

TEST_F(MirrorStoreTest, MergeKeepsExistingKeys) {
  write(path, "CodePrefix=ABC\r\nbroken line\nUI_Version=0.1\n");
  livesync::MirrorStore store(path);

  ASSERT_TRUE(store.merge({{"UI_Modname", "Mod"}, {"UI_Version", "0.2"}, {"Extra", "a=b"}}));

  EXPECT_EQ(read(path), "UI_Modname=Mod\nUI_Version=0.2\nCodePrefix=ABC\nExtra=a=b\n");
  EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

  const auto values = store.read();
  EXPECT_EQ(values.at("Extra"), "a=b");
  EXPECT_EQ(values.size(), 4u);
}

TEST_F(MirrorStoreTest, ReadMissingFileIsEmpty) {
  livesync::MirrorStore store(path);

  EXPECT_FALSE(store.exists());
  EXPECT_TRUE(store.read().empty());
}

TEST_F(MirrorStoreTest, RemoveDeletesFile) {
  livesync::MirrorStore store(path);
  ASSERT_TRUE(store.merge({{"UI_Modname", "Mod"}}));
  ASSERT_TRUE(store.exists());

  EXPECT_TRUE(store.remove());
  EXPECT_FALSE(store.exists());
  EXPECT_TRUE(store.remove());
}

namespace {
  struct WriterHarness {
    std::mutex mutex;
    std::vector<value_map_t> work_writes;
    std::vector<value_map_t> mirror_writes;
    bool throw_on_work = false;

    livesync::UserInfoWriter::Hooks hooks() {
      return {
        .write_work = [this](const value_map_t &values) {
          std::lock_guard<std::mutex> lock(mutex);
          work_writes.push_back(values);
          if (throw_on_work) {
            throw std::runtime_error("disk full");
          }
        },
        .write_mirror = [this](const value_map_t &values) {
          std::lock_guard<std::mutex> lock(mutex);
          mirror_writes.push_back(values);
          return true;
        },
      };
    }
  };
}  // namespace

TEST(UserInfoWriter, CoalescesBurstIntoOneWrite) {
  WriterHarness harness;
  livesync::UserInfoWriter writer(10s, harness.hooks());

  writer.enqueue({{"Modname", "A"}}, false, true);
  writer.enqueue({{"Modname", "AB"}}, true, false);
  writer.enqueue({{"Modname", "ABC"}, {"Notes", "x\ny"}}, false, false);
  writer.flush();

  EXPECT_EQ(writer.writes_performed(), 1u);
  ASSERT_EQ(harness.work_writes.size(), 1u);
  EXPECT_EQ(harness.work_writes[0].at("Modname"), "ABC");
  ASSERT_EQ(harness.mirror_writes.size(), 1u);
  EXPECT_EQ(harness.mirror_writes[0], (value_map_t {{"UI_Modname", "ABC"}, {"UI_Notes", "x\\ny"}}));
}

TEST(UserInfoWriter, WritesAfterDebounceWindow) {
  WriterHarness harness;
  livesync::UserInfoWriter writer(50ms, harness.hooks());

  writer.enqueue({{"Version", "1"}}, false, true);

  for (int i = 0; i < 200 && writer.writes_performed() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_EQ(writer.writes_performed(), 1u);
  std::lock_guard<std::mutex> lock(harness.mutex);
  ASSERT_EQ(harness.mirror_writes.size(), 1u);
  EXPECT_EQ(harness.mirror_writes[0].at("UI_Version"), "1");
}

TEST(UserInfoWriter, NoMirrorWriteWithoutUserKeys) {
  WriterHarness harness;
  livesync::UserInfoWriter writer(10s, harness.hooks());

  writer.enqueue({{"Template", "t"}}, false, true);
  writer.flush();

  EXPECT_EQ(writer.writes_performed(), 1u);
  EXPECT_TRUE(harness.mirror_writes.empty());
}

TEST(UserInfoWriter, HookFailureDoesNotKillTheConsumer) {
  WriterHarness harness;
  harness.throw_on_work = true;
  livesync::UserInfoWriter writer(10s, harness.hooks());

  writer.enqueue({{"Modname", "A"}}, true, true);
  writer.flush();
  writer.enqueue({{"Modname", "B"}}, true, true);
  writer.flush();

  EXPECT_EQ(writer.writes_performed(), 2u);
  EXPECT_EQ(harness.work_writes.size(), 2u);
  EXPECT_EQ(harness.mirror_writes.size(), 2u);
}

TEST(UserInfoWriter, StopFlushesPendingRequest) {
  WriterHarness harness;
  livesync::UserInfoWriter writer(10s, harness.hooks());

  writer.enqueue({{"Date", "today"}}, false, true);
  writer.stop();

  ASSERT_EQ(harness.mirror_writes.size(), 1u);
  EXPECT_EQ(harness.mirror_writes[0].at("UI_Date"), "today");

  writer.enqueue({{"Date", "tomorrow"}}, false, true);
  writer.flush();
  EXPECT_EQ(harness.mirror_writes.size(), 1u);
}

TEST(UserInfoWriter, FlushWithNothingPendingReturns) {
  WriterHarness harness;
  livesync::UserInfoWriter writer(10s, harness.hooks());

  writer.flush();

  EXPECT_EQ(writer.writes_performed(), 0u);
}

TEST(UserInfoWriter, QueueIsBounded) {
  WriterHarness harness;
  livesync::UserInfoWriter writer(10s, harness.hooks());

  for (std::size_t i = 0; i < livesync::UserInfoWriter::k_queue_capacity * 2; ++i) {
    writer.enqueue({{"Version", std::to_string(i)}}, false, true);
  }
  writer.flush();

  ASSERT_EQ(harness.mirror_writes.size(), 1u);
  EXPECT_EQ(harness.mirror_writes[0].at("UI_Version"), std::to_string(livesync::UserInfoWriter::k_queue_capacity * 2 - 1));
}
