#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "core/uuid.hpp"
#include "daemon/daemon_store.hpp"
#include "daemon/json_daemon_store.hpp"
#include "test_support.hpp"

using namespace netvisor;
using netvisor::testing::make_daemon;
namespace fs = std::filesystem;

// 两种存储实现共用同一组契约测试
enum class Backend { Memory, Json };

class DaemonStoreTest : public ::testing::TestWithParam<Backend> {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("netvisor_test_" + UUID::generate());
    store_ = open();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  std::shared_ptr<DaemonStore> open() {
    if (GetParam() == Backend::Memory) {
      return std::make_shared<InMemoryDaemonStore>();
    }
    auto store = JsonDaemonStore::open(test_dir_);
    EXPECT_TRUE(store.ok()) << store.error->message;
    return *store.value;
  }

  Daemon stamped(Daemon daemon, int64_t registered_ms) {
    daemon.registered_at = from_epoch_ms(registered_ms);
    daemon.last_seen = daemon.registered_at;
    return daemon;
  }

  fs::path test_dir_;
  std::shared_ptr<DaemonStore> store_;
};

TEST_P(DaemonStoreTest, CreateAndGet) {
  auto daemon = stamped(make_daemon("d1", "h1"), 1000);
  ASSERT_TRUE(store_->create(daemon).ok());

  auto by_id = store_->get_by_id("d1");
  ASSERT_TRUE(by_id.ok());
  ASSERT_TRUE(by_id.value->has_value());
  EXPECT_EQ((*by_id.value)->host_id, "h1");
  EXPECT_EQ((*by_id.value)->ip.to_string(), "10.0.0.5");
  EXPECT_EQ((*by_id.value)->port, 60073);
  EXPECT_EQ((*by_id.value)->registered_at, from_epoch_ms(1000));

  auto by_host = store_->get_by_host_id("h1");
  ASSERT_TRUE(by_host.ok());
  ASSERT_TRUE(by_host.value->has_value());
  EXPECT_EQ((*by_host.value)->id, "d1");

  auto by_key = store_->get_by_api_key_hash("key-d1");
  ASSERT_TRUE(by_key.ok());
  ASSERT_TRUE(by_key.value->has_value());
  EXPECT_EQ((*by_key.value)->id, "d1");
}

TEST_P(DaemonStoreTest, MissIsNotAnError) {
  auto missing = store_->get_by_id("nope");
  ASSERT_TRUE(missing.ok());
  EXPECT_FALSE(missing.value->has_value());

  auto by_host = store_->get_by_host_id("nope");
  ASSERT_TRUE(by_host.ok());
  EXPECT_FALSE(by_host.value->has_value());
}

TEST_P(DaemonStoreTest, OneDaemonPerHost) {
  ASSERT_TRUE(store_->create(make_daemon("d1", "h1")).ok());

  auto second = store_->create(make_daemon("d2", "h1"));
  EXPECT_TRUE(second.is(ErrorKind::Conflict));

  // 原记录不受影响
  auto by_host = store_->get_by_host_id("h1");
  ASSERT_TRUE(by_host.ok());
  EXPECT_EQ((*by_host.value)->id, "d1");
  auto d2 = store_->get_by_id("d2");
  ASSERT_TRUE(d2.ok());
  EXPECT_FALSE(d2.value->has_value());
}

TEST_P(DaemonStoreTest, DuplicateIdAndApiKeyConflict) {
  ASSERT_TRUE(store_->create(make_daemon("d1", "h1")).ok());

  EXPECT_TRUE(store_->create(make_daemon("d1", "h2")).is(ErrorKind::Conflict));

  auto same_key = make_daemon("d3", "h3");
  same_key.api_key = "key-d1";
  EXPECT_TRUE(store_->create(same_key).is(ErrorKind::Conflict));
}

TEST_P(DaemonStoreTest, GetAllFiltersAndOrdersNewestFirst) {
  ASSERT_TRUE(store_->create(stamped(make_daemon("a", "h-a", "net-1"), 1000)).ok());
  ASSERT_TRUE(store_->create(stamped(make_daemon("b", "h-b", "net-1"), 3000)).ok());
  ASSERT_TRUE(store_->create(stamped(make_daemon("c", "h-c", "net-2"), 2000)).ok());
  ASSERT_TRUE(store_->create(stamped(make_daemon("d", "h-d", "net-3"), 4000)).ok());

  auto listed = store_->get_all({"net-1", "net-2"});
  ASSERT_TRUE(listed.ok());
  ASSERT_EQ(listed.value->size(), 3);
  EXPECT_EQ((*listed.value)[0].id, "b");
  EXPECT_EQ((*listed.value)[1].id, "c");
  EXPECT_EQ((*listed.value)[2].id, "a");

  auto none = store_->get_all({});
  ASSERT_TRUE(none.ok());
  EXPECT_TRUE(none.value->empty());
}

TEST_P(DaemonStoreTest, SameRegistrationTimeOrdersById) {
  ASSERT_TRUE(store_->create(stamped(make_daemon("z", "h-z"), 1000)).ok());
  ASSERT_TRUE(store_->create(stamped(make_daemon("m", "h-m"), 1000)).ok());

  auto listed = store_->get_all({"net-1"});
  ASSERT_TRUE(listed.ok());
  ASSERT_EQ(listed.value->size(), 2);
  EXPECT_EQ((*listed.value)[0].id, "m");
  EXPECT_EQ((*listed.value)[1].id, "z");
}

TEST_P(DaemonStoreTest, UpdateKeepsRegistrationAndLiveness) {
  ASSERT_TRUE(store_->create(stamped(make_daemon("d1", "h1"), 1000)).ok());

  auto changed = make_daemon("d1", "h1", "net-9", "192.168.1.20", 7000);
  changed.registered_at = from_epoch_ms(999999);
  changed.last_seen = from_epoch_ms(5000);

  auto updated = store_->update(changed);
  ASSERT_TRUE(updated.ok());
  EXPECT_EQ(updated.value->registered_at, from_epoch_ms(1000));

  auto loaded = store_->get_by_id("d1");
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ((*loaded.value)->network_id, "net-9");
  EXPECT_EQ((*loaded.value)->ip.to_string(), "192.168.1.20");
  EXPECT_EQ((*loaded.value)->port, 7000);
  EXPECT_EQ((*loaded.value)->last_seen, from_epoch_ms(1000));
  EXPECT_EQ((*loaded.value)->registered_at, from_epoch_ms(1000));
}

TEST_P(DaemonStoreTest, TouchOnlyMovesLastSeenForward) {
  ASSERT_TRUE(store_->create(stamped(make_daemon("d1", "h1", "net-1", "10.0.0.5", 7000), 1000)).ok());

  auto touched = store_->touch("d1", from_epoch_ms(4000));
  ASSERT_TRUE(touched.ok());
  EXPECT_EQ(touched.value->last_seen, from_epoch_ms(4000));
  EXPECT_EQ(touched.value->port, 7000);

  auto older = store_->touch("d1", from_epoch_ms(2000));
  ASSERT_TRUE(older.ok());
  EXPECT_EQ(older.value->last_seen, from_epoch_ms(4000));

  auto loaded = store_->get_by_id("d1");
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ((*loaded.value)->last_seen, from_epoch_ms(4000));
  EXPECT_EQ((*loaded.value)->registered_at, from_epoch_ms(1000));

  EXPECT_TRUE(store_->touch("ghost", from_epoch_ms(4000)).is(ErrorKind::NotFound));
}

TEST_P(DaemonStoreTest, ConcurrentTouchesKeepTheLatest) {
  ASSERT_TRUE(store_->create(stamped(make_daemon("d1", "h1"), 1000)).ok());

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, i]() {
      for (int j = 0; j < 20; ++j) {
        // Interleave older and newer timestamps across threads
        int64_t ms = 2000 + ((i * 37 + j * 11) % 160) * 10;
        EXPECT_TRUE(store_->touch("d1", from_epoch_ms(ms)).ok());
      }
    });
  }
  for (auto& t : threads) t.join();

  auto loaded = store_->get_by_id("d1");
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ((*loaded.value)->last_seen, from_epoch_ms(2000 + 159 * 10));
}

TEST_P(DaemonStoreTest, UpdateMissingIsNotFound) {
  auto updated = store_->update(make_daemon("ghost", "h1"));
  EXPECT_TRUE(updated.is(ErrorKind::NotFound));
}

TEST_P(DaemonStoreTest, UpdateOntoTakenHostConflicts) {
  ASSERT_TRUE(store_->create(make_daemon("d1", "h1")).ok());
  ASSERT_TRUE(store_->create(make_daemon("d2", "h2")).ok());

  auto moved = make_daemon("d2", "h1");
  EXPECT_TRUE(store_->update(moved).is(ErrorKind::Conflict));
}

TEST_P(DaemonStoreTest, RemoveIsIdempotent) {
  ASSERT_TRUE(store_->create(make_daemon("d1", "h1")).ok());

  EXPECT_TRUE(store_->remove("d1").ok());
  EXPECT_TRUE(store_->remove("d1").ok());
  EXPECT_TRUE(store_->remove("never-existed").ok());

  auto loaded = store_->get_by_id("d1");
  ASSERT_TRUE(loaded.ok());
  EXPECT_FALSE(loaded.value->has_value());

  // 删除后 host 可以重新注册
  EXPECT_TRUE(store_->create(make_daemon("d2", "h1")).ok());
}

TEST_P(DaemonStoreTest, Ipv6AddressSurvives) {
  ASSERT_TRUE(store_->create(make_daemon("d6", "h6", "net-1", "fd00::1")).ok());

  auto loaded = store_->get_by_id("d6");
  ASSERT_TRUE(loaded.ok());
  EXPECT_TRUE((*loaded.value)->ip.is_v6());
  EXPECT_EQ((*loaded.value)->ip.to_string(), "fd00::1");
}

INSTANTIATE_TEST_SUITE_P(Backends, DaemonStoreTest, ::testing::Values(Backend::Memory, Backend::Json),
                         [](const ::testing::TestParamInfo<Backend>& info) {
                           return info.param == Backend::Memory ? std::string("Memory") : std::string("Json");
                         });

// --- JsonDaemonStore ---

class JsonDaemonStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("netvisor_test_" + UUID::generate());
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  void write_file(const std::string& content) {
    fs::create_directories(test_dir_);
    std::ofstream file(test_dir_ / "daemons.json");
    file << content;
  }

  fs::path test_dir_;
};

TEST_F(JsonDaemonStoreTest, ReopenSeesPersistedRecords) {
  {
    auto store = JsonDaemonStore::open(test_dir_);
    ASSERT_TRUE(store.ok());
    auto daemon = make_daemon("d1", "h1");
    daemon.registered_at = from_epoch_ms(1234);
    ASSERT_TRUE((*store.value)->create(daemon).ok());
    ASSERT_TRUE((*store.value)->create(make_daemon("d2", "h2")).ok());
    ASSERT_TRUE((*store.value)->remove("d2").ok());
  }

  EXPECT_TRUE(fs::exists(test_dir_ / "daemons.json"));
  EXPECT_FALSE(fs::exists(test_dir_ / "daemons.json.tmp"));

  auto reopened = JsonDaemonStore::open(test_dir_);
  ASSERT_TRUE(reopened.ok());
  auto loaded = (*reopened.value)->get_by_id("d1");
  ASSERT_TRUE(loaded.ok());
  ASSERT_TRUE(loaded.value->has_value());
  EXPECT_EQ((*loaded.value)->registered_at, from_epoch_ms(1234));

  auto removed = (*reopened.value)->get_by_id("d2");
  ASSERT_TRUE(removed.ok());
  EXPECT_FALSE(removed.value->has_value());
}

TEST_F(JsonDaemonStoreTest, CorruptIpIsSerializationFailure) {
  write_file(R"([{"id":"d1","host_id":"h1","ip":"not-an-ip","port":60073,"network_id":"net-1","api_key":"k"}])");

  auto store = JsonDaemonStore::open(test_dir_);
  ASSERT_TRUE(store.failed());
  EXPECT_TRUE(store.is(ErrorKind::SerializationFailure));
  EXPECT_NE(store.error->message.find("d1"), std::string::npos);
}

TEST_F(JsonDaemonStoreTest, MalformedFileIsSerializationFailure) {
  write_file("{ not json");
  EXPECT_TRUE(JsonDaemonStore::open(test_dir_).is(ErrorKind::SerializationFailure));

  write_file(R"({"id":"d1"})");
  EXPECT_TRUE(JsonDaemonStore::open(test_dir_).is(ErrorKind::SerializationFailure));
}

TEST_F(JsonDaemonStoreTest, OutOfRangePortIsSerializationFailure) {
  write_file(R"([{"id":"d1","host_id":"h1","ip":"10.0.0.1","port":70000}])");
  EXPECT_TRUE(JsonDaemonStore::open(test_dir_).is(ErrorKind::SerializationFailure));
}
