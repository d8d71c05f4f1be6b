#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "ctapauth/ctap_error.h"
#include "ctapauth/memory_storage.h"
#include "ctapauth/sealed_storage.h"
#include "test_support.h"

namespace ctapauth {

namespace {

PrivateKeyCredentialSource MakeRecord(uint8_t id, const std::string& rp_id,
                                      uint8_t user_id) {
  PrivateKeyCredentialSource record;
  record.rp_id = rp_id;
  record.user.id = {user_id};
  record.user.name = "user" + std::to_string(user_id);
  record.user.display_name = "User " + std::to_string(user_id);
  record.credential_id = Bytes(32, id);
  record.private_key = Bytes(32, static_cast<uint8_t>(id + 0x80));
  return record;
}

CredentialHandle HandleFor(uint8_t id, const std::string& rp_id) {
  CredentialHandle handle;
  handle.descriptor.id = Bytes(32, id);
  handle.rp_id = rp_id;
  return handle;
}

PublicKeyCredentialDescriptor Descriptor(uint8_t id) {
  PublicKeyCredentialDescriptor descriptor;
  descriptor.id = Bytes(32, id);
  return descriptor;
}

std::vector<Bytes> Ids(const std::vector<CredentialHandle>& handles) {
  std::vector<Bytes> ids;
  for (const auto& handle : handles) ids.push_back(handle.descriptor.id);
  return ids;
}

TEST(MemoryStorageTest, PutAndGet) {
  MemoryCredentialStorage storage;
  EXPECT_EQ(0u, storage.count());

  storage.put_discoverable(MakeRecord(1, "example.com", 0x10));
  EXPECT_EQ(1u, storage.count());
  EXPECT_TRUE(storage.contains(Bytes(32, 1)));
  EXPECT_FALSE(storage.contains(Bytes(32, 2)));

  auto record = storage.get(HandleFor(1, "example.com"));
  ASSERT_TRUE(record);
  EXPECT_EQ("example.com", record->rp_id);
  EXPECT_EQ(Bytes({0x10}), record->user.id);
  EXPECT_TRUE(record->discoverable);
  EXPECT_EQ(1u, record->creation_order);

  // rp 不匹配按不存在处理
  EXPECT_FALSE(storage.get(HandleFor(1, "other.example")));
  EXPECT_FALSE(storage.get(HandleFor(2, "example.com")));
}

TEST(MemoryStorageTest, OverwriteKeepsCreationOrder) {
  MemoryCredentialStorage storage;
  storage.put_discoverable(MakeRecord(1, "example.com", 0x10));
  storage.put_discoverable(MakeRecord(2, "example.com", 0x20));

  auto record = storage.get(HandleFor(1, "example.com"));
  ASSERT_TRUE(record);
  record->sign_count = 7;
  storage.put_discoverable(*record);

  auto updated = storage.get(HandleFor(1, "example.com"));
  ASSERT_TRUE(updated);
  EXPECT_EQ(7u, updated->sign_count);
  EXPECT_EQ(1u, updated->creation_order);
  EXPECT_EQ(2u, storage.count());
}

TEST(MemoryStorageTest, ListDiscoverableNewestFirst) {
  MemoryCredentialStorage storage;
  storage.put_discoverable(MakeRecord(1, "example.com", 0x10));
  storage.put_discoverable(MakeRecord(2, "example.com", 0x20));
  storage.put_discoverable(MakeRecord(3, "other.example", 0x10));
  storage.put_discoverable(MakeRecord(4, "example.com", 0x30));

  EXPECT_EQ(std::vector<Bytes>({Bytes(32, 4), Bytes(32, 2), Bytes(32, 1)}),
            Ids(storage.list_discoverable("example.com")));
  EXPECT_EQ(std::vector<Bytes>({Bytes(32, 3)}),
            Ids(storage.list_discoverable("other.example")));
  EXPECT_TRUE(storage.list_discoverable("unknown.example").empty());
}

TEST(MemoryStorageTest, ListDiscoverableOnePerUser) {
  MemoryCredentialStorage storage;
  storage.put_discoverable(MakeRecord(1, "example.com", 0x10));
  storage.put_discoverable(MakeRecord(2, "example.com", 0x10));

  // 同一用户只列出最新的凭据，旧凭据仍可按 id 取到
  std::vector<CredentialHandle> handles =
      storage.list_discoverable("example.com");
  ASSERT_EQ(1u, handles.size());
  EXPECT_EQ(Bytes(32, 2), handles[0].descriptor.id);
  EXPECT_EQ("user16", handles[0].user.name);
  EXPECT_TRUE(storage.get(HandleFor(1, "example.com")));
  EXPECT_EQ(2u, storage.count());
}

TEST(MemoryStorageTest, NonDiscoverableOnlyBySpecifiedList) {
  MemoryCredentialStorage storage;
  storage.put_non_discoverable(MakeRecord(1, "example.com", 0x10));

  EXPECT_TRUE(storage.list_discoverable("example.com").empty());

  auto handles = storage.list_specified("example.com", {Descriptor(1)});
  ASSERT_EQ(1u, handles.size());
  EXPECT_FALSE(handles[0].discoverable);

  auto record = storage.get(handles[0]);
  ASSERT_TRUE(record);
  EXPECT_FALSE(record->discoverable);
}

TEST(MemoryStorageTest, NonDiscoverableOverwriteLeavesIndex) {
  MemoryCredentialStorage storage;
  storage.put_discoverable(MakeRecord(1, "example.com", 0x10));
  storage.put_non_discoverable(MakeRecord(1, "example.com", 0x10));

  EXPECT_TRUE(storage.list_discoverable("example.com").empty());
  EXPECT_EQ(1u, storage.count());
}

TEST(MemoryStorageTest, ListSpecifiedKeepsOrderAndDedupes) {
  MemoryCredentialStorage storage;
  storage.put_discoverable(MakeRecord(1, "example.com", 0x10));
  storage.put_discoverable(MakeRecord(2, "example.com", 0x20));
  storage.put_discoverable(MakeRecord(3, "other.example", 0x30));

  PublicKeyCredentialDescriptor wrong_type = Descriptor(1);
  wrong_type.type = "password";

  auto handles = storage.list_specified(
      "example.com", {Descriptor(2), Descriptor(9), Descriptor(3),
                      Descriptor(1), Descriptor(2), wrong_type});
  EXPECT_EQ(std::vector<Bytes>({Bytes(32, 2), Bytes(32, 1)}), Ids(handles));
  EXPECT_TRUE(storage.list_specified("example.com", {}).empty());
}

TEST(MemoryStorageTest, RecordsAndRestore) {
  MemoryCredentialStorage storage;
  storage.put_discoverable(MakeRecord(3, "example.com", 0x10));
  storage.put_non_discoverable(MakeRecord(1, "example.com", 0x20));
  storage.put_discoverable(MakeRecord(2, "example.com", 0x10));

  std::vector<PrivateKeyCredentialSource> records = storage.records();
  ASSERT_EQ(3u, records.size());
  EXPECT_EQ(Bytes(32, 3), records[0].credential_id);
  EXPECT_EQ(Bytes(32, 1), records[1].credential_id);
  EXPECT_EQ(Bytes(32, 2), records[2].credential_id);

  MemoryCredentialStorage restored;
  restored.restore(records);
  EXPECT_EQ(3u, restored.count());
  EXPECT_EQ(std::vector<Bytes>({Bytes(32, 2)}),
            Ids(restored.list_discoverable("example.com")));

  // 恢复后新写入的记录排在最后
  restored.put_discoverable(MakeRecord(4, "example.com", 0x40));
  auto after = restored.get(HandleFor(4, "example.com"));
  ASSERT_TRUE(after);
  EXPECT_EQ(4u, after->creation_order);
}

TEST(CredentialSerializerTest, RoundTrip) {
  PrivateKeyCredentialSource first = MakeRecord(1, "example.com", 0x10);
  first.sign_count = 0x01020304;
  first.creation_order = 5;
  PrivateKeyCredentialSource second = MakeRecord(2, "例子.example", 0x20);
  second.discoverable = false;
  second.creation_order = 0x0102030405ULL;

  auto decoded = CredentialSerializer::deserialize(
      CredentialSerializer::serialize({first, second}));
  ASSERT_TRUE(decoded);
  ASSERT_EQ(2u, decoded->size());

  const auto& a = (*decoded)[0];
  EXPECT_EQ(first.credential_id, a.credential_id);
  EXPECT_EQ(first.private_key, a.private_key);
  EXPECT_EQ("example.com", a.rp_id);
  EXPECT_EQ("User 16", a.user.display_name);
  EXPECT_EQ(-7, a.alg);
  EXPECT_EQ(0x01020304u, a.sign_count);
  EXPECT_TRUE(a.discoverable);
  EXPECT_EQ(5u, a.creation_order);

  const auto& b = (*decoded)[1];
  EXPECT_EQ("例子.example", b.rp_id);
  EXPECT_FALSE(b.discoverable);
  EXPECT_EQ(0x0102030405ULL, b.creation_order);
}

TEST(CredentialSerializerTest, EmptyList) {
  Bytes data = CredentialSerializer::serialize({});
  // version | count(0)
  EXPECT_EQ(Bytes({CredentialSerializer::kVersion, 0, 0, 0, 0}), data);

  auto decoded = CredentialSerializer::deserialize(data);
  ASSERT_TRUE(decoded);
  EXPECT_TRUE(decoded->empty());
}

TEST(CredentialSerializerTest, RejectsMalformedData) {
  Bytes data =
      CredentialSerializer::serialize({MakeRecord(1, "example.com", 0x10)});

  Bytes truncated(data.begin(), data.end() - 1);
  EXPECT_FALSE(CredentialSerializer::deserialize(truncated));

  Bytes trailing = data;
  trailing.push_back(0x00);
  EXPECT_FALSE(CredentialSerializer::deserialize(trailing));

  Bytes wrong_version = data;
  wrong_version[0] = 1;
  EXPECT_FALSE(CredentialSerializer::deserialize(wrong_version));

  EXPECT_FALSE(CredentialSerializer::deserialize({}));
  EXPECT_FALSE(CredentialSerializer::deserialize({0x02, 0x00}));
}

TEST(CredentialSerializerTest, RejectsOversizedField) {
  PrivateKeyCredentialSource record = MakeRecord(1, "example.com", 0x10);
  const size_t max_length = CredentialSerializer::kMaxFieldLength;
  record.user.name = std::string(max_length + 1, 'x');
  EXPECT_THROW(CredentialSerializer::serialize({record}), StorageError);

  // 刚好 0xFFFF 字节可以写入并读回
  record.user.name.pop_back();
  Bytes data = CredentialSerializer::serialize({record});
  auto restored = CredentialSerializer::deserialize(data);
  ASSERT_TRUE(restored);
  ASSERT_EQ(1u, restored->size());
  EXPECT_EQ(record.user.name, (*restored)[0].user.name);
}

class SealedFileStorageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path_ = ::testing::TempDir() + "ctapauth_" + info->name() + ".bin";
    std::remove(path_.c_str());
  }

  void TearDown() override {
    std::remove(path_.c_str());
    std::remove((path_ + ".tmp").c_str());
  }

  std::unique_ptr<SealedFileStorage> Open() {
    return std::make_unique<SealedFileStorage>(path_,
                                               std::make_unique<PlainSealer>());
  }

  std::string path_;
};

TEST_F(SealedFileStorageTest, MissingFileStartsEmpty) {
  auto storage = Open();
  EXPECT_EQ(0u, storage->count());
  EXPECT_EQ(path_, storage->path());
}

TEST_F(SealedFileStorageTest, PersistsAcrossReload) {
  {
    auto storage = Open();
    storage->put_discoverable(MakeRecord(1, "example.com", 0x10));
    storage->put_non_discoverable(MakeRecord(2, "example.com", 0x20));
    storage->put_discoverable(MakeRecord(3, "example.com", 0x30));
  }

  auto reloaded = Open();
  EXPECT_EQ(3u, reloaded->count());
  EXPECT_EQ(std::vector<Bytes>({Bytes(32, 3), Bytes(32, 1)}),
            Ids(reloaded->list_discoverable("example.com")));

  auto record = reloaded->get(HandleFor(2, "example.com"));
  ASSERT_TRUE(record);
  EXPECT_FALSE(record->discoverable);
  EXPECT_EQ(Bytes(32, 0x82), record->private_key);
  EXPECT_TRUE(reloaded->contains(Bytes(32, 2)));
}

TEST_F(SealedFileStorageTest, SealFailureLeavesStateUnchanged) {
  SealedFileStorage storage(path_, std::make_unique<test::FailingSealer>());

  EXPECT_THROW(storage.put_discoverable(MakeRecord(1, "example.com", 0x10)),
               StorageError);
  EXPECT_EQ(0u, storage.count());
  EXPECT_FALSE(storage.contains(Bytes(32, 1)));
  EXPECT_TRUE(storage.list_discoverable("example.com").empty());
}

TEST_F(SealedFileStorageTest, OversizedRecordNotWritten) {
  {
    auto storage = Open();
    storage->put_discoverable(MakeRecord(1, "example.com", 0x10));

    PrivateKeyCredentialSource oversized = MakeRecord(2, "example.com", 0x20);
    oversized.user.name = std::string(70000, 'x');
    EXPECT_THROW(storage->put_discoverable(oversized), StorageError);
    EXPECT_EQ(1u, storage->count());
    EXPECT_FALSE(storage->contains(Bytes(32, 2)));
  }

  // 文件仍然可以加载，已有凭据不受影响
  auto reloaded = Open();
  EXPECT_EQ(1u, reloaded->count());
  EXPECT_TRUE(reloaded->contains(Bytes(32, 1)));
}

TEST_F(SealedFileStorageTest, CorruptFileIsRejected) {
  {
    std::ofstream file(path_, std::ios::binary);
    file << "definitely not a credential file";
  }
  EXPECT_THROW(Open(), StorageError);
}

TEST_F(SealedFileStorageTest, UnsealFailureIsRejected) {
  {
    auto storage = Open();
    storage->put_discoverable(MakeRecord(1, "example.com", 0x10));
  }
  EXPECT_THROW(
      SealedFileStorage(path_, std::make_unique<test::FailingSealer>()),
      StorageError);
}

}  // namespace

}  // namespace ctapauth
