/**
 * @file test_key_storage.cpp
 * @brief Unit tests for key file encoding and key storage backends
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <secure_drive/encryption/key_storage.h>

#include <filesystem>
#include <fstream>
#include <vector>

namespace secure_drive {
namespace {

auto make_material(uint8_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> material(AES_256_KEY_SIZE);
    for (std::size_t i = 0; i < material.size(); ++i) {
        material[i] = static_cast<std::byte>(seed + i);
    }
    return material;
}

// ============================================================================
// Base64 encoding
// ============================================================================

class KeyEncodingTest : public ::testing::Test {};

TEST_F(KeyEncodingTest, EncodesKnownValue) {
    auto bytes = test::to_bytes("secure");
    EXPECT_EQ(encode_key_material(bytes), "c2VjdXJl");
}

TEST_F(KeyEncodingTest, EncodedKeyIsPadded) {
    auto encoded = encode_key_material(make_material(0));
    EXPECT_EQ(encoded.size(), 44u);
    EXPECT_EQ(encoded.back(), '=');
}

TEST_F(KeyEncodingTest, DecodeRestoresMaterial) {
    auto material = make_material(7);
    auto decoded = decode_key_material(encode_key_material(material));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), material);
}

TEST_F(KeyEncodingTest, DecodeIgnoresSurroundingWhitespace) {
    auto material = make_material(3);
    auto text = "  " + encode_key_material(material) + "\n";

    auto decoded = decode_key_material(text);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), material);
}

TEST_F(KeyEncodingTest, DecodeRejectsGarbage) {
    auto decoded = decode_key_material("not*base64!");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::key_corrupt);
}

TEST_F(KeyEncodingTest, DecodeRejectsEmpty) {
    auto decoded = decode_key_material("   \n");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::key_corrupt);
}

// ============================================================================
// Key files
// ============================================================================

class KeyFileTest : public test::TempDirectoryFixture {};

TEST_F(KeyFileTest, WriteThenRead) {
    auto path = test_dir_ / "keys" / "k.key";
    auto material = make_material(1);

    ASSERT_TRUE(write_key_file(path, material).has_value());
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto stored = read_key_file(path);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().material, material);
    EXPECT_TRUE(stored.value().stored_at.has_value());
}

TEST_F(KeyFileTest, ReadMissingFile) {
    auto stored = read_key_file(test_dir_ / "absent.key");
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::key_not_found);
}

TEST_F(KeyFileTest, ReadDirectoryIsCorrupt) {
    auto stored = read_key_file(test_dir_);
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::key_corrupt);
}

TEST_F(KeyFileTest, ReadMalformedFile) {
    auto path = test_dir_ / "bad.key";
    std::ofstream(path) << "%%%%";

    auto stored = read_key_file(path);
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::key_corrupt);
}

TEST_F(KeyFileTest, RestrictToOwner) {
    auto path = test_dir_ / "perm.key";
    ASSERT_TRUE(write_key_file(path, make_material(2)).has_value());

    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::others_read,
                                 std::filesystem::perm_options::replace);
    auto open = is_owner_only(path);
    ASSERT_TRUE(open.has_value());
    EXPECT_FALSE(open.value());

    ASSERT_TRUE(restrict_file_to_owner(path).has_value());
    auto restricted = is_owner_only(path);
    ASSERT_TRUE(restricted.has_value());
    EXPECT_TRUE(restricted.value());
}

TEST_F(KeyFileTest, WrittenFileHasNoGroupOrOtherAccess) {
    namespace fs = std::filesystem;
    auto path = test_dir_ / "fresh.key";
    ASSERT_TRUE(write_key_file(path, make_material(3)).has_value());

    auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    EXPECT_NE(perms & fs::perms::owner_read, fs::perms::none);
}

TEST_F(KeyFileTest, StaleTempFileIsReplaced) {
    namespace fs = std::filesystem;
    auto path = test_dir_ / "stale.key";
    auto temp = fs::path(path.string() + ".tmp");
    std::ofstream(temp) << "leftover";
    fs::permissions(temp,
                    fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);

    auto material = make_material(9);
    ASSERT_TRUE(write_key_file(path, material).has_value());
    EXPECT_FALSE(fs::exists(temp));

    auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    auto stored = read_key_file(path);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().material, material);
}

// ============================================================================
// Storage backends
// ============================================================================

class MemoryKeyStorageTest : public ::testing::Test {
protected:
    std::unique_ptr<memory_key_storage> storage_ = memory_key_storage::create();
};

TEST_F(MemoryKeyStorageTest, StoreRetrieveRemove) {
    auto material = make_material(9);
    ASSERT_TRUE(storage_->store("k", material).has_value());
    EXPECT_TRUE(storage_->exists("k"));

    auto stored = storage_->retrieve("k");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().material, material);

    ASSERT_TRUE(storage_->remove("k").has_value());
    EXPECT_FALSE(storage_->exists("k"));

    auto missing = storage_->retrieve("k");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::key_not_found);
}

TEST_F(MemoryKeyStorageTest, RejectsEmptyName) {
    auto stored = storage_->store("", make_material(0));
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, error_code::invalid_configuration);
}

TEST_F(MemoryKeyStorageTest, AccessAlwaysRestricted) {
    ASSERT_TRUE(storage_->store("k", make_material(0)).has_value());
    auto restricted = storage_->is_access_restricted("k");
    ASSERT_TRUE(restricted.has_value());
    EXPECT_TRUE(restricted.value());
}

class FileKeyStorageTest : public test::TempDirectoryFixture {};

TEST_F(FileKeyStorageTest, StoresUnderDirectory) {
    auto storage = file_key_storage::create(test_dir_ / "keys");
    auto material = make_material(4);

    ASSERT_TRUE(storage->store("encryption.key", material).has_value());
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "keys" / "encryption.key"));
    EXPECT_EQ(storage->location("encryption.key"),
              (test_dir_ / "keys" / "encryption.key").string());

    ASSERT_TRUE(storage->restrict_access("encryption.key").has_value());
    auto restricted = storage->is_access_restricted("encryption.key");
    ASSERT_TRUE(restricted.has_value());
    EXPECT_TRUE(restricted.value());

    auto stored = storage->retrieve("encryption.key");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().material, material);
}

TEST_F(FileKeyStorageTest, StoredKeyOwnerOnlyBeforeRestrict) {
    namespace fs = std::filesystem;
    auto storage = file_key_storage::create(test_dir_ / "keys");
    ASSERT_TRUE(storage->store("encryption.key", make_material(6)).has_value());

    auto path = test_dir_ / "keys" / "encryption.key";
    auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

    auto restricted = storage->is_access_restricted("encryption.key");
    ASSERT_TRUE(restricted.has_value());
    EXPECT_TRUE(restricted.value());
}

TEST_F(FileKeyStorageTest, OverwriteReadOnlyKey) {
    auto storage = file_key_storage::create(test_dir_);
    ASSERT_TRUE(storage->store("k", make_material(1)).has_value());
    ASSERT_TRUE(storage->restrict_access("k").has_value());

    auto replacement = make_material(50);
    ASSERT_TRUE(storage->store("k", replacement).has_value());

    auto stored = storage->retrieve("k");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().material, replacement);
}

TEST_F(FileKeyStorageTest, RemoveMissing) {
    auto storage = file_key_storage::create(test_dir_);
    auto removed = storage->remove("nothing");
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code, error_code::key_not_found);
}

TEST_F(FileKeyStorageTest, DefaultDirectoryIsHidden) {
    auto dir = file_key_storage::default_directory();
    EXPECT_EQ(dir.filename(), ".securedrive");
}

}  // namespace
}  // namespace secure_drive
