/**
 * @file test_stream_codec.cpp
 * @brief Unit tests for the AES-256-CBC container codec
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <secure_drive/encryption/stream_codec.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace secure_drive {
namespace {

namespace fs = std::filesystem;

auto make_key(uint8_t fill) -> encryption_key {
    std::vector<std::byte> material(AES_256_KEY_SIZE, static_cast<std::byte>(fill));
    return std::move(encryption_key::from_bytes(material).value());
}

auto hex_to_string(const std::string& hex) -> std::string {
    std::string out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

/**
 * @brief Output buffer that accepts a fixed number of bytes, then rejects writes
 */
class bounded_streambuf : public std::streambuf {
public:
    explicit bounded_streambuf(std::size_t capacity) : capacity_(capacity) {}

    [[nodiscard]] auto size() const -> std::size_t { return data_.size(); }

protected:
    auto overflow(int_type ch) -> int_type override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        if (data_.size() >= capacity_) {
            return traits_type::eof();
        }
        data_.push_back(traits_type::to_char_type(ch));
        return ch;
    }

    auto xsputn(const char* s, std::streamsize n) -> std::streamsize override {
        auto room = capacity_ - data_.size();
        auto accepted = std::min(room, static_cast<std::size_t>(n));
        data_.append(s, accepted);
        return static_cast<std::streamsize>(accepted);
    }

private:
    std::size_t capacity_;
    std::string data_;
};

class StreamCodecTest : public test::TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_console_output(true);
        TempDirectoryFixture::TearDown();
    }

    auto encrypt_string(stream_codec& codec, const std::string& plaintext,
                        const encryption_key& key) -> std::string {
        std::istringstream in(plaintext);
        std::ostringstream out;
        auto written = codec.encrypt(in, out, key);
        EXPECT_TRUE(written.has_value());
        if (written) {
            EXPECT_EQ(written.value(), plaintext.size());
        }
        return out.str();
    }

    auto decrypt_string(stream_codec& codec, const std::string& container,
                        const encryption_key& key) -> result<std::string> {
        std::istringstream in(container);
        std::ostringstream out;
        auto produced = codec.decrypt(in, out, key);
        if (!produced) {
            return unexpected(produced.error());
        }
        return out.str();
    }

    encryption_key key_a_ = make_key(0x11);
    encryption_key key_b_ = make_key(0x22);
};

// ============================================================================
// Container format
// ============================================================================

TEST_F(StreamCodecTest, CreateRejectsInvalidChunkSize) {
    codec_config config;
    config.chunk_size = 0;
    EXPECT_EQ(stream_codec::create(config), nullptr);
}

TEST_F(StreamCodecTest, KnownAnswerVector) {
    auto codec = stream_codec::create({}, std::make_shared<test::fixed_random_source>());
    auto container = encrypt_string(*codec, "0123456789abcdef0123456789abcdef", key_a_);

    std::string expected(16, '\0');
    expected += hex_to_string(
        "e2d39bafb1696de2fd46bcf82fc65c18"
        "ddcb564d731a5659ae98b7d936152cd3"
        "a60b9ba765fba8f5853e6ffc8238f1d8");
    EXPECT_EQ(container, expected);
}

TEST_F(StreamCodecTest, ContainerSizes) {
    auto codec = stream_codec::create();
    EXPECT_EQ(encrypt_string(*codec, "", key_a_).size(), 32u);
    EXPECT_EQ(encrypt_string(*codec, std::string(15, 'x'), key_a_).size(), 32u);
    EXPECT_EQ(encrypt_string(*codec, std::string(16, 'x'), key_a_).size(), 48u);
    EXPECT_EQ(encrypt_string(*codec, std::string(100, 'x'), key_a_).size(), 128u);

    EXPECT_EQ(stream_codec::container_size(0), 32u);
    EXPECT_EQ(stream_codec::container_size(16), 48u);
    EXPECT_EQ(stream_codec::container_size(100), 128u);
}

TEST_F(StreamCodecTest, FreshIvPerEncryption) {
    auto codec = stream_codec::create();
    const std::string plaintext = "same input twice";

    auto first = encrypt_string(*codec, plaintext, key_a_);
    auto second = encrypt_string(*codec, plaintext, key_a_);

    EXPECT_NE(first.substr(0, AES_CBC_IV_SIZE), second.substr(0, AES_CBC_IV_SIZE));
    EXPECT_NE(first, second);
}

TEST_F(StreamCodecTest, IvComesFromRandomSource) {
    auto random = std::make_shared<test::fixed_random_source>(std::byte{0xab});
    auto codec = stream_codec::create({}, random);

    auto container = encrypt_string(*codec, "abc", key_a_);
    EXPECT_EQ(container.substr(0, AES_CBC_IV_SIZE), std::string(16, '\xab'));
    EXPECT_EQ(random->calls(), 1);
}

TEST_F(StreamCodecTest, RandomSourceFailure) {
    auto codec = stream_codec::create({}, std::make_shared<test::failing_random_source>());
    std::istringstream in("data");
    std::ostringstream out;

    auto written = codec->encrypt(in, out, key_a_);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::crypto_failure);
    EXPECT_TRUE(out.str().empty());
}

// ============================================================================
// Round trips
// ============================================================================

TEST_F(StreamCodecTest, RoundTripAcrossChunkBoundaries) {
    codec_config config;
    config.chunk_size = 64;
    auto codec = stream_codec::create(config);

    for (std::size_t size : {0u, 1u, 16u, 63u, 64u, 65u, 1000u}) {
        std::string plaintext(size, '\0');
        for (std::size_t i = 0; i < size; ++i) {
            plaintext[i] = static_cast<char>(i * 7 + 3);
        }
        auto container = encrypt_string(*codec, plaintext, key_a_);
        auto decrypted = decrypt_string(*codec, container, key_a_);
        ASSERT_TRUE(decrypted.has_value()) << "size " << size;
        EXPECT_EQ(decrypted.value(), plaintext) << "size " << size;
    }
}

TEST_F(StreamCodecTest, FileRoundTrip) {
    auto source = create_test_file("photo.jpg", 100 * 1024 + 5);
    auto container = stream_codec::container_path_for(source, staging_dir_);
    auto restored = test_dir_ / "restored.jpg";
    auto codec = stream_codec::create();

    auto encrypted = codec->encrypt_file(source, container, key_a_);
    ASSERT_TRUE(encrypted.has_value()) << encrypted.error().message;
    EXPECT_EQ(encrypted.value(), 100u * 1024 + 5);
    EXPECT_EQ(fs::file_size(container), stream_codec::container_size(100 * 1024 + 5));
    EXPECT_FALSE(fs::exists(container.string() + ".part"));

    auto decrypted = codec->decrypt_file(container, restored, key_a_);
    ASSERT_TRUE(decrypted.has_value()) << decrypted.error().message;
    EXPECT_EQ(decrypted.value(), 100u * 1024 + 5);
    EXPECT_EQ(test::read_file(restored), test::read_file(source));
}

TEST_F(StreamCodecTest, ChunkCallbackReportsCumulativeBytes) {
    codec_config config;
    config.chunk_size = 100;
    auto codec = stream_codec::create(config);

    std::vector<uint64_t> reported;
    std::istringstream in(std::string(250, 'z'));
    std::ostringstream out;
    auto written = codec->encrypt(in, out, key_a_, [&](uint64_t processed) {
        reported.push_back(processed);
        return true;
    });

    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(reported, (std::vector<uint64_t>{100, 200, 250}));
}

// ============================================================================
// Failure taxonomy
// ============================================================================

TEST_F(StreamCodecTest, WrongKeyFailsPadding) {
    auto codec = stream_codec::create({}, std::make_shared<test::fixed_random_source>());
    auto container = encrypt_string(*codec, "0123456789abcdef0123456789abcdef", key_a_);

    auto decrypted = decrypt_string(*codec, container, key_b_);
    ASSERT_FALSE(decrypted.has_value());
    EXPECT_EQ(decrypted.error().code, error_code::authentication_or_padding_failure);
}

TEST_F(StreamCodecTest, TamperedCiphertextDetected) {
    auto codec = stream_codec::create();
    auto container = encrypt_string(*codec, std::string(32, 'q'), key_a_);
    ASSERT_EQ(container.size(), 64u);

    // Last byte of the second-to-last block drives the final padding byte
    container[container.size() - 17] ^= 0x01;

    auto decrypted = decrypt_string(*codec, container, key_a_);
    ASSERT_FALSE(decrypted.has_value());
    EXPECT_EQ(decrypted.error().code, error_code::authentication_or_padding_failure);
}

TEST_F(StreamCodecTest, TamperedIvOfEmptyFileDetected) {
    auto codec = stream_codec::create();
    auto container = encrypt_string(*codec, "", key_a_);
    ASSERT_EQ(container.size(), 32u);

    container[AES_CBC_IV_SIZE - 1] ^= 0x01;

    auto decrypted = decrypt_string(*codec, container, key_a_);
    ASSERT_FALSE(decrypted.has_value());
    EXPECT_EQ(decrypted.error().code, error_code::authentication_or_padding_failure);
}

TEST_F(StreamCodecTest, TruncatedCiphertext) {
    auto codec = stream_codec::create();
    auto container = encrypt_string(*codec, std::string(40, 'a'), key_a_);
    container.resize(container.size() - 5);

    auto decrypted = decrypt_string(*codec, container, key_a_);
    ASSERT_FALSE(decrypted.has_value());
    EXPECT_EQ(decrypted.error().code, error_code::authentication_or_padding_failure);
}

TEST_F(StreamCodecTest, ShortContainerIsMalformed) {
    auto codec = stream_codec::create();
    auto decrypted = decrypt_string(*codec, std::string(10, 'x'), key_a_);
    ASSERT_FALSE(decrypted.has_value());
    EXPECT_EQ(decrypted.error().code, error_code::malformed_container);
}

TEST_F(StreamCodecTest, IvOnlyContainerFailsPadding) {
    auto codec = stream_codec::create();
    auto decrypted = decrypt_string(*codec, std::string(16, 'x'), key_a_);
    ASSERT_FALSE(decrypted.has_value());
    EXPECT_EQ(decrypted.error().code, error_code::authentication_or_padding_failure);
}

TEST_F(StreamCodecTest, MissingSource) {
    auto codec = stream_codec::create();
    auto result = codec->encrypt_file(source_dir_ / "absent.txt",
                                      staging_dir_ / "absent.txt.encrypted", key_a_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_not_found);
    EXPECT_FALSE(fs::exists(staging_dir_ / "absent.txt.encrypted.part"));
}

TEST_F(StreamCodecTest, DirectorySourceUnreadable) {
    auto codec = stream_codec::create();
    auto result = codec->encrypt_file(source_dir_, staging_dir_ / "dir.encrypted", key_a_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::source_unreadable);
}

TEST_F(StreamCodecTest, FailedDecryptLeavesNoOutput) {
    auto source = create_test_file("doc.txt", 500);
    auto container = staging_dir_ / "doc.txt.encrypted";
    auto restored = test_dir_ / "doc.out";
    auto codec = stream_codec::create();

    ASSERT_TRUE(codec->encrypt_file(source, container, key_a_).has_value());

    auto decrypted = codec->decrypt_file(container, restored, key_b_);
    EXPECT_FALSE(decrypted.has_value());
    EXPECT_FALSE(fs::exists(restored));
    EXPECT_FALSE(fs::exists(restored.string() + ".part"));
}

TEST_F(StreamCodecTest, EncryptIntoFullStreamFails) {
    codec_config config;
    config.chunk_size = 1024;
    auto codec = stream_codec::create(config);
    std::istringstream in(std::string(8 * 1024, 'p'));
    bounded_streambuf sink(AES_CBC_IV_SIZE + 4 * 1024);
    std::ostream out(&sink);

    uint64_t last_seen = 0;
    auto result = codec->encrypt(in, out, key_a_, [&](uint64_t processed) {
        last_seen = processed;
        return true;
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::destination_unwritable);
    EXPECT_TRUE(is_io_error(result.error().code));
    EXPECT_LT(last_seen, 8u * 1024);
    EXPECT_LE(sink.size(), AES_CBC_IV_SIZE + 4 * 1024);
}

TEST_F(StreamCodecTest, EncryptFailsWhenIvCannotBeWritten) {
    auto codec = stream_codec::create();
    std::istringstream in("payload");
    bounded_streambuf sink(AES_CBC_IV_SIZE - 1);
    std::ostream out(&sink);

    bool called = false;
    auto result = codec->encrypt(in, out, key_a_, [&](uint64_t) {
        called = true;
        return true;
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::destination_unwritable);
    EXPECT_FALSE(called);
}

TEST_F(StreamCodecTest, EncryptIntoFullDevice) {
    std::ofstream device("/dev/full", std::ios::binary);
    if (!device) {
        GTEST_SKIP() << "/dev/full is not available";
    }
    auto codec = stream_codec::create();
    std::istringstream in(std::string(64 * 1024, 'p'));

    auto result = codec->encrypt(in, device, key_a_);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().code == error_code::destination_unwritable ||
                result.error().code == error_code::disk_full)
        << to_string(result.error().code);
}

TEST_F(StreamCodecTest, EncryptFileUnwritableDestinationLeavesNoOutput) {
    auto source = create_test_file("doc.txt", 4096);
    auto blocker = staging_dir_ / "blocker";
    test::write_file(blocker, std::vector<char>(1, 'x'));
    auto container = blocker / "doc.txt.encrypted";
    auto codec = stream_codec::create();

    auto result = codec->encrypt_file(source, container, key_a_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::destination_unwritable);
    EXPECT_EQ(kind_of(result.error().code), error_kind::io);
    EXPECT_TRUE(fs::is_regular_file(blocker));
    EXPECT_FALSE(fs::exists(container.string() + ".part"));
    EXPECT_TRUE(files_with_suffix(staging_dir_, ".part").empty());
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(StreamCodecTest, CancelStopsAtChunkBoundary) {
    codec_config config;
    config.chunk_size = 1024;
    auto codec = stream_codec::create(config);
    auto source = create_test_file("big.bin", 10 * 1024);
    auto container = staging_dir_ / "big.bin.encrypted";

    uint64_t last_seen = 0;
    auto result = codec->encrypt_file(source, container, key_a_, [&](uint64_t processed) {
        last_seen = processed;
        return processed < 3 * 1024;
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::cancelled);
    EXPECT_EQ(last_seen, 3u * 1024);
    EXPECT_FALSE(fs::exists(container));
    EXPECT_FALSE(fs::exists(container.string() + ".part"));
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(StreamCodecTest, ContainerPathFor) {
    EXPECT_EQ(stream_codec::container_path_for("/data/report.pdf"),
              fs::path("/data/report.pdf.encrypted"));
    EXPECT_EQ(stream_codec::container_path_for("/data/report.pdf", "/staging"),
              fs::path("/staging/report.pdf.encrypted"));
}

TEST_F(StreamCodecTest, IsContainer) {
    auto source = create_test_file("a.txt", 10);
    auto container = staging_dir_ / "a.txt.encrypted";
    auto codec = stream_codec::create();
    ASSERT_TRUE(codec->encrypt_file(source, container, key_a_).has_value());

    EXPECT_TRUE(stream_codec::is_container(container));
    EXPECT_FALSE(stream_codec::is_container(source));

    auto tiny = staging_dir_ / "tiny.encrypted";
    test::write_file(tiny, std::vector<char>(4, 'x'));
    EXPECT_FALSE(stream_codec::is_container(tiny));

    // The path overload also requires the container extension
    auto renamed = staging_dir_ / "a.bin";
    fs::copy_file(container, renamed);
    EXPECT_FALSE(stream_codec::is_container(renamed));
    std::ifstream renamed_stream(renamed, std::ios::binary);
    EXPECT_TRUE(stream_codec::is_container(renamed_stream));

    std::istringstream long_stream(std::string(20, 'x'));
    EXPECT_TRUE(stream_codec::is_container(long_stream));
    EXPECT_EQ(long_stream.tellg(), std::streampos(0));

    std::istringstream short_stream(std::string(3, 'x'));
    EXPECT_FALSE(stream_codec::is_container(short_stream));
}

}  // namespace
}  // namespace secure_drive
