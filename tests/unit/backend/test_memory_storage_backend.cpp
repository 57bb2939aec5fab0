/**
 * @file test_memory_storage_backend.cpp
 * @brief Unit tests for the in-process object store backend
 */

#include "test_fixtures.h"

namespace kcenon::transfer_engine::test {

class MemoryStorageBackendTest : public ::testing::Test {
protected:
    static auto read_all(storage_backend& backend, const std::string& locator,
                         uint64_t start = 0, std::optional<uint64_t> end = std::nullopt)
        -> std::string {
        auto stream = backend.open_read_stream(locator, start, end);
        EXPECT_TRUE(stream.has_value());
        if (!stream) {
            return {};
        }
        std::string out;
        std::vector<std::byte> buffer(3);
        while (true) {
            auto got = stream.value()->read(buffer);
            EXPECT_TRUE(got.has_value());
            if (!got || got.value() == 0) {
                break;
            }
            out.append(reinterpret_cast<const char*>(buffer.data()), got.value());
        }
        return out;
    }

    memory_storage_backend backend_;
};

TEST_F(MemoryStorageBackendTest, DefaultName) {
    EXPECT_EQ(backend_.name(), "memory");
    memory_storage_backend named("bucket");
    EXPECT_EQ(named.name(), "bucket");
}

TEST_F(MemoryStorageBackendTest, StatReportsSizeAndDigest) {
    backend_.put_object("fox", "The quick brown fox jumps over the lazy dog");

    auto st = backend_.stat("fox");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st.value().size, 43u);
    EXPECT_EQ(st.value().md5, std::optional<std::string>("9e107d9d372bb6826bd81d3542a419d6"));
}

TEST_F(MemoryStorageBackendTest, MissingObject) {
    auto st = backend_.stat("missing");
    ASSERT_FALSE(st.has_value());
    EXPECT_EQ(st.error().code, error_code::object_not_found);

    auto exists = backend_.exists("missing");
    ASSERT_TRUE(exists.has_value());
    EXPECT_FALSE(exists.value());

    auto stream = backend_.open_read_stream("missing", 0, std::nullopt);
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::object_not_found);
}

TEST_F(MemoryStorageBackendTest, RangedRead) {
    backend_.put_object("obj", "0123456789");
    EXPECT_EQ(read_all(backend_, "obj"), "0123456789");
    EXPECT_EQ(read_all(backend_, "obj", 2, 7), "23456");
    EXPECT_EQ(read_all(backend_, "obj", 8, 100), "89");
    EXPECT_EQ(read_all(backend_, "obj", 20, 30), "");
}

TEST_F(MemoryStorageBackendTest, WriteVisibleOnlyAfterClose) {
    auto writer = backend_.open_write_stream("new", write_options{});
    ASSERT_TRUE(writer.has_value());

    auto put = writer.value()->write(to_bytes("hello"));
    ASSERT_TRUE(put.has_value());
    EXPECT_EQ(put.value(), 5u);
    EXPECT_FALSE(backend_.contains("new"));

    ASSERT_TRUE(writer.value()->close().has_value());
    EXPECT_EQ(backend_.get_object("new"), std::optional<std::string>("hello"));
    EXPECT_EQ(writer.value()->bytes_written(), 5u);
}

TEST_F(MemoryStorageBackendTest, WriteAfterCloseFails) {
    auto writer = backend_.open_write_stream("x", write_options{});
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer.value()->close().has_value());

    auto put = writer.value()->write(to_bytes("late"));
    ASSERT_FALSE(put.has_value());
    EXPECT_EQ(put.error().code, error_code::destination_write_error);
}

TEST_F(MemoryStorageBackendTest, OffsetWriteKeepsExistingBytes) {
    backend_.put_object("obj", "aaaaaaaaaa");

    write_options options;
    options.offset = 4;
    options.truncate = false;
    auto writer = backend_.open_write_stream("obj", options);
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer.value()->write(to_bytes("BB")).has_value());
    ASSERT_TRUE(writer.value()->close().has_value());

    EXPECT_EQ(backend_.get_object("obj"), std::optional<std::string>("aaaaBBaaaa"));
}

TEST_F(MemoryStorageBackendTest, TruncatingWriteReplacesContent) {
    backend_.put_object("obj", "long original content");

    auto writer = backend_.open_write_stream("obj", write_options{});
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer.value()->write(to_bytes("short")).has_value());
    ASSERT_TRUE(writer.value()->close().has_value());

    EXPECT_EQ(backend_.get_object("obj"), std::optional<std::string>("short"));
}

TEST_F(MemoryStorageBackendTest, MetadataIsStored) {
    write_options options;
    options.metadata = {{"content-type", "application/json"}};
    auto writer = backend_.open_write_stream("doc", options);
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer.value()->write(to_bytes("{}")).has_value());
    ASSERT_TRUE(writer.value()->close().has_value());

    auto metadata = backend_.get_metadata("doc");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->at("content-type"), "application/json");
}

TEST_F(MemoryStorageBackendTest, ListAndRemove) {
    backend_.put_object("b", "2");
    backend_.put_object("a", "1");
    EXPECT_EQ(backend_.object_count(), 2u);
    EXPECT_EQ(backend_.list_objects(), (std::vector<std::string>{"a", "b"}));

    backend_.remove_object("a");
    EXPECT_FALSE(backend_.contains("a"));
    EXPECT_EQ(backend_.object_count(), 1u);
}

TEST_F(MemoryStorageBackendTest, ProbeError) {
    EXPECT_TRUE(backend_.probe().has_value());

    backend_.set_probe_error(error(error_code::authentication_failed, "token expired"));
    auto probed = backend_.probe();
    ASSERT_FALSE(probed.has_value());
    EXPECT_EQ(probed.error().code, error_code::authentication_failed);

    backend_.set_probe_error(std::nullopt);
    EXPECT_TRUE(backend_.probe().has_value());
}

TEST_F(MemoryStorageBackendTest, ReadersSeeSnapshot) {
    backend_.put_object("obj", "before");
    auto stream = backend_.open_read_stream("obj", 0, std::nullopt);
    ASSERT_TRUE(stream.has_value());

    backend_.put_object("obj", "after!");

    std::vector<std::byte> buffer(16);
    auto got = stream.value()->read(buffer);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(buffer.data()), got.value()), "before");
}

TEST_F(MemoryStorageBackendTest, DefaultRetryClassification) {
    EXPECT_TRUE(backend_.is_retryable(error(error_code::rate_limited)));
    EXPECT_FALSE(backend_.is_retryable(error(error_code::object_not_found)));
}

}  // namespace kcenon::transfer_engine::test
