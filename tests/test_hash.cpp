#include "test_helpers.hpp"
#include "hash.hpp"

class HashTest : public ScratchDirTest {};

TEST_F(HashTest, CalculateSHA256) {
    fs::path path = work_dir / "test.txt";
    write_file(path, "hello world");
    // echo -n "hello world" | sha256sum
    EXPECT_EQ(calculate_sha256(path), HELLO_WORLD_SHA256);
}

TEST_F(HashTest, EmptyFile) {
    fs::path path = work_dir / "empty";
    write_file(path, "");
    EXPECT_EQ(calculate_sha256(path), EMPTY_SHA256);
}

TEST_F(HashTest, SpansSeveralReadBuffers) {
    std::string content;
    for (int i = 0; i < 5000; ++i) content += "abc";
    fs::path path = work_dir / "large.bin";
    write_file(path, content);
    EXPECT_EQ(calculate_sha256(path), "0a53f0c37a58e04f54531e0f8af3ab9f1d74eccc428751cb13da515a917dfe86");
}

TEST_F(HashTest, NoSchemePrefix) {
    fs::path path = work_dir / "test.txt";
    write_file(path, "hello world");
    std::string hash = calculate_sha256(path);
    EXPECT_EQ(hash.size(), 64u);
    EXPECT_EQ(hash.find(':'), std::string::npos);
}

TEST_F(HashTest, MissingFileThrowsHashError) {
    EXPECT_THROW(calculate_sha256(work_dir / "does-not-exist"), HashError);
}
