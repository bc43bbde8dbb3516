#include "test_helpers.hpp"
#include "url.hpp"

class UrlTest : public ScratchDirTest {};

TEST_F(UrlTest, SchemeIsLowercased) {
    EXPECT_EQ(url_scheme("HTTPS://example.com/a.tar"), "https");
    EXPECT_EQ(url_scheme("http://example.com/"), "http");
    EXPECT_EQ(url_scheme("ftp://example.com/a"), "ftp");
    EXPECT_EQ(url_scheme("git+ssh://host/repo"), "git+ssh");
}

TEST_F(UrlTest, NoScheme) {
    EXPECT_EQ(url_scheme("example.com/a.tar"), "");
    EXPECT_EQ(url_scheme("/srv/a.tar"), "");
    EXPECT_EQ(url_scheme("://missing"), "");
    EXPECT_EQ(url_scheme("1http://x"), "");
}

TEST_F(UrlTest, HttpCheck) {
    EXPECT_TRUE(is_http_url("http://example.com/a"));
    EXPECT_TRUE(is_http_url("HtTpS://example.com/a"));
    EXPECT_FALSE(is_http_url("file:///etc/passwd"));
    EXPECT_FALSE(is_http_url("ftp://example.com/a"));
    EXPECT_FALSE(is_http_url("example.com/a"));

    EXPECT_NO_THROW(require_http_url("https://example.com/a"));
    EXPECT_THROW(require_http_url("docker://busybox"), SchemeError);
}

TEST_F(UrlTest, Basename) {
    EXPECT_EQ(url_basename("https://example.com/releases/v1/rootfs.tar.gz"), "rootfs.tar.gz");
    EXPECT_EQ(url_basename("https://example.com/dir/"), "dir");
    EXPECT_EQ(url_basename("https://example.com/a.iso?token=abc#frag"), "a.iso");
    EXPECT_EQ(url_basename("http://example.com:8080/x/y.bin"), "y.bin");
}

TEST_F(UrlTest, BasenameWithoutPath) {
    EXPECT_EQ(url_basename("https://example.com"), "");
    EXPECT_EQ(url_basename("https://example.com/"), "");
    EXPECT_EQ(url_basename("https://example.com/.."), "");
}

TEST_F(UrlTest, CachePathIsDeterministicAndAbsolute) {
    fs::path p1 = cache_path_for(work_dir, "https://a.example/one/image.qcow2");
    fs::path p2 = cache_path_for(work_dir, "https://a.example/one/image.qcow2");
    EXPECT_EQ(p1, p2);
    EXPECT_TRUE(p1.is_absolute());
    EXPECT_EQ(p1, fs::absolute(work_dir) / "image.qcow2");
}

TEST_F(UrlTest, SameBasenameCollides) {
    EXPECT_EQ(cache_path_for(work_dir, "https://a.example/x/pkg.tar"),
              cache_path_for(work_dir, "https://b.example/y/pkg.tar"));
}

TEST_F(UrlTest, CachePathRejectsUrlWithoutFile) {
    EXPECT_THROW(cache_path_for(work_dir, "https://example.com/"), CfetchException);
}
