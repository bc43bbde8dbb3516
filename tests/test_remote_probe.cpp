#include "test_helpers.hpp"
#include "remote_probe.hpp"

class RemoteProbeTest : public ScratchDirTest {
protected:
    FakeHttpClient client;
    const std::string url = "https://mirror.example/images/rootfs.tar";
};

TEST_F(RemoteProbeTest, ReadsChecksumAndLength) {
    client.serve(url, FRESH_BODY).headers.add(CHECKSUM_HEADER, FRESH_SHA256);

    RemoteDescriptor remote = probe_remote(client, url);
    EXPECT_EQ(remote.sha256, FRESH_SHA256);
    EXPECT_EQ(remote.length, "17");
    ASSERT_EQ(client.head_calls.size(), 1u);
    EXPECT_TRUE(client.get_calls.empty());
}

TEST_F(RemoteProbeTest, HeaderNamesAreCaseInsensitive) {
    auto& r = client.resources[url];
    r.headers.add("x-checksum-sha256", OLD_SHA256);
    r.headers.add("CONTENT-LENGTH", "15");

    RemoteDescriptor remote = probe_remote(client, url);
    EXPECT_EQ(remote.sha256, OLD_SHA256);
    EXPECT_EQ(remote.length, "15");
}

TEST_F(RemoteProbeTest, MissingHeadersAreNotAnError) {
    client.resources[url];

    RemoteDescriptor remote;
    ASSERT_NO_THROW(remote = probe_remote(client, url));
    EXPECT_TRUE(remote.sha256.empty());
    EXPECT_TRUE(remote.length.empty());
}

TEST_F(RemoteProbeTest, StatusIsNotInterpreted) {
    RemoteDescriptor remote;
    ASSERT_NO_THROW(remote = probe_remote(client, "https://mirror.example/unknown.tar"));
    EXPECT_TRUE(remote.sha256.empty());
}

TEST_F(RemoteProbeTest, NonHttpSchemeFailsWithoutNetwork) {
    EXPECT_THROW(probe_remote(client, "ftp://mirror.example/rootfs.tar"), SchemeError);
    EXPECT_THROW(probe_remote(client, "file:///srv/rootfs.tar"), SchemeError);
    EXPECT_THROW(probe_remote(client, "rootfs.tar"), SchemeError);
    EXPECT_TRUE(client.head_calls.empty());
}

TEST_F(RemoteProbeTest, UnreachableIsProbeError) {
    client.serve(url, FRESH_BODY).head_unreachable = true;

    try {
        probe_remote(client, url);
        FAIL() << "expected ProbeError";
    } catch (const SchemeError&) {
        FAIL() << "network failure reported as scheme error";
    } catch (const ProbeError& e) {
        EXPECT_NE(std::string(e.what()).find(url), std::string::npos);
    }
}

TEST_F(RemoteProbeTest, TimeoutIsPassedToTransport) {
    client.serve(url, FRESH_BODY);
    RequestOptions options;
    options.timeout = std::chrono::milliseconds(1500);

    probe_remote(client, url, options);
    EXPECT_EQ(client.last_options.timeout, std::chrono::milliseconds(1500));
}
