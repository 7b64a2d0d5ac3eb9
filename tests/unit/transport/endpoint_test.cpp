#include <gtest/gtest.h>
#include <dockhand/transport/endpoint.h>

using namespace dockhand;
using namespace dockhand::transport;

TEST(EndpointTest, ParsesUnixSocket) {
    auto ep = Endpoint::parse("unix:///var/run/docker.sock");
    ASSERT_TRUE(ep) << ep.error().message;
    ASSERT_TRUE(ep.value().isUnix());
    EXPECT_EQ(ep.value().unixSocket().path, "/var/run/docker.sock");
    EXPECT_FALSE(ep.value().isSecure());
    EXPECT_EQ(ep.value().hostHeader(), "localhost");
    EXPECT_EQ(ep.value().remoteAddr(), "/var/run/docker.sock");
}

TEST(EndpointTest, ParsesTcpWithDefaultPorts) {
    auto http = Endpoint::parse("http://daemon.local");
    ASSERT_TRUE(http);
    EXPECT_EQ(http.value().tcp().host, "daemon.local");
    EXPECT_EQ(http.value().tcp().port, 80);
    EXPECT_EQ(http.value().hostHeader(), "daemon.local");

    auto https = Endpoint::parse("https://10.0.0.5:2376");
    ASSERT_TRUE(https);
    EXPECT_TRUE(https.value().isSecure());
    EXPECT_EQ(https.value().tcp().port, 2376);
    EXPECT_EQ(https.value().hostHeader(), "10.0.0.5:2376");
    EXPECT_EQ(https.value().remoteAddr(), "https://10.0.0.5:2376");
}

TEST(EndpointTest, ParsesIpv6Literal) {
    auto ep = Endpoint::parse("http://[::1]:2375/");
    ASSERT_TRUE(ep) << ep.error().message;
    EXPECT_EQ(ep.value().tcp().host, "::1");
    EXPECT_EQ(ep.value().tcp().port, 2375);
    EXPECT_EQ(ep.value().toString(), "http://[::1]:2375");
}

TEST(EndpointTest, RejectsInvalidSpecs) {
    for (const char* bad : {"", "ftp://host", "unix://", "http://", "http://host:0",
                            "http://host:70000", "http://host:abc", "http://host/v1.41",
                            "http://user@host", "http://[::1"}) {
        auto ep = Endpoint::parse(bad);
        ASSERT_FALSE(ep) << bad;
        EXPECT_EQ(ep.error().code, ErrorCode::InvalidEndpoint) << bad;
    }
}

TEST(EndpointTest, ToStringRoundTripsThroughParse) {
    for (const char* text : {"unix:///tmp/d.sock", "http://localhost:2375", "https://h:443",
                             "http://[fe80::1]:80"}) {
        auto first = Endpoint::parse(text);
        ASSERT_TRUE(first) << text;
        auto again = Endpoint::parse(first.value().toString());
        ASSERT_TRUE(again) << first.value().toString();
        EXPECT_TRUE(first.value() == again.value()) << text;
        EXPECT_EQ(first.value().toString(), again.value().toString());
    }
}

TEST(EndpointTest, FactoriesMatchParsedForms) {
    EXPECT_TRUE(Endpoint::forUnix("/tmp/x.sock") == Endpoint::parse("unix:///tmp/x.sock").value());
    EXPECT_TRUE(Endpoint::forTcp("h", 2376, Scheme::Https) ==
                Endpoint::parse("https://h:2376").value());
}
