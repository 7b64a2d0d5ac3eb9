#include <gtest/gtest.h>
#include <dockhand/core/failure.h>
#include <dockhand/http/api_version.h>
#include <dockhand/http/connection.h>

#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../common/run_awaitable.h"
#include "../../common/test_daemon.h"
#include "../../support/temp_dir_scope.hpp"

using namespace dockhand;
using namespace dockhand::http;
using namespace std::chrono_literals;
using dockhand::test_support::chunkedHead;
using dockhand::test_support::httpResponse;
using dockhand::test_support::Peer;
using dockhand::test_support::RecordedRequest;
using dockhand::test_support::runAwaitable;
using dockhand::test_support::TempDirScope;
using dockhand::test_support::TestDaemon;
using boost::asio::awaitable;

namespace {

// Requests seen by the daemon threads.
struct Journal {
    std::mutex mutex;
    std::vector<RecordedRequest> requests;

    void add(RecordedRequest r) {
        std::lock_guard<std::mutex> lk(mutex);
        requests.push_back(std::move(r));
    }
};

awaitable<Result<std::string>> drainStream(BodyStream stream) {
    std::string all;
    for (;;) {
        auto chunk = co_await stream.next();
        if (!chunk)
            co_return chunk.error();
        if (!chunk.value())
            break;
        all += *chunk.value();
    }
    co_return std::move(all);
}

} // namespace

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override { daemon_ = TestDaemon::unixSocket(dir_.path() / "d.sock"); }

    void TearDown() override { daemon_->stop(); }

    Connection connect(ConnectionOptions options = {}) {
        auto c = Connection::create(io_.get_executor(), daemon_->endpoint(), std::move(options));
        EXPECT_TRUE(c) << (c ? "" : c.error().message);
        return std::move(c).value();
    }

    template <typename T> T run(awaitable<T> op) { return runAwaitable(io_, std::move(op)); }

    boost::asio::io_context io_;
    TempDirScope dir_ = TempDirScope::unique_under("dh-http");
    std::unique_ptr<TestDaemon> daemon_;
    Journal journal_;
};

TEST_F(ConnectionTest, GetInfoJsonOverUnixSocket) {
    daemon_->expect([this](Peer& peer) {
        auto req = peer.readRequest();
        if (!req)
            return;
        journal_.add(*req);
        peer.write(httpResponse(200, "OK", R"({"ID":"abc","Containers":3})"));
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto info = run(conn.getJson(ApiVersion(1, 41).makeEndpoint("/info")));
    ASSERT_TRUE(info) << info.error().message;
    EXPECT_EQ(info.value()["ID"], "abc");
    EXPECT_EQ(info.value()["Containers"], 3);

    daemon_->stop();
    ASSERT_EQ(journal_.requests.size(), 1u);
    const auto& req = journal_.requests.front();
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.target, "/v1.41/info");
    EXPECT_EQ(req.header("Host").value_or(""), "localhost");
    EXPECT_EQ(req.header("User-Agent").value_or(""), "dockhand/0.9");
}

TEST_F(ConnectionTest, SendReturnsBeforeBodyIsRead) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(chunkedHead());
        peer.writeChunk(R"({"status":"pulling"})");
        // The body stays open until the client asks for more.
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto res = run(conn.get("/images/create"));
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res.value().status(), 200u);
    EXPECT_TRUE(res.value().isSuccess());
    EXPECT_TRUE(res.value().isStreaming());
    EXPECT_EQ(res.value().contentType(), "application/json");
    EXPECT_FALSE(res.value().contentLength());
}

TEST_F(ConnectionTest, ChunkedBodyStreamsInOrder) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(chunkedHead(200, "application/octet-stream"));
        for (const char* piece : {"alpha-", "beta-", "gamma"}) {
            peer.writeChunk(piece);
        }
        peer.write("0\r\n\r\n");
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto res = run(conn.get("/containers/x/logs"));
    ASSERT_TRUE(res);
    auto stream = res.value().stream();
    ASSERT_TRUE(stream);

    std::string all;
    for (;;) {
        auto chunk = run(stream.value().next());
        ASSERT_TRUE(chunk) << chunk.error().message;
        if (!chunk.value())
            break;
        all += *chunk.value();
    }
    EXPECT_EQ(all, "alpha-beta-gamma");
    EXPECT_TRUE(stream.value().finished());

    auto again = run(stream.value().next());
    ASSERT_FALSE(again);
    EXPECT_EQ(failureKindOf(again.error()), FailureKind::Consumed);

    // The response was consumed by stream(); a second consumer is refused.
    auto second = res.value().stream();
    ASSERT_FALSE(second);
    EXPECT_EQ(failureKindOf(second.error()), FailureKind::Consumed);
}

TEST_F(ConnectionTest, LinesDeliverTrailingRecord) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(chunkedHead());
        peer.writeChunk("{\"a\":1}\r\n{\"b\"");
        peer.writeChunk(":2}\n\n{\"c\":3}");
        peer.write("0\r\n\r\n");
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto res = run(conn.get("/events"));
    ASSERT_TRUE(res);
    auto lines = std::move(res.value().stream().value()).lines();

    std::vector<nlohmann::json> records;
    for (;;) {
        auto rec = run(lines.nextJson());
        ASSERT_TRUE(rec) << rec.error().message;
        if (!rec.value())
            break;
        records.push_back(*rec.value());
    }
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0]["a"], 1);
    EXPECT_EQ(records[1]["b"], 2);
    EXPECT_EQ(records[2]["c"], 3);
}

TEST_F(ConnectionTest, ReadAllEnforcesLimitButStreamDoesNot) {
    const std::string body(4096, 'x');
    for (int i = 0; i < 2; ++i) {
        daemon_->expect([body](Peer& peer) {
            if (!peer.readRequest())
                return;
            peer.write(httpResponse(200, "OK", body, "text/plain"));
            peer.waitForClientClose(2s);
        });
    }

    ConnectionOptions options;
    options.maxBodySize = 1024;
    auto conn = connect(options);

    auto limited = run(conn.get("/containers/x/export"));
    ASSERT_TRUE(limited);
    auto all = run(limited.value().readAll());
    ASSERT_FALSE(all);
    EXPECT_EQ(all.error().code, ErrorCode::BodyTooLarge);

    auto streamed = run(conn.get("/containers/x/export"));
    ASSERT_TRUE(streamed);
    auto stream = streamed.value().stream();
    ASSERT_TRUE(stream);
    auto drained = run(drainStream(std::move(stream).value()));
    ASSERT_TRUE(drained) << drained.error().message;
    EXPECT_EQ(drained.value(), body);
}

TEST_F(ConnectionTest, ChunkedBodyOverLimitFailsWhileReading) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(chunkedHead(200, "text/plain"));
        for (int i = 0; i < 8; ++i) {
            peer.writeChunk(std::string(256, 'y'));
        }
        peer.write("0\r\n\r\n");
        peer.waitForClientClose(2s);
    });

    ConnectionOptions options;
    options.maxBodySize = 1000;
    auto conn = connect(options);
    auto res = run(conn.get("/big"));
    ASSERT_TRUE(res);
    auto all = run(res.value().readAll());
    ASSERT_FALSE(all);
    EXPECT_EQ(all.error().code, ErrorCode::BodyTooLarge);
    EXPECT_EQ(conn.idleStreams(), 0u);
}

TEST_F(ConnectionTest, MalformedChunkIsSerializationError) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(chunkedHead());
        peer.write("zz\r\nnot-hex\r\n");
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto res = run(conn.get("/events"));
    ASSERT_TRUE(res);
    auto stream = std::move(res.value().stream()).value();
    auto first = run(stream.next());
    ASSERT_FALSE(first);
    EXPECT_EQ(first.error().code, ErrorCode::Serialization);
    EXPECT_EQ(failureKindOf(first.error()), FailureKind::MalformedChunk);
}

TEST_F(ConnectionTest, EarlyCloseIsResetNotCleanEnd) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n0123456789");
        peer.close();
    });

    auto conn = connect();
    auto res = run(conn.get("/containers/x/archive"));
    ASSERT_TRUE(res);
    auto stream = std::move(res.value().stream()).value();

    std::string got;
    Result<std::optional<std::string>> chunk = std::optional<std::string>{};
    for (;;) {
        chunk = run(stream.next());
        if (!chunk || !chunk.value())
            break;
        got += *chunk.value();
    }
    ASSERT_FALSE(chunk) << "stream ended cleanly after " << got.size() << " bytes";
    EXPECT_EQ(chunk.error().code, ErrorCode::Io);
    EXPECT_EQ(failureKindOf(chunk.error()), FailureKind::Reset);
    EXPECT_EQ(got, "0123456789");

    // The error sticks.
    auto again = run(stream.next());
    ASSERT_FALSE(again);
    EXPECT_EQ(failureKindOf(again.error()), FailureKind::Reset);
}

TEST_F(ConnectionTest, DroppingResponseClosesSocket) {
    auto closed = std::make_shared<std::promise<bool>>();
    auto closedFuture = closed->get_future();
    daemon_->expect([closed](Peer& peer) {
        if (!peer.readRequest()) {
            closed->set_value(false);
            return;
        }
        peer.write(chunkedHead());
        peer.writeChunk("{\"progress\":1}\n");
        closed->set_value(peer.waitForClientClose(3s));
    });

    auto conn = connect();
    {
        auto res = run(conn.get("/images/create?fromImage=alpine"));
        ASSERT_TRUE(res);
        auto stream = std::move(res.value().stream()).value();
        auto first = run(stream.next());
        ASSERT_TRUE(first);
    }
    test_support::drain(io_);
    ASSERT_EQ(closedFuture.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(closedFuture.get());
    EXPECT_EQ(conn.idleStreams(), 0u);
}

TEST_F(ConnectionTest, KeepAliveStreamIsReused) {
    daemon_->expect([this](Peer& peer) {
        for (int i = 0; i < 3; ++i) {
            auto req = peer.readRequest();
            if (!req)
                return;
            journal_.add(*req);
            peer.write(httpResponse(200, "OK", "{\"n\":" + std::to_string(i) + "}"));
        }
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    for (int i = 0; i < 3; ++i) {
        auto res = run(conn.get("/_ping"));
        ASSERT_TRUE(res) << res.error().message;
        auto json = run(res.value().readJson());
        ASSERT_TRUE(json) << json.error().message;
        EXPECT_EQ(json.value()["n"], i);
        EXPECT_EQ(conn.idleStreams(), 1u);
    }
    EXPECT_EQ(daemon_->accepted(), 1u);

    conn.closeIdle();
    EXPECT_EQ(conn.idleStreams(), 0u);
}

TEST_F(ConnectionTest, StaleIdleStreamIsReplacedOnce) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(httpResponse(200, "OK", "{}"));
        peer.close();
    });
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(httpResponse(200, "OK", "{\"fresh\":true}"));
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto first = run(conn.get("/_ping"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(run(first.value().readAll()));
    ASSERT_EQ(conn.idleStreams(), 1u);

    // Let the daemon's close arrive before reusing the parked stream.
    std::this_thread::sleep_for(100ms);
    auto second = run(conn.getJson("/_ping"));
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_EQ(second.value()["fresh"], true);
    EXPECT_EQ(daemon_->accepted(), 2u);
}

TEST_F(ConnectionTest, DaemonErrorMessageIsSurfaced) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(httpResponse(404, "Not Found", R"({"message":"No such container: web"})"));
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto res = run(conn.getJson("/containers/web/json"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::Io);
    EXPECT_NE(res.error().message.find("No such container: web"), std::string::npos);
    EXPECT_NE(res.error().message.find("404"), std::string::npos);
}

TEST_F(ConnectionTest, PostJsonSendsBodyWithLength) {
    daemon_->expect([this](Peer& peer) {
        auto req = peer.readRequest();
        if (!req)
            return;
        journal_.add(*req);
        peer.write(httpResponse(201, "Created", R"({"Id":"c1","Warnings":[]})"));
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto created = run(conn.postJson("/containers/create?name=web", {{"Image", "alpine"}}));
    ASSERT_TRUE(created) << created.error().message;
    EXPECT_EQ(created.value()["Id"], "c1");

    daemon_->stop();
    ASSERT_EQ(journal_.requests.size(), 1u);
    const auto& req = journal_.requests.front();
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.target, "/containers/create?name=web");
    EXPECT_EQ(req.header("Content-Type").value_or(""), "application/json");
    EXPECT_EQ(nlohmann::json::parse(req.body), (nlohmann::json{{"Image", "alpine"}}));
}

TEST_F(ConnectionTest, BodylessPostCarriesZeroLength) {
    daemon_->expect([this](Peer& peer) {
        auto req = peer.readRequest();
        if (!req)
            return;
        journal_.add(*req);
        peer.write("HTTP/1.1 204 No Content\r\n\r\n");
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto res = run(conn.post("/containers/web/start", Payload::none()));
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res.value().status(), 204u);
    EXPECT_FALSE(res.value().isStreaming());

    daemon_->stop();
    ASSERT_EQ(journal_.requests.size(), 1u);
    EXPECT_EQ(journal_.requests.front().header("Content-Length").value_or(""), "0");
}

TEST_F(ConnectionTest, StreamingRequestBodyIsChunked) {
    daemon_->expect([this](Peer& peer) {
        auto req = peer.readRequest();
        if (!req)
            return;
        journal_.add(*req);
        peer.write(httpResponse(200, "OK", "{\"stream\":\"done\"}\n"));
        peer.waitForClientClose(2s);
    });

    std::vector<std::string> pieces{"first|", "", "second|", "third"};
    std::size_t next = 0;
    auto request = RequestBuilder(beast_http::verb::post, "/build")
                       .query("t", "app:dev")
                       .streamBody(
                           [&]() -> Result<std::optional<std::string>> {
                               if (next == pieces.size())
                                   return std::optional<std::string>{};
                               return std::optional<std::string>(pieces[next++]);
                           },
                           "application/x-tar")
                       .build();

    auto conn = connect();
    auto res = run(conn.send(std::move(request)));
    ASSERT_TRUE(res) << res.error().message;
    ASSERT_TRUE(run(res.value().readAll()));

    daemon_->stop();
    ASSERT_EQ(journal_.requests.size(), 1u);
    const auto& req = journal_.requests.front();
    EXPECT_TRUE(req.chunked);
    EXPECT_EQ(req.target, "/build?t=app%3Adev");
    EXPECT_EQ(req.body, "first|second|third");
    EXPECT_EQ(req.header("Content-Type").value_or(""), "application/x-tar");
}

TEST_F(ConnectionTest, FailingBodySourceAbortsRequest) {
    daemon_->expect([](Peer& peer) { peer.waitForClientClose(2s); });

    auto request = RequestBuilder(beast_http::verb::post, "/build")
                       .streamBody(
                           []() -> Result<std::optional<std::string>> {
                               return Error{ErrorCode::ArchiveError, "context vanished"};
                           },
                           "application/x-tar")
                       .build();
    auto conn = connect();
    auto res = run(conn.send(std::move(request)));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::ArchiveError);
}

TEST_F(ConnectionTest, HeaderDeadlineTimesOut) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.waitForClientClose(3s);
    });

    ConnectionOptions options;
    options.headerTimeout = 150ms;
    auto conn = connect(options);
    auto res = run(conn.get("/containers/json"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::Timeout);
    EXPECT_EQ(failureKindOf(res.error()), FailureKind::Timeout);
}

TEST_F(ConnectionTest, StalledBodyHitsIdleDeadline) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(chunkedHead());
        peer.writeChunk("{\"status\":\"Downloading\"}\n");
        // No terminating chunk: the daemon goes quiet mid-body.
        peer.waitForClientClose(3s);
    });

    ConnectionOptions options;
    options.bodyTimeout = 200ms;
    auto conn = connect(options);
    auto res = run(conn.get("/images/create"));
    ASSERT_TRUE(res) << res.error().message;
    auto stream = std::move(res.value().stream()).value();

    std::string got;
    Result<std::optional<std::string>> chunk = std::optional<std::string>{};
    for (;;) {
        chunk = run(stream.next());
        if (!chunk || !chunk.value())
            break;
        got += *chunk.value();
    }
    EXPECT_EQ(got, "{\"status\":\"Downloading\"}\n");
    ASSERT_FALSE(chunk) << "stream ended cleanly";
    EXPECT_EQ(chunk.error().code, ErrorCode::Timeout);
    EXPECT_EQ(failureKindOf(chunk.error()), FailureKind::Timeout);

    auto again = run(stream.next());
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::Timeout);
}

TEST_F(ConnectionTest, HeadResponseHasNoBody) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write("HTTP/1.1 200 OK\r\nContent-Length: 2048\r\nContent-Type: application/x-tar\r\n\r\n");
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto res = run(conn.head("/containers/web/archive?path=/etc"));
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res.value().contentLength(), std::optional<std::size_t>(2048));
    auto body = run(res.value().readAll());
    ASSERT_TRUE(body);
    EXPECT_TRUE(body.value().empty());
}

TEST_F(ConnectionTest, UpgradeGivesRawDuplexStream) {
    daemon_->expect([this](Peer& peer) {
        auto req = peer.readRequest();
        if (!req)
            return;
        journal_.add(*req);
        peer.write("HTTP/1.1 101 UPGRADED\r\nContent-Type: application/vnd.docker.raw-stream\r\n"
                   "Connection: Upgrade\r\nUpgrade: tcp\r\n\r\nhello");
        std::string input;
        char buf[64];
        while (input.size() < 4) {
            auto n = ::recv(peer.fd(), buf, sizeof(buf), 0);
            if (n <= 0)
                return;
            input.append(buf, static_cast<std::size_t>(n));
        }
        peer.write(input == "ping" ? "pong" : "what?");
        peer.close();
    });

    auto conn = connect();
    auto up = run(conn.upgrade(
        RequestBuilder(beast_http::verb::post, "/containers/web/attach").queryKey("stream").build()));
    ASSERT_TRUE(up) << up.error().message;
    auto& stream = up.value();

    std::string greeting;
    while (greeting.size() < 5) {
        auto chunk = run(stream.read());
        ASSERT_TRUE(chunk) << chunk.error().message;
        ASSERT_TRUE(chunk.value());
        greeting += *chunk.value();
    }
    EXPECT_EQ(greeting, "hello");

    auto wrote = run(stream.write("ping"));
    ASSERT_TRUE(wrote) << wrote.error().message;

    std::string reply;
    for (;;) {
        auto chunk = run(stream.read());
        ASSERT_TRUE(chunk) << chunk.error().message;
        if (!chunk.value())
            break;
        reply += *chunk.value();
    }
    EXPECT_EQ(reply, "pong");

    daemon_->stop();
    ASSERT_EQ(journal_.requests.size(), 1u);
    EXPECT_EQ(journal_.requests.front().header("Upgrade").value_or(""), "tcp");
    EXPECT_EQ(journal_.requests.front().header("Connection").value_or(""), "Upgrade");
}

TEST_F(ConnectionTest, UpgradeRefusedIsNotUpgraded) {
    daemon_->expect([](Peer& peer) {
        if (!peer.readRequest())
            return;
        peer.write(httpResponse(200, "OK", "{}"));
        peer.waitForClientClose(2s);
    });

    auto conn = connect();
    auto up = run(conn.upgrade(RequestBuilder(beast_http::verb::post, "/exec/1/start").build()));
    ASSERT_FALSE(up);
    EXPECT_EQ(up.error().code, ErrorCode::Io);
    EXPECT_EQ(failureKindOf(up.error()), FailureKind::NotUpgraded);
}

TEST_F(ConnectionTest, ConnectFailureSurfacesWithoutRetry) {
    auto c = Connection::create(io_.get_executor(),
                                transport::Endpoint::forUnix(dir_.path() / "missing.sock"));
    ASSERT_TRUE(c);
    auto res = run(c.value().get("/_ping"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::ConnectionFailed);
    EXPECT_EQ(failureKindOf(res.error()), FailureKind::SocketMissing);
}
