#include <catch2/catch_test_macros.hpp>

#include "ai/backend.hpp"
#include "capture/screen_capture.hpp"
#include "message_router.hpp"
#include "platform/linux/tcp_socket_client.hpp"
#include "platform/net.hpp"
#include "service_endpoint.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// "slow" takes a while to answer; everything else is echoed back at once.
class SlowBackend : public InferenceBackend {
public:
    std::expected<std::string, std::string>
    query(const std::string& question, std::optional<std::span<const uint8_t>>) override {
        if (question == "slow") std::this_thread::sleep_for(600ms);
        return "echo: " + question;
    }
};

class NoCapture : public ScreenCapture {
public:
    std::expected<std::vector<uint8_t>, std::string> capture() override {
        return std::unexpected("no display");
    }
};

// Runs the reactor on its own thread for the lifetime of the fixture.
struct EndpointFixture {
    SlowBackend backend;
    NoCapture capture;
    MessageRouter router{backend, capture};
    ServiceEndpoint endpoint;
    std::jthread reactor;

    explicit EndpointFixture(ServiceEndpoint::Options opts = {})
        : endpoint(router, opts) {
        REQUIRE(endpoint.start("127.0.0.1", 0));
        REQUIRE(endpoint.port() != 0);
        reactor = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) endpoint.poll(20);
        });
    }

    ~EndpointFixture() {
        reactor.request_stop();
        reactor.join();
        endpoint.stop();
    }

    bool wait_for_count(size_t n, std::chrono::milliseconds timeout = 2s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (endpoint.connection_count() == n) return true;
            std::this_thread::sleep_for(10ms);
        }
        return endpoint.connection_count() == n;
    }
};

// Plain socket for sending bytes that are not valid envelopes.
struct RawClient {
    int fd = -1;

    explicit RawClient(uint16_t port) {
        fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(fd);
            fd = -1;
        }
    }

    ~RawClient() {
        if (fd >= 0) ::close(fd);
    }

    bool write(const std::string& data) {
        return ::send(fd, data.data(), data.size(), MSG_NOSIGNAL) ==
               static_cast<ssize_t>(data.size());
    }

    // One line, or nullopt on timeout / EOF.
    std::optional<std::string> read_line(int timeout_ms = 2000) {
        std::string line;
        while (true) {
            pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, timeout_ms) <= 0) return std::nullopt;
            char c;
            if (::recv(fd, &c, 1, 0) != 1) return std::nullopt;
            if (c == '\n') return line;
            line += c;
        }
    }

    // True once the peer has closed the connection. Data sent before the
    // close is discarded.
    bool closed_by_peer(int timeout_ms = 2000) {
        char tmp[4096];
        while (true) {
            pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, timeout_ms) <= 0) return false;
            if (::recv(fd, tmp, sizeof(tmp), 0) <= 0) return true;
        }
    }
};

// Accepts one connection and never reads from it.
struct StalledPeer {
    int listener = -1;
    int peer = -1;

    StalledPeer() {
        auto fd = platform::listen_tcp("127.0.0.1", 0);
        if (fd) listener = *fd;
    }

    ~StalledPeer() {
        if (peer >= 0) ::close(peer);
        if (listener >= 0) ::close(listener);
    }

    uint16_t port() const { return platform::local_port(listener); }

    bool accept() {
        pollfd pfd{.fd = listener, .events = POLLIN, .revents = 0};
        if (::poll(&pfd, 1, 2000) != 1) return false;
        peer = ::accept4(listener, nullptr, nullptr, SOCK_CLOEXEC);
        return peer >= 0;
    }
};

json recv_json(TcpSocketClient& client, int timeout_ms = 2000) {
    json msg;
    std::string raw;
    auto status = client.recv(msg, raw, timeout_ms);
    REQUIRE(status == RecvStatus::Message);
    return msg;
}

} // namespace

TEST_CASE("ServiceEndpoint", "[endpoint]") {

    SECTION("PingPong") {
        EndpointFixture fx;
        TcpSocketClient client;
        REQUIRE(client.connect("127.0.0.1", fx.endpoint.port()));
        REQUIRE(client.send(json{{"command", "ping"}}));

        auto resp = recv_json(client);
        REQUIRE(resp["type"] == "pong");
        REQUIRE(fx.wait_for_count(1));
    }

    SECTION("MalformedJsonKeepsConnectionOpen") {
        EndpointFixture fx;
        RawClient raw(fx.endpoint.port());
        REQUIRE(raw.fd >= 0);

        REQUIRE(raw.write("this is not json\n"));
        auto line = raw.read_line();
        REQUIRE(line.has_value());
        auto err = json::parse(*line);
        REQUIRE(err["type"] == "error");
        REQUIRE(err["message"] == "Invalid JSON format");

        // Exactly one error, and the connection still answers.
        REQUIRE(raw.write("{\"command\":\"ping\"}\n"));
        line = raw.read_line();
        REQUIRE(line.has_value());
        REQUIRE(json::parse(*line)["type"] == "pong");
        REQUIRE(fx.endpoint.connection_count() == 1);
    }

    SECTION("UnknownCommandGetsNoResponse") {
        EndpointFixture fx;
        RawClient raw(fx.endpoint.port());
        REQUIRE(raw.write("{\"command\":\"reboot\"}\n{\"command\":\"ping\"}\n"));

        auto line = raw.read_line();
        REQUIRE(line.has_value());
        REQUIRE(json::parse(*line)["type"] == "pong");
    }

    SECTION("NoCrossTalkWhileOneConnectionIsSlow") {
        EndpointFixture fx;
        TcpSocketClient a;
        TcpSocketClient b;
        REQUIRE(a.connect("127.0.0.1", fx.endpoint.port()));
        REQUIRE(b.connect("127.0.0.1", fx.endpoint.port()));
        REQUIRE(fx.wait_for_count(2));

        REQUIRE(b.send(json{{"command", "ai_query_text"}, {"question", "slow"}}));
        std::this_thread::sleep_for(50ms);

        auto started = std::chrono::steady_clock::now();
        REQUIRE(a.send(json{{"command", "ping"}}));
        auto pong = recv_json(a);
        REQUIRE(pong["type"] == "pong");
        // Answered while B's handler is still sleeping.
        REQUIRE(std::chrono::steady_clock::now() - started < 400ms);

        auto answer = recv_json(b);
        REQUIRE(answer["type"] == "ai_response");
        REQUIRE(answer["answer"] == "echo: slow");

        // Nothing else arrives on A.
        json extra;
        std::string raw;
        REQUIRE(a.recv(extra, raw, 200) == RecvStatus::Timeout);
    }

    SECTION("MessagesOnOneConnectionStayInOrder") {
        EndpointFixture fx;
        TcpSocketClient client;
        REQUIRE(client.connect("127.0.0.1", fx.endpoint.port()));

        REQUIRE(client.send(json{{"command", "ai_query_text"}, {"question", "slow"}}));
        REQUIRE(client.send(json{{"command", "ping"}}));

        REQUIRE(recv_json(client)["type"] == "ai_response");
        REQUIRE(recv_json(client)["type"] == "pong");
    }

    SECTION("CloseClientIsIdempotent") {
        EndpointFixture fx;
        RawClient raw(fx.endpoint.port());
        REQUIRE(fx.wait_for_count(1));

        auto ids = fx.endpoint.connection_ids();
        REQUIRE(ids.size() == 1);
        int id = ids[0];

        REQUIRE(fx.endpoint.close_client(id));
        REQUIRE_FALSE(fx.endpoint.close_client(id));
        REQUIRE(fx.endpoint.connection_count() == 0);

        // Sends to a closed connection are silent no-ops.
        REQUIRE_FALSE(fx.endpoint.send_to(id, json{{"type", "pong"}}));
        REQUIRE(raw.closed_by_peer());
    }

    SECTION("SendToLiveConnection") {
        EndpointFixture fx;
        RawClient raw(fx.endpoint.port());
        REQUIRE(fx.wait_for_count(1));

        int id = fx.endpoint.connection_ids()[0];
        REQUIRE(fx.endpoint.send_to(id, json{{"type", "ai_response"}, {"answer", "pushed"}}));
        auto line = raw.read_line();
        REQUIRE(line.has_value());
        REQUIRE(json::parse(*line)["answer"] == "pushed");
    }

    SECTION("PeerCloseRemovesConnection") {
        EndpointFixture fx;
        {
            RawClient raw(fx.endpoint.port());
            REQUIRE(fx.wait_for_count(1));
        }
        REQUIRE(fx.wait_for_count(0));
    }

    SECTION("IdleConnectionDropped") {
        EndpointFixture fx(ServiceEndpoint::Options{.idle_timeout = 200ms});
        RawClient raw(fx.endpoint.port());
        REQUIRE(fx.wait_for_count(1));
        REQUIRE(raw.closed_by_peer(3000));
        REQUIRE(fx.wait_for_count(0));
    }

    SECTION("OversizedLineClosesConnection") {
        EndpointFixture fx(ServiceEndpoint::Options{.max_message_bytes = 64});
        RawClient raw(fx.endpoint.port());
        REQUIRE(raw.write(std::string(200, 'x')));
        REQUIRE(raw.closed_by_peer());
        REQUIRE(fx.wait_for_count(0));
    }

    SECTION("OversizedLineAfterShortLineClosesConnection") {
        EndpointFixture fx(ServiceEndpoint::Options{.max_message_bytes = 64});
        RawClient raw(fx.endpoint.port());
        REQUIRE(raw.write("{\"command\":\"ping\"}\n" + std::string(200, 'x')));
        REQUIRE(raw.closed_by_peer());
        REQUIRE(fx.wait_for_count(0));
    }

    SECTION("OversizedCompleteLineAfterShortLineClosesConnection") {
        EndpointFixture fx(ServiceEndpoint::Options{.max_message_bytes = 64});
        RawClient raw(fx.endpoint.port());
        std::string big = "{\"command\":\"ping\",\"pad\":\"" + std::string(200, 'x') + "\"}\n";
        REQUIRE(raw.write("{\"command\":\"ping\"}\n" + big));
        REQUIRE(raw.closed_by_peer());
        REQUIRE(fx.wait_for_count(0));
    }

    SECTION("HalfClosedPeerStillGetsAnswers") {
        EndpointFixture fx;
        RawClient raw(fx.endpoint.port());
        REQUIRE(raw.write("{\"command\":\"ai_query_text\",\"question\":\"slow\"}\n"
                          "{\"command\":\"ping\"}\n"));
        REQUIRE(::shutdown(raw.fd, SHUT_WR) == 0);

        auto line = raw.read_line();
        REQUIRE(line.has_value());
        REQUIRE(json::parse(*line)["answer"] == "echo: slow");
        line = raw.read_line();
        REQUIRE(line.has_value());
        REQUIRE(json::parse(*line)["type"] == "pong");

        // Closed once the queued lines are answered.
        REQUIRE(raw.closed_by_peer());
        REQUIRE(fx.wait_for_count(0));
    }
}

TEST_CASE("TcpSocketClient", "[transport]") {
    StalledPeer stalled;
    REQUIRE(stalled.listener >= 0);

    TcpSocketClient client;
    REQUIRE(client.connect("127.0.0.1", stalled.port()));
    REQUIRE(stalled.accept());

    // Larger than both socket buffers, so the send cannot complete.
    json big{{"command", "ai_query"}, {"image_data", std::string(16 * 1024 * 1024, 'A')}};
    std::atomic<bool> done{false};
    bool sent = true;
    std::jthread sender([&] {
        sent = client.send(big);
        done.store(true);
    });

    std::this_thread::sleep_for(300ms);
    REQUIRE_FALSE(done.load());

    SECTION("InterruptWakesBlockedSender") {
        auto started = std::chrono::steady_clock::now();
        client.interrupt();
        sender.join();
        REQUIRE(std::chrono::steady_clock::now() - started < 1s);
        REQUIRE_FALSE(sent);

        json msg;
        std::string raw;
        REQUIRE(client.recv(msg, raw, 100) == RecvStatus::Closed);
    }

    SECTION("CloseWakesBlockedSender") {
        auto started = std::chrono::steady_clock::now();
        client.close();
        sender.join();
        REQUIRE(std::chrono::steady_clock::now() - started < 1s);
        REQUIRE_FALSE(sent);
        REQUIRE_FALSE(client.send(json{{"command", "ping"}}));
    }
}
