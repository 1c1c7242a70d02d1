#include "persistent_transport.h"
#include "test_loopback_server.h"

#include <atomic>
#include <iostream>
#include <string>
#include <thread>

static int failures = 0;

static void check(bool ok, const std::string& label) {
    std::cout << label << ": " << (ok ? "PASS" : "FAIL") << std::endl;
    if (!ok) {
        failures++;
    }
}

static std::shared_ptr<StreamSocket> connectTo(uint16_t port) {
    Url url = Url::parse("http://127.0.0.1:" + std::to_string(port) + "/");
    auto socket = StreamSocket::create(url, std::chrono::milliseconds(2000));
    socket->connect(url.host, url.port);
    return socket;
}

static const std::string kGet = "GET /object HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: keep-alive\r\n\r\n";

void testKeepAlive() {
    std::cout << "\n--- Test 1: Keep-Alive Reuse ---" << std::endl;

    const std::string head = "HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n";
    LoopbackServer server([&](asio::ip::tcp::socket& s, asio::streambuf& in) {
        for (int i = 0; i < 3; ++i) {
            LoopbackServer::readRequest(s, in);
            LoopbackServer::send(s, head + std::string(1000, 'a'));
        }
        LoopbackServer::drainUntilClosed(s);
    });

    PersistentTransport transport(connectTo(server.port()));
    std::uint64_t wireBytes = 0;
    transport.setWireByteCallback([&](std::uint64_t n) { wireBytes += n; });

    bool allOk = true;
    for (int i = 0; i < 3; ++i) {
        ParsedResponse r = transport.sendRequest(kGet);
        allOk = allOk && r.statusCode == 200 && r.bodyBytes == 1000;
    }

    check(allOk, "Three 200 responses of 1000 bytes");
    check(transport.requestsCompleted() == 3, "Three requests on one connection");
    check(transport.isOpen(), "Connection still open");
    check(wireBytes == 3 * (head.size() + 1000), "Wire byte count includes heads");
    transport.close();
}

void testBufferedNextResponse() {
    std::cout << "\n--- Test 2: Second Response Arrives Early ---" << std::endl;

    LoopbackServer server([&](asio::ip::tcp::socket& s, asio::streambuf& in) {
        LoopbackServer::readRequest(s, in);
        LoopbackServer::send(s, "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello"
                                "HTTP/1.1 201 Created\r\nContent-Length: 3\r\n\r\nabc");
        LoopbackServer::readRequest(s, in);
        LoopbackServer::drainUntilClosed(s);
    });

    PersistentTransport transport(connectTo(server.port()));
    ParsedResponse first = transport.sendRequest(kGet);
    ParsedResponse second = transport.sendRequest(kGet);

    check(first.statusCode == 200 && first.bodyBytes == 5, "First response exact");
    check(second.statusCode == 201 && second.bodyBytes == 3, "Second response served from leftover bytes");
    transport.close();
}

void testPeerCloseSentinel() {
    std::cout << "\n--- Test 3: Peer Close Mid-Body ---" << std::endl;

    LoopbackServer server([&](asio::ip::tcp::socket& s, asio::streambuf& in) {
        LoopbackServer::readRequest(s, in);
        LoopbackServer::send(s, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n0123456789");
        s.close();
    });

    PersistentTransport transport(connectTo(server.port()));
    ParsedResponse r = transport.sendRequest(kGet);

    check(!r.ok() && r.statusCode == 0 && r.bodyBytes == 0, "Sentinel {0, 0} returned");
    check(!transport.isOpen(), "Connection torn down");
    check(!transport.sendRequest(kGet).ok(), "Later requests return the sentinel at once");
}

void testConnectionClose() {
    std::cout << "\n--- Test 4: Connection: close ---" << std::endl;

    LoopbackServer server([&](asio::ip::tcp::socket& s, asio::streambuf& in) {
        LoopbackServer::readRequest(s, in);
        LoopbackServer::send(s, "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 4\r\n\r\ndone");
        LoopbackServer::drainUntilClosed(s);
    });

    PersistentTransport transport(connectTo(server.port()));
    ParsedResponse r = transport.sendRequest(kGet);
    check(r.statusCode == 200 && r.bodyBytes == 4, "Response delivered");
    check(!transport.isOpen(), "Transport closes after a non-keep-alive response");
}

void testForceCloseUnblocks() {
    std::cout << "\n--- Test 5: forceClose() Unblocks a Pending Read ---" << std::endl;

    LoopbackServer server([&](asio::ip::tcp::socket& s, asio::streambuf& in) {
        LoopbackServer::readRequest(s, in);
        LoopbackServer::drainUntilClosed(s);
    });

    auto socket = connectTo(server.port());
    PersistentTransport transport(socket);

    std::atomic<bool> returned{false};
    ParsedResponse result;
    std::thread client([&]() {
        result = transport.sendRequest(kGet);
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    check(!returned.load(), "Request blocks while the server is silent");

    auto started = std::chrono::steady_clock::now();
    socket->forceClose();
    client.join();
    auto elapsed = std::chrono::steady_clock::now() - started;

    check(returned.load() && !result.ok(), "Blocked request returns the sentinel");
    check(elapsed < std::chrono::seconds(2), "Teardown is prompt");
}

void testChunkedUpload() {
    std::cout << "\n--- Test 6: Sliced Upload ---" << std::endl;

    std::string receivedHead;
    LoopbackServer server([&](asio::ip::tcp::socket& s, asio::streambuf& in) {
        receivedHead = LoopbackServer::readRequest(s, in);
        LoopbackServer::send(s, "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
        LoopbackServer::drainUntilClosed(s);
    });

    const std::string body(64 * 1024, 'u');
    const std::string header = "POST /upload HTTP/1.1\r\nHost: 127.0.0.1\r\n"
                               "Content-Type: application/octet-stream\r\n"
                               "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";

    PersistentTransport transport(connectTo(server.port()));
    int slices = 0;
    std::uint64_t reported = 0;
    ParsedResponse r = transport.sendRequestChunked(header, body, 16 * 1024, [&](std::uint64_t n) {
        slices++;
        reported += n;
    });

    check(r.statusCode == 200, "Server accepted the body");
    check(slices == 4 && reported == body.size(), "One callback per 16 KiB slice");
    transport.close();
}

int main() {
    std::cout << "Testing PersistentTransport..." << std::endl;

    testKeepAlive();
    testBufferedNextResponse();
    testPeerCloseSentinel();
    testConnectionClose();
    testForceCloseUnblocks();
    testChunkedUpload();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
