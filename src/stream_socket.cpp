#include "stream_socket.h"
#include "gauge_logger.h"
#include "measurement_errors.h"

#include <asio/connect.hpp>
#include <asio/write.hpp>

#include <sys/socket.h>

namespace {

constexpr auto kConnectPollInterval = std::chrono::milliseconds(50);

} // namespace

StreamSocket::StreamSocket(std::chrono::milliseconds connectTimeout)
    : connect_timeout_(connectTimeout) {
}

// The derived class owns the asio socket and closes the descriptor
StreamSocket::~StreamSocket() = default;

std::shared_ptr<StreamSocket> StreamSocket::create(const Url& url,
                                                   std::chrono::milliseconds connectTimeout,
                                                   const std::string& serverName) {
    if (url.isTls()) {
        return std::make_shared<TlsStreamSocket>(connectTimeout,
                                                 serverName.empty() ? url.host : serverName);
    }
    return std::make_shared<TcpStreamSocket>(connectTimeout);
}

void StreamSocket::connect(const std::string& host, uint16_t port) {
    if (closed_.load()) {
        throw TransportFailure("socket closed before connect");
    }

    asio::error_code ec;
    asio::ip::tcp::resolver resolver(ioc_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw TransportFailure("resolve " + host + ": " + ec.message());
    }

    bool done = false;
    asio::error_code connectEc;
    asio::ip::tcp::endpoint peer;
    asio::async_connect(tcp(), endpoints,
        [&](const asio::error_code& e, const asio::ip::tcp::endpoint& ep) {
            done = true;
            connectEc = e;
            peer = ep;
        });

    // Poll so a concurrent forceClose() abandons the attempt promptly
    const auto deadline = std::chrono::steady_clock::now() + connect_timeout_;
    while (!done && !closed_.load() && std::chrono::steady_clock::now() < deadline) {
        ioc_.run_for(kConnectPollInterval);
    }

    if (!done) {
        asio::error_code ignored;
        tcp().close(ignored);
        // Drain the aborted handler so nothing references this frame afterwards
        ioc_.restart();
        ioc_.run();
        throw TransportFailure(closed_.load()
            ? "connect to " + host + " aborted"
            : "connect to " + host + ":" + std::to_string(port) + " timed out");
    }
    ioc_.restart();

    if (connectEc) {
        throw TransportFailure("connect to " + host + ":" + std::to_string(port) + ": " +
                               connectEc.message());
    }

    remote_address_ = peer.address().to_string();

    asio::error_code optEc;
    tcp().set_option(asio::ip::tcp::no_delay(true), optEc);

    fd_.store(static_cast<int>(tcp().native_handle()));
    // forceClose() may have run between the connect and the store above
    if (closed_.load()) {
        shutdownDescriptor();
        throw TransportFailure("connect to " + host + " aborted");
    }

    handshake(host, ec);
    if (ec) {
        throw TransportFailure("TLS handshake with " + host + ": " + ec.message());
    }
    connected_.store(true);
}

size_t StreamSocket::readSome(char* buffer, size_t capacity) {
    if (closed_.load()) {
        throw TransportFailure("read on closed socket");
    }
    asio::error_code ec;
    size_t n = doRead(buffer, capacity, ec);
    if (closed_.load()) {
        throw TransportFailure("socket force-closed");
    }
    if (ec == asio::error::eof) {
        return n;
    }
    if (ec == asio::ssl::error::stream_truncated) {
        // Peer dropped the TCP connection without close_notify
        return n;
    }
    if (ec) {
        throw TransportFailure("read: " + ec.message());
    }
    return n;
}

void StreamSocket::writeAll(const char* data, size_t n) {
    if (closed_.load()) {
        throw TransportFailure("write on closed socket");
    }
    asio::error_code ec;
    doWrite(data, n, ec);
    if (closed_.load()) {
        throw TransportFailure("socket force-closed");
    }
    if (ec) {
        throw TransportFailure("write: " + ec.message());
    }
}

void StreamSocket::forceClose() {
    if (closed_.exchange(true)) {
        return;
    }
    shutdownDescriptor();
}

void StreamSocket::shutdownDescriptor() {
    int fd = fd_.load();
    if (fd >= 0) {
        // Wakes any thread blocked in recv()/send() on this descriptor
        ::shutdown(fd, SHUT_RDWR);
    }
}

// ======== TCP ========

TcpStreamSocket::TcpStreamSocket(std::chrono::milliseconds connectTimeout)
    : StreamSocket(connectTimeout), socket_(ioc_) {
}

size_t TcpStreamSocket::doRead(char* buffer, size_t capacity, asio::error_code& ec) {
    return socket_.read_some(asio::buffer(buffer, capacity), ec);
}

size_t TcpStreamSocket::doWrite(const char* data, size_t n, asio::error_code& ec) {
    return asio::write(socket_, asio::buffer(data, n), ec);
}

// ======== TLS ========

TlsStreamSocket::TlsStreamSocket(std::chrono::milliseconds connectTimeout,
                                 const std::string& serverName)
    : StreamSocket(connectTimeout),
      server_name_(serverName),
      ssl_ctx_(asio::ssl::context::tls_client),
      stream_(ioc_, ssl_ctx_) {
    stream_.set_verify_mode(asio::ssl::verify_none);
}

void TlsStreamSocket::handshake(const std::string& host, asio::error_code& ec) {
    const std::string& sni = server_name_.empty() ? host : server_name_;
    if (!SSL_set_tlsext_host_name(stream_.native_handle(), sni.c_str())) {
        GAUGE_LOG_WARNING("transport", "Could not set SNI host " + sni);
    }
    stream_.handshake(asio::ssl::stream_base::client, ec);
}

size_t TlsStreamSocket::doRead(char* buffer, size_t capacity, asio::error_code& ec) {
    return stream_.read_some(asio::buffer(buffer, capacity), ec);
}

size_t TlsStreamSocket::doWrite(const char* data, size_t n, asio::error_code& ec) {
    return asio::write(stream_, asio::buffer(data, n), ec);
}
