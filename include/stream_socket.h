#ifndef STREAM_SOCKET_H
#define STREAM_SOCKET_H

#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "managed_handle.h"
#include "url.h"

/**
 * Blocking byte stream over one TCP connection, optionally wrapped in TLS.
 *
 * Workers block in readSome()/writeAll(). forceClose() may be called from any
 * other thread (lifecycle teardown, request watchdogs): it shuts the file
 * descriptor down so the blocked call returns with an error, and every later
 * call throws TransportFailure. The descriptor itself is released by the
 * destructor.
 */
class StreamSocket : public ManagedHandle {
public:
    explicit StreamSocket(std::chrono::milliseconds connectTimeout);
    ~StreamSocket() override;

    StreamSocket(const StreamSocket&) = delete;
    StreamSocket& operator=(const StreamSocket&) = delete;

    // Resolves, connects (bounded by the connect timeout) and, for TLS,
    // performs the handshake. Throws TransportFailure.
    void connect(const std::string& host, uint16_t port);

    // Returns 0 when the peer closed the stream. Throws TransportFailure.
    size_t readSome(char* buffer, size_t capacity);

    // Returns once every byte was handed to the kernel. Throws TransportFailure.
    void writeAll(const char* data, size_t n);

    void forceClose() override;

    bool isClosed() const { return closed_.load(); }
    bool isConnected() const { return connected_.load() && !closed_.load(); }
    const std::string& remoteAddress() const { return remote_address_; }

    virtual bool isTls() const = 0;

    // TCP or TLS socket for the URL's scheme. `serverName` overrides the TLS
    // SNI host when the connection goes to a bare edge IP.
    static std::shared_ptr<StreamSocket> create(const Url& url,
                                                std::chrono::milliseconds connectTimeout,
                                                const std::string& serverName = "");

protected:
    virtual asio::ip::tcp::socket& tcp() = 0;
    virtual void handshake(const std::string& host, asio::error_code& ec) = 0;
    virtual size_t doRead(char* buffer, size_t capacity, asio::error_code& ec) = 0;
    virtual size_t doWrite(const char* data, size_t n, asio::error_code& ec) = 0;

    asio::io_context ioc_;

private:
    void shutdownDescriptor();

    std::chrono::milliseconds connect_timeout_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> connected_{false};
    std::atomic<int> fd_{-1};
    std::string remote_address_;
};

class TcpStreamSocket : public StreamSocket {
public:
    explicit TcpStreamSocket(std::chrono::milliseconds connectTimeout);

    bool isTls() const override { return false; }

protected:
    asio::ip::tcp::socket& tcp() override { return socket_; }
    void handshake(const std::string&, asio::error_code& ec) override { ec.clear(); }
    size_t doRead(char* buffer, size_t capacity, asio::error_code& ec) override;
    size_t doWrite(const char* data, size_t n, asio::error_code& ec) override;

private:
    asio::ip::tcp::socket socket_;
};

// Certificate verification is off: measurement targets are often addressed
// by edge IP, and the payload is throwaway.
class TlsStreamSocket : public StreamSocket {
public:
    TlsStreamSocket(std::chrono::milliseconds connectTimeout, const std::string& serverName);

    bool isTls() const override { return true; }

protected:
    asio::ip::tcp::socket& tcp() override { return stream_.next_layer(); }
    void handshake(const std::string& host, asio::error_code& ec) override;
    size_t doRead(char* buffer, size_t capacity, asio::error_code& ec) override;
    size_t doWrite(const char* data, size_t n, asio::error_code& ec) override;

private:
    std::string server_name_;
    asio::ssl::context ssl_ctx_;
    asio::ssl::stream<asio::ip::tcp::socket> stream_;
};

#endif // STREAM_SOCKET_H
