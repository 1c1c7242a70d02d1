#ifndef PERSISTENT_TRANSPORT_H
#define PERSISTENT_TRANSPORT_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "http_response_parser.h"
#include "stream_socket.h"

// Outcome of one request. statusCode 0 with 0 body bytes is the sentinel for
// "the connection failed or the peer closed it mid-request".
struct ParsedResponse {
    int statusCode = 0;
    std::uint64_t bodyBytes = 0;

    bool ok() const { return statusCode != 0; }
};

/**
 * Repeated HTTP/1.1 requests over one already-connected socket.
 *
 * The connection is reused for as long as the server keeps it alive; the byte
 * count of every body is exact, and bytes that arrive after one response ends
 * stay buffered for the next one. One request may be in flight at a time.
 *
 * On a socket error or peer close the pending request returns the {0, 0}
 * sentinel and the transport tears the connection down; the caller opens a
 * fresh one. Broken framing throws ProtocolViolation after the same teardown.
 */
class PersistentTransport : private HttpResponseParser::Listener {
public:
    using ByteCallback = std::function<void(std::uint64_t)>;

    static constexpr size_t kReadBufferSize = 64 * 1024;

    explicit PersistentTransport(std::shared_ptr<StreamSocket> socket);
    ~PersistentTransport() override;

    PersistentTransport(const PersistentTransport&) = delete;
    PersistentTransport& operator=(const PersistentTransport&) = delete;

    // Writes a complete request (head + optional body) and reads the response
    ParsedResponse sendRequest(const std::string& request);

    // Writes `header`, then `body` in slices of `chunkSize`. onBytes fires
    // once per slice, after the socket accepted it.
    ParsedResponse sendRequestChunked(const std::string& header, const std::string& body,
                                      size_t chunkSize, const ByteCallback& onBytes);

    // Called with every byte count read off the socket (head and framing included)
    void setWireByteCallback(ByteCallback callback) { on_wire_bytes_ = std::move(callback); }

    bool isOpen() const { return open_.load() && !socket_->isClosed(); }
    void close();

    std::uint64_t requestsCompleted() const { return requests_completed_; }
    const std::shared_ptr<StreamSocket>& socket() const { return socket_; }

private:
    void onResponseComplete(const HttpResponseHead& head, std::uint64_t bodyBytes) override;

    ParsedResponse awaitResponse();
    ParsedResponse failRequest(const std::string& reason);
    void teardown();

    std::shared_ptr<StreamSocket> socket_;
    HttpResponseParser parser_;
    std::vector<char> read_buffer_;
    ByteCallback on_wire_bytes_;

    std::atomic<bool> open_{true};
    std::atomic<bool> in_flight_{false};

    bool response_ready_ = false;
    bool keep_alive_ = true;
    ParsedResponse response_;
    std::uint64_t requests_completed_ = 0;
};

#endif // PERSISTENT_TRANSPORT_H
