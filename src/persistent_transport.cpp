#include "persistent_transport.h"
#include "gauge_logger.h"
#include "measurement_errors.h"

#include <algorithm>
#include <stdexcept>

namespace {

// Clears the in-flight flag on every exit path
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {
        if (flag_.exchange(true)) {
            throw std::logic_error("PersistentTransport: a request is already in flight");
        }
    }
    ~InFlightGuard() { flag_.store(false); }

private:
    std::atomic<bool>& flag_;
};

bool isHeadRequest(const std::string& request) {
    return request.compare(0, 5, "HEAD ") == 0;
}

} // namespace

PersistentTransport::PersistentTransport(std::shared_ptr<StreamSocket> socket)
    : socket_(std::move(socket)),
      parser_(*this),
      read_buffer_(kReadBufferSize) {
    if (!socket_) {
        throw std::invalid_argument("PersistentTransport needs a socket");
    }
}

PersistentTransport::~PersistentTransport() {
    teardown();
}

ParsedResponse PersistentTransport::sendRequest(const std::string& request) {
    InFlightGuard guard(in_flight_);
    if (!isOpen()) {
        return ParsedResponse{};
    }

    if (isHeadRequest(request)) {
        parser_.expectBodilessResponse();
    }

    try {
        socket_->writeAll(request.data(), request.size());
    } catch (const TransportFailure& e) {
        return failRequest(e.what());
    }
    return awaitResponse();
}

ParsedResponse PersistentTransport::sendRequestChunked(const std::string& header,
                                                       const std::string& body,
                                                       size_t chunkSize,
                                                       const ByteCallback& onBytes) {
    InFlightGuard guard(in_flight_);
    if (!isOpen()) {
        return ParsedResponse{};
    }
    if (chunkSize == 0) {
        chunkSize = body.size();
    }

    try {
        socket_->writeAll(header.data(), header.size());

        size_t offset = 0;
        while (offset < body.size()) {
            const size_t slice = std::min(chunkSize, body.size() - offset);
            socket_->writeAll(body.data() + offset, slice);
            offset += slice;
            if (onBytes) {
                onBytes(slice);
            }
        }
    } catch (const TransportFailure& e) {
        return failRequest(e.what());
    }
    return awaitResponse();
}

ParsedResponse PersistentTransport::awaitResponse() {
    response_ready_ = false;

    // The previous read may already hold this response
    try {
        parser_.pump();
    } catch (const ProtocolViolation& e) {
        GAUGE_LOG_WARNING("transport", std::string("Dropping connection: ") + e.what());
        teardown();
        throw;
    }

    while (!response_ready_) {
        size_t n = 0;
        try {
            n = socket_->readSome(read_buffer_.data(), read_buffer_.size());
        } catch (const TransportFailure& e) {
            return failRequest(e.what());
        }

        if (n == 0) {
            // Peer closed; only a read-until-close body ends cleanly here
            if (parser_.finishStream()) {
                break;
            }
            return failRequest("peer closed the connection mid-request");
        }

        if (on_wire_bytes_) {
            on_wire_bytes_(n);
        }

        try {
            parser_.feed(read_buffer_.data(), n);
        } catch (const ProtocolViolation& e) {
            GAUGE_LOG_WARNING("transport", std::string("Dropping connection: ") + e.what());
            teardown();
            throw;
        }
    }

    ++requests_completed_;
    ParsedResponse result = response_;
    if (!keep_alive_) {
        teardown();
    }
    return result;
}

void PersistentTransport::onResponseComplete(const HttpResponseHead& head, std::uint64_t bodyBytes) {
    response_.statusCode = head.statusCode;
    response_.bodyBytes = bodyBytes;
    keep_alive_ = head.keepAlive;
    response_ready_ = true;
}

ParsedResponse PersistentTransport::failRequest(const std::string& reason) {
    if (IS_GAUGE_LOGGING_ENABLED("transport") && !socket_->isClosed()) {
        GAUGE_LOG("transport", "Connection lost: " + reason);
    }
    teardown();
    return ParsedResponse{};
}

void PersistentTransport::close() {
    teardown();
}

void PersistentTransport::teardown() {
    if (!open_.exchange(false)) {
        return;
    }
    socket_->forceClose();
}
