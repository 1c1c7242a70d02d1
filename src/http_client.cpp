#include "http_client.h"
#include "gauge_logger.h"
#include "measurement_errors.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

constexpr size_t kReadBufferSize = 64 * 1024;

bool sameName(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool hasHeader(const std::vector<std::pair<std::string, std::string>>& headers,
               const std::string& name) {
    return std::any_of(headers.begin(), headers.end(),
                       [&](const auto& h) { return sameName(h.first, name); });
}

std::string connectionKey(const Url& url) {
    return url.scheme + "://" + url.host + ":" + std::to_string(url.port);
}

} // namespace

// State of one request/response exchange, visible to the parser callbacks
struct HttpClient::Exchange {
    const BodyCallback* onBody = nullptr;
    bool followRedirects = false;
    size_t captureLimit = 0;
    std::uint64_t readLimit = 0;

    bool deliverBody = true;
    std::uint64_t bodySeen = 0;
    bool complete = false;
    bool sawResponseBytes = false;
    std::uint64_t bytesReported = 0;

    HttpResponse response;
};

// Shared with the watchdog timer so the callback never touches the client
struct HttpClient::Watchdog {
    std::mutex mutex;
    std::weak_ptr<StreamSocket> socket;
    std::atomic<bool> fired{false};

    void attach(const std::shared_ptr<StreamSocket>& s) {
        std::lock_guard<std::mutex> lock(mutex);
        socket = s;
        if (fired.load()) {
            s->forceClose();
        }
    }

    void trip() {
        std::lock_guard<std::mutex> lock(mutex);
        fired.store(true);
        if (auto s = socket.lock()) {
            s->forceClose();
        }
    }
};

HttpClient::HttpClient(TimerService* timers)
    : HttpClient(timers, Options()) {
}

HttpClient::HttpClient(TimerService* timers, Options options)
    : timers_(timers),
      options_(std::move(options)),
      parser_(*this),
      read_buffer_(kReadBufferSize) {
}

HttpClient::~HttpClient() {
    dropConnection();
}

bool HttpClient::isRedirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string HttpClient::buildRequestHead(const HttpRequest& request, const std::string& userAgent,
                                         size_t contentLength) {
    std::ostringstream out;
    out << request.method << " " << request.url.target << " HTTP/1.1\r\n";

    if (!hasHeader(request.headers, "Host")) {
        out << "Host: " << request.url.authority() << "\r\n";
    }
    if (!hasHeader(request.headers, "User-Agent")) {
        out << "User-Agent: " << userAgent << "\r\n";
    }
    if (!hasHeader(request.headers, "Accept")) {
        out << "Accept: */*\r\n";
    }
    if (!hasHeader(request.headers, "Accept-Encoding")) {
        out << "Accept-Encoding: identity\r\n";
    }
    if (!hasHeader(request.headers, "Connection")) {
        out << "Connection: keep-alive\r\n";
    }
    for (const auto& [name, value] : request.headers) {
        out << name << ": " << value << "\r\n";
    }

    const bool sendsBody = contentLength > 0 || request.method == "POST" || request.method == "PUT";
    if (sendsBody && !hasHeader(request.headers, "Content-Length")) {
        out << "Content-Length: " << contentLength << "\r\n";
    }
    out << "\r\n";
    return out.str();
}

// ======== PUBLIC API ========

HttpResponse HttpClient::execute(const HttpRequest& request, const BodyCallback& onBody) {
    return perform(request, onBody, 0, nullptr);
}

HttpResponse HttpClient::upload(const HttpRequest& request, size_t sliceSize,
                                const ByteCallback& onBytes) {
    // A redirect would resend the payload and count it twice
    HttpRequest single = request;
    single.followRedirects = false;
    return perform(single, nullptr, sliceSize, onBytes);
}

HttpResponse HttpClient::head(const Url& url) {
    HttpRequest request;
    request.method = "HEAD";
    request.url = url;
    return execute(request);
}

HttpResponse HttpClient::get(const Url& url, const BodyCallback& onBody) {
    HttpRequest request;
    request.url = url;
    return execute(request, onBody);
}

void HttpClient::forceClose() {
    if (closed_.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (connection_) {
        connection_->forceClose();
    }
}

// ======== REQUEST FLOW ========

HttpResponse HttpClient::perform(const HttpRequest& request, const BodyCallback& onBody,
                                 size_t sliceSize, const ByteCallback& onBytes) {
    const auto started = std::chrono::steady_clock::now();
    HttpRequest current = request;
    int redirects = 0;

    for (;;) {
        HttpResponse response = performOnce(current, onBody, sliceSize, onBytes);

        const bool follow = current.followRedirects && isRedirect(response.statusCode) &&
                            response.head.hasHeader("Location");
        if (!follow) {
            response.redirects = redirects;
            response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            return response;
        }

        if (++redirects > current.maxRedirects) {
            throw ProtocolViolation("too many redirects from " + request.url.toString());
        }

        Url next;
        try {
            next = current.url.resolve(response.header("Location"));
        } catch (const std::invalid_argument& e) {
            throw ProtocolViolation(std::string("bad redirect target: ") + e.what());
        }

        const int status = response.statusCode;
        if (status == 303 || ((status == 301 || status == 302) && current.method == "POST")) {
            current.method = "GET";
            current.body.clear();
        }
        current.url = next;
    }
}

HttpResponse HttpClient::performOnce(const HttpRequest& request, const BodyCallback& onBody,
                                     size_t sliceSize, const ByteCallback& onBytes) {
    for (int attempt = 0;; ++attempt) {
        auto watchdog = std::make_shared<Watchdog>();
        std::shared_ptr<ManagedTimer> timer;
        const auto timeout = request.timeout.count() > 0 ? request.timeout : options_.requestTimeout;
        if (timers_ && timeout.count() > 0) {
            timer = timers_->createOneShot(timeout, [watchdog]() { watchdog->trip(); });
        }

        Exchange exchange;
        exchange.onBody = onBody ? &onBody : nullptr;
        exchange.followRedirects = request.followRedirects;
        exchange.captureLimit = request.captureLimit;
        exchange.readLimit = request.readLimit;

        bool reused = false;
        try {
            auto socket = acquireConnection(request.url, reused, *watchdog);
            exchange.response.remoteAddress = socket->remoteAddress();
            runExchange(exchange, *socket, request, sliceSize, onBytes);
        } catch (const TransportFailure&) {
            if (timer) {
                timer->cancel();
            }
            dropConnection();
            if (closed_.load()) {
                throw TransportFailure("client closed");
            }
            if (watchdog->fired.load()) {
                throw TransportFailure(request.method + " " + request.url.toString() +
                                       " timed out after " + std::to_string(timeout.count()) + " ms");
            }
            // A kept-alive connection the server already dropped; retry once on a fresh one
            if (reused && attempt == 0 && !exchange.sawResponseBytes && exchange.bytesReported == 0) {
                continue;
            }
            throw;
        } catch (const ProtocolViolation&) {
            if (timer) {
                timer->cancel();
            }
            dropConnection();
            throw;
        }

        if (timer) {
            timer->cancel();
        }
        if (exchange.response.truncated) {
            exchange.response.bodyBytes = exchange.bodySeen;
            dropConnection();
        } else {
            releaseConnection(exchange.response.head.keepAlive);
        }
        exchange.response.finalUrl = request.url;
        return exchange.response;
    }
}

void HttpClient::runExchange(Exchange& exchange, StreamSocket& socket, const HttpRequest& request,
                             size_t sliceSize, const ByteCallback& onBytes) {
    struct ExchangeScope {
        Exchange*& slot;
        ExchangeScope(Exchange*& s, Exchange* e) : slot(s) { slot = e; }
        ~ExchangeScope() { slot = nullptr; }
    } scope(exchange_, &exchange);

    if (request.method == "HEAD") {
        parser_.expectBodilessResponse();
    }

    const std::string head = buildRequestHead(request, options_.userAgent, request.body.size());
    const std::string& body = request.body;

    if (sliceSize == 0 || body.empty()) {
        const std::string whole = head + body;
        socket.writeAll(whole.data(), whole.size());
        if (onBytes && !body.empty()) {
            exchange.bytesReported += body.size();
            onBytes(body.size());
        }
    } else {
        socket.writeAll(head.data(), head.size());
        size_t offset = 0;
        while (offset < body.size()) {
            const size_t slice = std::min(sliceSize, body.size() - offset);
            socket.writeAll(body.data() + offset, slice);
            offset += slice;
            exchange.bytesReported += slice;
            if (onBytes) {
                onBytes(slice);
            }
        }
    }

    // Bytes left over from the previous exchange come first
    parser_.pump();

    while (!exchange.complete && !exchange.response.truncated) {
        size_t n = socket.readSome(read_buffer_.data(), read_buffer_.size());
        if (n == 0) {
            if (parser_.finishStream()) {
                break;
            }
            throw TransportFailure("connection closed before the response completed");
        }
        exchange.sawResponseBytes = true;
        parser_.feed(read_buffer_.data(), n);
    }
}

// ======== CONNECTION REUSE ========

std::shared_ptr<StreamSocket> HttpClient::acquireConnection(const Url& url, bool& reused,
                                                            Watchdog& watchdog) {
    std::shared_ptr<StreamSocket> socket;
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        if (closed_.load()) {
            throw TransportFailure("client closed");
        }

        const std::string key = connectionKey(url);
        if (connection_ && connection_key_ == key && connection_->isConnected()) {
            reused = true;
            watchdog.attach(connection_);
            return connection_;
        }

        if (connection_) {
            connection_->forceClose();
        }
        socket = StreamSocket::create(url, options_.connectTimeout);
        connection_ = socket;
        connection_key_ = key;
        parser_.reset();
    }

    // Connect outside the lock so forceClose() can interrupt it
    watchdog.attach(socket);
    socket->connect(url.host, url.port);
    return socket;
}

void HttpClient::releaseConnection(bool keepAlive) {
    if (!keepAlive) {
        dropConnection();
    }
}

void HttpClient::dropConnection() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (connection_) {
        connection_->forceClose();
        connection_.reset();
        connection_key_.clear();
    }
}

// ======== PARSER EVENTS ========

void HttpClient::onResponseHead(const HttpResponseHead& head) {
    if (!exchange_) {
        return;
    }
    exchange_->response.head = head;
    exchange_->response.statusCode = head.statusCode;
    exchange_->deliverBody = !(exchange_->followRedirects && isRedirect(head.statusCode) &&
                               head.hasHeader("Location"));
}

void HttpClient::onResponseBody(const char* data, size_t n) {
    if (!exchange_ || !exchange_->deliverBody) {
        return;
    }
    if (exchange_->onBody) {
        (*exchange_->onBody)(data, n);
    }
    HttpResponse& response = exchange_->response;
    exchange_->bodySeen += n;
    if (exchange_->readLimit > 0 && exchange_->bodySeen >= exchange_->readLimit && !exchange_->complete) {
        response.truncated = true;
    }
    if (response.body.size() < exchange_->captureLimit) {
        response.body.append(data, std::min(n, exchange_->captureLimit - response.body.size()));
    }
}

void HttpClient::onResponseComplete(const HttpResponseHead& head, std::uint64_t bodyBytes) {
    (void)head;
    if (!exchange_) {
        return;
    }
    exchange_->response.bodyBytes = bodyBytes;
    exchange_->response.truncated = false;
    exchange_->complete = true;
}
