#ifndef HTTP_CLIENT_H
#define HTTP_CLIENT_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "http_response_parser.h"
#include "managed_handle.h"
#include "stream_socket.h"
#include "timer_service.h"
#include "url.h"

struct HttpRequest {
    std::string method = "GET";
    Url url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    bool followRedirects = true;
    int maxRedirects = 5;

    // 0 = client default
    std::chrono::milliseconds timeout{0};

    // Keep up to this many body bytes in HttpResponse::body
    size_t captureLimit = 0;

    // Stop reading once this many body bytes arrived (0 = read it all); the
    // response comes back marked truncated and the connection is dropped
    std::uint64_t readLimit = 0;
};

struct HttpResponse {
    int statusCode = 0;
    HttpResponseHead head;
    std::uint64_t bodyBytes = 0;
    std::string body;
    Url finalUrl;
    std::string remoteAddress;
    std::chrono::milliseconds elapsed{0};
    int redirects = 0;
    bool truncated = false;

    std::string header(const std::string& name) const { return head.header(name); }
};

/**
 * Small blocking HTTP/1.1 client. One idle keep-alive connection is kept per
 * client, so a worker that reuses its client reuses the TCP/TLS session.
 *
 * The client is itself a lifecycle handle: forceClose() from any thread shuts
 * the active connection down, the blocked call throws TransportFailure and the
 * client refuses further requests.
 */
class HttpClient : public ManagedHandle, private HttpResponseParser::Listener {
public:
    using BodyCallback = std::function<void(const char* data, size_t n)>;
    using ByteCallback = std::function<void(std::uint64_t)>;

    struct Options {
        std::chrono::milliseconds connectTimeout{5000};
        std::chrono::milliseconds requestTimeout{15000};
        std::string userAgent = "edgegauge/1.0";
    };

    // `timers` drives request watchdogs; without it requests are bounded by
    // the peer only
    explicit HttpClient(TimerService* timers = nullptr);
    HttpClient(TimerService* timers, Options options);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Throws TransportFailure / ProtocolViolation. Non-2xx statuses are not errors.
    HttpResponse execute(const HttpRequest& request, const BodyCallback& onBody = nullptr);

    // Streams request.body in slices of `sliceSize`; onBytes fires after each
    // slice was accepted by the socket
    HttpResponse upload(const HttpRequest& request, size_t sliceSize, const ByteCallback& onBytes);

    HttpResponse head(const Url& url);
    HttpResponse get(const Url& url, const BodyCallback& onBody = nullptr);

    void forceClose() override;
    bool isClosed() const { return closed_.load(); }

    const Options& options() const { return options_; }

    static std::string buildRequestHead(const HttpRequest& request, const std::string& userAgent,
                                        size_t contentLength);
    static bool isRedirect(int status);

private:
    struct Exchange;
    struct Watchdog;

    HttpResponse perform(const HttpRequest& request, const BodyCallback& onBody,
                         size_t sliceSize, const ByteCallback& onBytes);
    HttpResponse performOnce(const HttpRequest& request, const BodyCallback& onBody,
                             size_t sliceSize, const ByteCallback& onBytes);
    void runExchange(Exchange& exchange, StreamSocket& socket, const HttpRequest& request,
                     size_t sliceSize, const ByteCallback& onBytes);

    std::shared_ptr<StreamSocket> acquireConnection(const Url& url, bool& reused,
                                                    Watchdog& watchdog);
    void releaseConnection(bool keepAlive);
    void dropConnection();

    // Parser events for the exchange in progress
    void onResponseHead(const HttpResponseHead& head) override;
    void onResponseBody(const char* data, size_t n) override;
    void onResponseComplete(const HttpResponseHead& head, std::uint64_t bodyBytes) override;

    TimerService* timers_;
    Options options_;

    std::atomic<bool> closed_{false};

    std::mutex connection_mutex_;
    std::shared_ptr<StreamSocket> connection_;
    std::string connection_key_;

    HttpResponseParser parser_;
    std::vector<char> read_buffer_;
    Exchange* exchange_ = nullptr;
};

#endif // HTTP_CLIENT_H
