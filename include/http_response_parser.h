#ifndef HTTP_RESPONSE_PARSER_H
#define HTTP_RESPONSE_PARSER_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "byte_buffer.h"

struct HttpResponseHead {
    std::string httpVersion;
    int statusCode = 0;
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;

    std::int64_t contentLength = -1; // -1 = not announced
    bool chunked = false;
    bool keepAlive = true;

    // Case-insensitive lookup; empty string when absent
    std::string header(const std::string& name) const;
    bool hasHeader(const std::string& name) const;
};

/**
 * Incremental HTTP/1.1 response parser for a single connection.
 *
 * Bytes are fed exactly as they come off the socket. The parser walks
 * ReadingHeaders -> ReadingBody -> ReadingHeaders, delivering the head, the
 * body bytes (framing removed) and a completion event per response. Bytes that
 * belong to the next response stay buffered until more input arrives.
 *
 * Body framing: Content-Length, chunked transfer-encoding (decoded), or
 * read-until-close. 1xx interim responses are skipped; 204, 304 and replies to
 * HEAD requests have no body.
 */
class HttpResponseParser {
public:
    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void onResponseHead(const HttpResponseHead& head) { (void)head; }
        virtual void onResponseBody(const char* data, size_t n) { (void)data; (void)n; }
        virtual void onResponseComplete(const HttpResponseHead& head, std::uint64_t bodyBytes) = 0;
    };

    enum class State { ReadingHeaders, ReadingBody };

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;
    static constexpr size_t kMaxChunkLineBytes = 4 * 1024;

    explicit HttpResponseParser(Listener& listener);

    // The next response answers a HEAD request
    void expectBodilessResponse() { expect_bodiless_ = true; }

    // Appends `data` and parses until one response completes or the input
    // runs out. Returns true if a response completed; bytes past its end stay
    // buffered for pump(). Throws ProtocolViolation on malformed framing.
    bool feed(const char* data, size_t n);

    // Parses already-buffered bytes the same way feed() does
    bool pump();

    // Peer closed the stream. Returns true if that completed a
    // read-until-close response.
    bool finishStream();

    void reset();

    State state() const { return state_; }
    size_t bufferedBytes() const { return buffer_.size(); }

private:
    enum class Framing { Fixed, Chunked, UntilClose };
    enum class ChunkState { Size, Data, DataEnd, Trailers };

    bool processHeaders();
    bool processBody();
    bool processChunked();
    void parseHead(const std::string& text);
    void deliverBody(size_t n);
    void completeResponse();

    Listener& listener_;
    ByteBuffer buffer_;

    State state_ = State::ReadingHeaders;
    Framing framing_ = Framing::Fixed;
    ChunkState chunk_state_ = ChunkState::Size;
    bool expect_bodiless_ = false;

    HttpResponseHead head_;
    std::uint64_t remaining_ = 0;
    std::uint64_t body_bytes_ = 0;
    bool completed_ = false;
};

#endif // HTTP_RESPONSE_PARSER_H
