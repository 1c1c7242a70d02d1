#include "http_response_parser.h"
#include "measurement_errors.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

const char kCrlf[] = "\r\n";
const char kHeaderEnd[] = "\r\n\r\n";

} // namespace

std::string HttpResponseHead::header(const std::string& name) const {
    const std::string wanted = toLower(name);
    for (const auto& [key, value] : headers) {
        if (toLower(key) == wanted) {
            return value;
        }
    }
    return "";
}

bool HttpResponseHead::hasHeader(const std::string& name) const {
    const std::string wanted = toLower(name);
    for (const auto& entry : headers) {
        if (toLower(entry.first) == wanted) {
            return true;
        }
    }
    return false;
}

HttpResponseParser::HttpResponseParser(Listener& listener)
    : listener_(listener) {
}

void HttpResponseParser::reset() {
    buffer_.clear();
    state_ = State::ReadingHeaders;
    framing_ = Framing::Fixed;
    chunk_state_ = ChunkState::Size;
    expect_bodiless_ = false;
    head_ = HttpResponseHead{};
    remaining_ = 0;
    body_bytes_ = 0;
    completed_ = false;
}

bool HttpResponseParser::feed(const char* data, size_t n) {
    buffer_.append(data, n);
    return pump();
}

bool HttpResponseParser::pump() {
    completed_ = false;
    bool progress = true;
    while (progress && !completed_) {
        progress = (state_ == State::ReadingHeaders) ? processHeaders() : processBody();
    }
    return completed_;
}

bool HttpResponseParser::finishStream() {
    if (state_ == State::ReadingBody && framing_ == Framing::UntilClose) {
        completeResponse();
        return true;
    }
    return false;
}

// ======== HEADERS ========

bool HttpResponseParser::processHeaders() {
    if (buffer_.empty()) {
        return false;
    }

    const size_t headerEnd = buffer_.find(kHeaderEnd, 4);
    if (headerEnd == ByteBuffer::npos) {
        if (buffer_.size() > kMaxHeaderBytes) {
            throw ProtocolViolation("response header exceeds " + std::to_string(kMaxHeaderBytes) + " bytes");
        }
        return false;
    }

    parseHead(buffer_.toString(headerEnd));
    buffer_.consume(headerEnd + 4);

    // Interim responses (100 Continue, 103 Early Hints) precede the real one
    if (head_.statusCode >= 100 && head_.statusCode < 200 && head_.statusCode != 101) {
        return true;
    }

    listener_.onResponseHead(head_);
    body_bytes_ = 0;

    const bool bodiless = expect_bodiless_ || head_.statusCode == 204 || head_.statusCode == 304;
    if (bodiless) {
        completeResponse();
        return true;
    }

    if (head_.chunked) {
        framing_ = Framing::Chunked;
        chunk_state_ = ChunkState::Size;
    } else if (head_.contentLength >= 0) {
        framing_ = Framing::Fixed;
        remaining_ = static_cast<std::uint64_t>(head_.contentLength);
        if (remaining_ == 0) {
            completeResponse();
            return true;
        }
    } else {
        framing_ = Framing::UntilClose;
    }

    state_ = State::ReadingBody;
    return true;
}

void HttpResponseParser::parseHead(const std::string& text) {
    head_ = HttpResponseHead{};

    std::istringstream stream(text);
    std::string statusLine;
    std::getline(stream, statusLine);
    if (!statusLine.empty() && statusLine.back() == '\r') {
        statusLine.pop_back();
    }

    if (statusLine.compare(0, 5, "HTTP/") != 0) {
        throw ProtocolViolation("malformed status line: " + statusLine.substr(0, 64));
    }

    size_t firstSpace = statusLine.find(' ');
    if (firstSpace == std::string::npos || firstSpace + 4 > statusLine.size()) {
        throw ProtocolViolation("malformed status line: " + statusLine.substr(0, 64));
    }
    head_.httpVersion = statusLine.substr(0, firstSpace);

    const std::string code = statusLine.substr(firstSpace + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ProtocolViolation("non-numeric status code: " + code);
    }
    head_.statusCode = std::stoi(code);
    if (statusLine.size() > firstSpace + 5) {
        head_.reason = statusLine.substr(firstSpace + 5);
    }

    head_.keepAlive = head_.httpVersion != "HTTP/1.0";

    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw ProtocolViolation("malformed header line: " + line.substr(0, 64));
        }

        std::string name = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        const std::string lowered = toLower(name);

        if (lowered == "content-length") {
            try {
                head_.contentLength = std::stoll(value);
            } catch (const std::exception&) {
                throw ProtocolViolation("invalid Content-Length: " + value);
            }
            if (head_.contentLength < 0) {
                throw ProtocolViolation("negative Content-Length: " + value);
            }
        } else if (lowered == "transfer-encoding") {
            if (toLower(value).find("chunked") != std::string::npos) {
                head_.chunked = true;
            }
        } else if (lowered == "connection") {
            const std::string v = toLower(value);
            if (v.find("close") != std::string::npos) {
                head_.keepAlive = false;
            } else if (v.find("keep-alive") != std::string::npos) {
                head_.keepAlive = true;
            }
        }

        head_.headers.emplace_back(std::move(name), std::move(value));
    }

    // Transfer-Encoding overrides Content-Length (RFC 7230 3.3.3)
    if (head_.chunked) {
        head_.contentLength = -1;
    }
}

// ======== BODY ========

bool HttpResponseParser::processBody() {
    switch (framing_) {
        case Framing::Fixed: {
            if (buffer_.empty()) {
                return false;
            }
            const size_t take = static_cast<size_t>(
                std::min<std::uint64_t>(remaining_, buffer_.size()));
            deliverBody(take);
            remaining_ -= take;
            if (remaining_ == 0) {
                completeResponse();
                return true;
            }
            return false;
        }
        case Framing::UntilClose:
            if (!buffer_.empty()) {
                deliverBody(buffer_.size());
            }
            return false;
        case Framing::Chunked:
            return processChunked();
    }
    return false;
}

bool HttpResponseParser::processChunked() {
    switch (chunk_state_) {
        case ChunkState::Size: {
            const size_t lineEnd = buffer_.find(kCrlf, 2);
            if (lineEnd == ByteBuffer::npos) {
                if (buffer_.size() > kMaxChunkLineBytes) {
                    throw ProtocolViolation("chunk size line too long");
                }
                return false;
            }
            std::string line = buffer_.toString(lineEnd);
            buffer_.consume(lineEnd + 2);

            // Chunk extensions after ';' are ignored
            size_t semicolon = line.find(';');
            if (semicolon != std::string::npos) {
                line = line.substr(0, semicolon);
            }
            line = trim(line);
            if (line.empty() || !std::all_of(line.begin(), line.end(),
                                             [](unsigned char c) { return std::isxdigit(c); })) {
                throw ProtocolViolation("invalid chunk size: " + line.substr(0, 32));
            }
            if (line.size() > 15) {
                throw ProtocolViolation("chunk size overflow");
            }

            remaining_ = std::stoull(line, nullptr, 16);
            chunk_state_ = remaining_ == 0 ? ChunkState::Trailers : ChunkState::Data;
            return true;
        }
        case ChunkState::Data: {
            if (buffer_.empty()) {
                return false;
            }
            const size_t take = static_cast<size_t>(
                std::min<std::uint64_t>(remaining_, buffer_.size()));
            deliverBody(take);
            remaining_ -= take;
            if (remaining_ == 0) {
                chunk_state_ = ChunkState::DataEnd;
                return true;
            }
            return false;
        }
        case ChunkState::DataEnd: {
            if (buffer_.size() < 2) {
                return false;
            }
            if (buffer_.data()[0] != '\r' || buffer_.data()[1] != '\n') {
                throw ProtocolViolation("missing CRLF after chunk data");
            }
            buffer_.consume(2);
            chunk_state_ = ChunkState::Size;
            return true;
        }
        case ChunkState::Trailers: {
            const size_t lineEnd = buffer_.find(kCrlf, 2);
            if (lineEnd == ByteBuffer::npos) {
                if (buffer_.size() > kMaxHeaderBytes) {
                    throw ProtocolViolation("trailer section too long");
                }
                return false;
            }
            buffer_.consume(lineEnd + 2);
            if (lineEnd == 0) {
                completeResponse();
            }
            return true;
        }
    }
    return false;
}

void HttpResponseParser::deliverBody(size_t n) {
    if (n == 0) {
        return;
    }
    listener_.onResponseBody(buffer_.data(), n);
    body_bytes_ += n;
    buffer_.consume(n);
}

void HttpResponseParser::completeResponse() {
    state_ = State::ReadingHeaders;
    framing_ = Framing::Fixed;
    chunk_state_ = ChunkState::Size;
    expect_bodiless_ = false;
    remaining_ = 0;

    const std::uint64_t bodyBytes = body_bytes_;
    body_bytes_ = 0;
    completed_ = true;
    listener_.onResponseComplete(head_, bodyBytes);
}
