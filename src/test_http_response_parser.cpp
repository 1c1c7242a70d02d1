#include "http_response_parser.h"
#include "measurement_errors.h"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& label) {
    std::cout << label << ": " << (ok ? "PASS" : "FAIL") << std::endl;
    if (!ok) {
        failures++;
    }
}

class Recorder : public HttpResponseParser::Listener {
public:
    void onResponseHead(const HttpResponseHead& head) override { heads.push_back(head); }
    void onResponseBody(const char* data, size_t n) override { body.append(data, n); }
    void onResponseComplete(const HttpResponseHead& head, std::uint64_t bodyBytes) override {
        completedStatus.push_back(head.statusCode);
        completedBytes.push_back(bodyBytes);
    }

    std::vector<HttpResponseHead> heads;
    std::string body;
    std::vector<int> completedStatus;
    std::vector<std::uint64_t> completedBytes;
};

static void feedString(HttpResponseParser& parser, const std::string& s) {
    parser.feed(s.data(), s.size());
}

void testSplitDelivery() {
    std::cout << "\n--- Test 1: Response Split Across Reads ---" << std::endl;

    Recorder recorder;
    HttpResponseParser parser(recorder);

    const std::string head = "HTTP/1.1 200\r\nContent-Length: 100\r\n\r\n";
    const std::string body(100, 'x');
    const std::string next = "HTTP/1.1 204 No Content\r\n";
    const std::string wire = head + body + next;

    // 40 / 80 / rest
    parser.feed(wire.data(), 40);
    check(recorder.completedStatus.empty(), "Nothing complete after 40 bytes");
    parser.feed(wire.data() + 40, 80);
    check(recorder.completedStatus.empty(), "Nothing complete after 120 bytes");
    parser.feed(wire.data() + 120, wire.size() - 120);

    check(recorder.completedStatus.size() == 1 && recorder.completedStatus[0] == 200, "One 200 response");
    check(recorder.completedBytes.size() == 1 && recorder.completedBytes[0] == 100, "Exactly 100 body bytes");
    check(recorder.body == body, "Body delivered without framing");
    check(parser.bufferedBytes() == next.size(), "Next response's bytes stay buffered");
    check(parser.state() == HttpResponseParser::State::ReadingHeaders, "Back to reading headers");

    feedString(parser, "\r\n");
    check(recorder.completedStatus.size() == 2 && recorder.completedStatus[1] == 204, "Buffered 204 completes once its head ends");
}

void testChunkedDecoding() {
    std::cout << "\n--- Test 2: Chunked Transfer Encoding ---" << std::endl;

    Recorder recorder;
    HttpResponseParser parser(recorder);

    const std::string wire =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\nhello\r\n"
        "6;ext=1\r\n world\r\n"
        "0\r\nX-Trailer: yes\r\n\r\n";

    // One byte at a time is the worst split there is
    for (char c : wire) {
        parser.feed(&c, 1);
    }

    check(recorder.completedBytes.size() == 1 && recorder.completedBytes[0] == 11, "Decoded length is 11");
    check(recorder.body == "hello world", "Chunk payloads concatenated");
    check(parser.bufferedBytes() == 0, "Trailers consumed");
}

void testBodilessAndInterim() {
    std::cout << "\n--- Test 3: HEAD, 1xx and 304 ---" << std::endl;

    Recorder recorder;
    HttpResponseParser parser(recorder);

    parser.expectBodilessResponse();
    feedString(parser, "HTTP/1.1 200 OK\r\nContent-Length: 5000\r\n\r\n");
    check(recorder.completedBytes.size() == 1 && recorder.completedBytes[0] == 0, "HEAD reply has no body");

    feedString(parser, "HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 304 Not Modified\r\n\r\n");
    check(recorder.completedStatus.size() == 2 && recorder.completedStatus[1] == 304, "Interim response skipped");
}

void testUntilClose() {
    std::cout << "\n--- Test 4: Read Until Close ---" << std::endl;

    Recorder recorder;
    HttpResponseParser parser(recorder);

    feedString(parser, "HTTP/1.0 200 OK\r\n\r\nabcdef");
    check(recorder.completedStatus.empty(), "Open-ended body waits for close");
    check(parser.finishStream(), "Close completes the response");
    check(recorder.completedBytes.size() == 1 && recorder.completedBytes[0] == 6, "Six bytes counted");
    check(!recorder.heads.empty() && !recorder.heads[0].keepAlive, "HTTP/1.0 is not keep-alive");
}

void testMalformed() {
    std::cout << "\n--- Test 5: Malformed Framing ---" << std::endl;

    bool threw = false;
    try {
        Recorder recorder;
        HttpResponseParser parser(recorder);
        feedString(parser, "SMTP ready\r\n\r\n");
    } catch (const ProtocolViolation&) {
        threw = true;
    }
    check(threw, "Bad status line raises ProtocolViolation");

    threw = false;
    try {
        Recorder recorder;
        HttpResponseParser parser(recorder);
        feedString(parser, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
    } catch (const ProtocolViolation&) {
        threw = true;
    }
    check(threw, "Bad chunk size raises ProtocolViolation");

    threw = false;
    try {
        Recorder recorder;
        HttpResponseParser parser(recorder);
        feedString(parser, "HTTP/1.1 200 OK\r\nContent-Length: -4\r\n\r\n");
    } catch (const ProtocolViolation&) {
        threw = true;
    }
    check(threw, "Negative Content-Length raises ProtocolViolation");
}

int main() {
    std::cout << "Testing HttpResponseParser..." << std::endl;

    testSplitDelivery();
    testChunkedDecoding();
    testBodilessAndInterim();
    testUntilClose();
    testMalformed();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
