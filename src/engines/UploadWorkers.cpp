#include "UploadWorkers.hpp"
#include "gauge_logger.h"
#include "http_client.h"
#include "persistent_transport.h"
#include "stream_socket.h"

#include <random>
#include <stdexcept>

std::shared_ptr<const std::string> makeUploadPayload(size_t size) {
    auto payload = std::make_shared<std::string>(size, '\0');
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& c : *payload) {
        c = static_cast<char>(dist(rng));
    }
    return payload;
}

std::string buildUploadHead(const Url& url, std::uint64_t contentLength, const std::string& userAgent) {
    std::string head;
    head += "POST " + url.target + " HTTP/1.1\r\n";
    head += "Host: " + url.authority() + "\r\n";
    head += "User-Agent: " + userAgent + "\r\n";
    head += "Content-Type: application/octet-stream\r\n";
    head += "Content-Length: " + std::to_string(contentLength) + "\r\n";
    head += "Connection: keep-alive\r\n";
    head += "\r\n";
    return head;
}

void runPostLoop(TieredUploader::TierContext& context, const PostLoopConfig& config, int workerId) {
    if (config.urls.empty() || !config.payload) {
        return;
    }

    HttpClient::Options options;
    options.connectTimeout = config.connectTimeout;
    options.requestTimeout = config.requestTimeout;

    auto client = std::make_shared<HttpClient>(&context.lifecycle().timers(), options);
    if (!context.adopt(client, false)) {
        return;
    }

    const std::string tag = context.name() + " W" + std::to_string(workerId);
    size_t rotation = static_cast<size_t>(workerId);

    HttpRequest request;
    request.method = "POST";
    request.followRedirects = false;
    request.body = *config.payload;
    request.headers = {
        {"Content-Type", "application/octet-stream"},
        {"Cache-Control", "no-store"}
    };

    auto onBytes = [&context](std::uint64_t n) { context.reportBytes(n); };

    while (!context.shouldStop()) {
        const std::string& target = config.urls[rotation % config.urls.size()];
        try {
            request.url = Url::parse(target);
            HttpResponse response = client->upload(request, config.sliceBytes, onBytes);

            if (response.statusCode < 400) {
                context.confirm();
                continue;
            }

            GAUGE_LOG("upload", tag + ": " + target + " rejected with " +
                      std::to_string(response.statusCode));
            ++rotation;
            context.waitForStop(std::chrono::milliseconds(100));
        } catch (const std::invalid_argument& e) {
            GAUGE_LOG_WARNING("upload", tag + ": bad target " + target + ": " + e.what());
            ++rotation;
        } catch (const std::exception& e) {
            if (context.shouldStop()) {
                break;
            }
            GAUGE_LOG("upload", tag + ": " + e.what());
            ++rotation;
            context.waitForStop(std::chrono::milliseconds(200));
        }
    }

    client->forceClose();
    context.release(client);
}

void runEdgeSocketWriter(TieredUploader::TierContext& context, const EdgeSocketConfig& config,
                         int workerId) {
    if (config.edgeIp.empty() || !config.chunk || config.chunk->empty()) {
        GAUGE_LOG("upload", context.name() + ": no edge address to write to");
        return;
    }

    const std::string tag = context.name() + " W" + std::to_string(workerId);

    Url edge;
    edge.scheme = config.tls ? "https" : "http";
    edge.host = config.edgeIp;
    edge.port = config.port;

    std::string head;
    head += "POST / HTTP/1.1\r\n";
    head += "Host: " + config.host + "\r\n";
    head += "Content-Type: application/octet-stream\r\n";
    head += "Content-Length: " + std::to_string(config.declaredLength) + "\r\n";
    head += "\r\n";

    const std::string& chunk = *config.chunk;

    while (!context.shouldStop()) {
        auto socket = StreamSocket::create(edge, config.connectTimeout, config.host);
        if (!context.adopt(socket, true)) {
            return;
        }

        try {
            socket->connect(config.edgeIp, config.port);
            socket->writeAll(head.data(), head.size());

            std::uint64_t written = 0;
            while (!context.shouldStop() && written + chunk.size() <= config.declaredLength) {
                socket->writeAll(chunk.data(), chunk.size());
                written += chunk.size();
                context.reportBytes(chunk.size());
                context.confirm();
            }
            GAUGE_LOG("upload", tag + ": request body exhausted after " + std::to_string(written) +
                      " bytes, reconnecting");
        } catch (const std::exception& e) {
            if (context.shouldStop()) {
                socket->forceClose();
                context.release(socket);
                break;
            }
            GAUGE_LOG("upload", tag + ": " + e.what());
            context.waitForStop(std::chrono::milliseconds(500));
        }

        socket->forceClose();
        context.release(socket);
    }
}

void runPersistentPost(TieredUploader::TierContext& context, const PersistentPostConfig& config,
                       int workerId) {
    if (!config.payload) {
        return;
    }

    const std::string tag = context.name() + " W" + std::to_string(workerId);
    const Url url = Url::parse(config.url);
    const std::string head = buildUploadHead(url, config.payload->size(), config.userAgent);

    auto onBytes = [&context](std::uint64_t n) { context.reportBytes(n); };

    while (!context.shouldStop()) {
        auto socket = StreamSocket::create(url, config.connectTimeout);
        if (!context.adopt(socket, true)) {
            return;
        }

        try {
            socket->connect(url.host, url.port);
            PersistentTransport transport(socket);
            GAUGE_LOG("upload", tag + ": connected to " + socket->remoteAddress());

            while (!context.shouldStop()) {
                ParsedResponse response = transport.sendRequestChunked(head, *config.payload,
                                                                       config.sliceBytes, onBytes);
                if (!response.ok()) {
                    break;
                }
                context.confirm();
            }
        } catch (const std::exception& e) {
            if (!context.shouldStop()) {
                GAUGE_LOG("upload", tag + ": " + e.what());
                context.waitForStop(std::chrono::milliseconds(500));
            }
        }

        socket->forceClose();
        context.release(socket);
    }
}
