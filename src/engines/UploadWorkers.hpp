#ifndef UPLOAD_WORKERS_H
#define UPLOAD_WORKERS_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "TieredUploader.hpp"
#include "url.h"

// Incompressible filler; the same seed gives the same bytes on every run
std::shared_ptr<const std::string> makeUploadPayload(size_t size);

// HTTP POST of the payload over a keep-alive HttpClient, rotating through the
// targets whenever one rejects the request. A status below 400 confirms the tier.
struct PostLoopConfig {
    std::vector<std::string> urls;
    std::shared_ptr<const std::string> payload;
    size_t sliceBytes = 512 * 1024;
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds requestTimeout{10000};
};

void runPostLoop(TieredUploader::TierContext& context, const PostLoopConfig& config, int workerId);

// Oversized POST written straight to an edge IP over TLS: the declared body is
// far larger than what the phase can send, so the socket stays busy until
// teardown. The first accepted chunk confirms the tier.
struct EdgeSocketConfig {
    std::string edgeIp;
    std::string host;
    uint16_t port = 443;
    bool tls = true;
    std::uint64_t declaredLength = 64ULL * 1024 * 1024;
    std::shared_ptr<const std::string> chunk;
    std::chrono::milliseconds connectTimeout{5000};
};

void runEdgeSocketWriter(TieredUploader::TierContext& context, const EdgeSocketConfig& config,
                         int workerId);

// Repeated fixed-size POSTs over one PersistentTransport, the body flushed in
// slices. Any complete response confirms the tier.
struct PersistentPostConfig {
    std::string url;
    std::shared_ptr<const std::string> payload;
    size_t sliceBytes = 16 * 1024;
    std::chrono::milliseconds connectTimeout{8000};
    std::string userAgent = "edgegauge/1.0";
};

void runPersistentPost(TieredUploader::TierContext& context, const PersistentPostConfig& config,
                       int workerId);

std::string buildUploadHead(const Url& url, std::uint64_t contentLength, const std::string& userAgent);

#endif // UPLOAD_WORKERS_H
