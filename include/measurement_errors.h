#ifndef MEASUREMENT_ERRORS_H
#define MEASUREMENT_ERRORS_H

#include <stdexcept>
#include <string>

// No candidate target validated. Terminal for the run, reported once.
class DiscoveryFailure : public std::runtime_error {
public:
    explicit DiscoveryFailure(const std::string& what) : std::runtime_error(what) {}
};

// Socket/connection level failure. Workers retry after a short backoff; during
// forced teardown this is the expected way a blocked read or write ends.
class TransportFailure : public std::runtime_error {
public:
    explicit TransportFailure(const std::string& what) : std::runtime_error(what) {}
};

// Unexpected status line or broken header/chunk framing. The connection is
// dropped and a fresh one opened; never fatal for the run.
class ProtocolViolation : public std::runtime_error {
public:
    explicit ProtocolViolation(const std::string& what) : std::runtime_error(what) {}
};

#endif // MEASUREMENT_ERRORS_H
