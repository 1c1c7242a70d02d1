#include "DiscoveryCascade.hpp"
#include <iostream>
#include <map>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& label) {
    std::cout << label << ": " << (ok ? "PASS" : "FAIL") << std::endl;
    if (!ok) {
        failures++;
    }
}

// Canned outcomes per URL; records every probe it receives
class ScriptedProber : public TargetProber {
public:
    std::map<std::string, ProbeOutcome> outcomes;
    std::vector<std::string> probed;

    ProbeOutcome probe(ResourceLifecycle& lifecycle, const std::string& url) override {
        (void)lifecycle;
        probed.push_back(url);
        auto it = outcomes.find(url);
        if (it == outcomes.end()) {
            ProbeOutcome unreachable;
            unreachable.error = "connection refused";
            return unreachable;
        }
        return it->second;
    }
};

static ProbeOutcome goodObject() {
    ProbeOutcome o;
    o.reachable = true;
    o.statusCode = 200;
    o.contentType = "application/octet-stream";
    o.contentLength = 50 * 1024 * 1024;
    o.acceptsRanges = true;
    o.edgeIp = "203.0.113.7";
    o.rttMs = 18.0;
    o.servedBy = "cache-fra19150";
    return o;
}

void testFirstValidWins() {
    std::cout << "\n--- Test 1: First Valid Candidate Wins ---" << std::endl;

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    auto prober = std::make_shared<ScriptedProber>();

    ProbeOutcome html = goodObject();
    html.contentType = "text/html; charset=utf-8";
    prober->outcomes["http://a.example/installer.pkg"] = html;

    ProbeOutcome noRanges = goodObject();
    noRanges.acceptsRanges = false;
    prober->outcomes["http://b.example/setup.exe"] = noRanges;

    prober->outcomes["http://c.example/client.exe"] = goodObject();
    prober->outcomes["http://d.example/spare.bin"] = goodObject();

    DiscoveryCascade cascade({"http://a.example/installer.pkg", "http://b.example/setup.exe",
                              "http://c.example/client.exe", "http://d.example/spare.bin"},
                             DiscoveryCascade::Criteria{true, 1024 * 1024, true}, prober);

    std::optional<json> target = cascade.run(lifecycle);
    check(target.has_value(), "A target was selected");
    if (!target) {
        return;
    }

    check((*target)["testUrl"] == "http://c.example/client.exe", "Third candidate selected");
    check((*target)["candidateIndex"] == 2, "Candidate index recorded");
    check((*target)["host"] == "c.example" && (*target)["path"] == "/client.exe", "Host and path split");
    check((*target)["edgeIp"] == "203.0.113.7", "Edge address recorded");
    check((*target)["classification"] == "near-cache", "Classified by RTT");
    check((*target)["servedBy"] == "cache-fra19150", "Served-by recorded");
    check(prober->probed.size() == 3 && cascade.probesIssued() == 3, "Each candidate probed at most once");
    check(prober->probed.back() != "http://d.example/spare.bin", "Later candidates never contacted");
}

void testRedirectTarget() {
    std::cout << "\n--- Test 2: Redirected Candidate ---" << std::endl;

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    auto prober = std::make_shared<ScriptedProber>();

    ProbeOutcome moved = goodObject();
    moved.finalUrl = "https://mirror.example/pub/object.bin";
    prober->outcomes["http://origin.example/object.bin"] = moved;

    DiscoveryCascade cascade({"http://origin.example/object.bin"}, DiscoveryCascade::Criteria{}, prober);
    std::optional<json> target = cascade.run(lifecycle);
    check(target && (*target)["testUrl"] == "https://mirror.example/pub/object.bin",
          "Final URL after redirects is the test URL");
}

void testNothingValidates() {
    std::cout << "\n--- Test 3: No Candidate Validates ---" << std::endl;

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    auto prober = std::make_shared<ScriptedProber>();

    ProbeOutcome forbidden = goodObject();
    forbidden.statusCode = 403;
    prober->outcomes["http://a.example/x"] = forbidden;

    DiscoveryCascade cascade({"http://a.example/x", "http://unknown.example/y"},
                             DiscoveryCascade::Criteria{}, prober);
    check(!cascade.run(lifecycle).has_value(), "No target");
    check(prober->probed.size() == 2, "Every candidate tried once");
}

void testStopHaltsCascade() {
    std::cout << "\n--- Test 4: Cancel Halts the Cascade ---" << std::endl;

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    auto prober = std::make_shared<ScriptedProber>();
    lifecycle.cancel();

    DiscoveryCascade cascade({"http://a.example/x"}, DiscoveryCascade::Criteria{}, prober);
    check(!cascade.run(lifecycle).has_value() && prober->probed.empty(), "No probe after cancel");
}

void testValidationRules() {
    std::cout << "\n--- Test 5: Validation Rules ---" << std::endl;

    DiscoveryCascade::Criteria strict{true, 1024 * 1024, true};
    check(DiscoveryCascade::validate(goodObject(), strict).empty(), "Good object passes");

    ProbeOutcome partial = goodObject();
    partial.statusCode = 206;
    check(DiscoveryCascade::validate(partial, strict).empty(), "206 accepted");

    ProbeOutcome small = goodObject();
    small.contentLength = 4096;
    small.bytesRead = 4096;
    check(!DiscoveryCascade::validate(small, strict).empty(), "Small object rejected");

    ProbeOutcome unsized = goodObject();
    unsized.contentLength = -1;
    unsized.bytesRead = 2 * 1024 * 1024;
    check(DiscoveryCascade::validate(unsized, strict).empty(), "Body bytes stand in for a missing length");

    ProbeOutcome noRanges = goodObject();
    noRanges.acceptsRanges = false;
    DiscoveryCascade::Criteria lenient{false, 0, true};
    check(!DiscoveryCascade::validate(noRanges, strict).empty(), "Missing ranges rejected when required");
    check(DiscoveryCascade::validate(noRanges, lenient).empty(), "Missing ranges fine otherwise");

    check(DiscoveryCascade::validate(ProbeOutcome{}, strict) == "unreachable", "Unreachable reason");

    check(DiscoveryCascade::classify(5.0) == "near-cache", "RTT 5 ms");
    check(DiscoveryCascade::classify(35.0) == "edge-pop", "RTT 35 ms");
    check(DiscoveryCascade::classify(120.0) == "distant", "RTT 120 ms");
}

int main() {
    std::cout << "Testing DiscoveryCascade..." << std::endl;

    testFirstValidWins();
    testRedirectTarget();
    testNothingValidates();
    testStopHaltsCascade();
    testValidationRules();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
