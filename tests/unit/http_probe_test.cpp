/**
 * @file http_probe_test.cpp
 * @brief Identity probe against a local cpp-httplib device stub
 *
 * Each test fixture runs a small HTTP server on 127.0.0.1 that plays the
 * role of a device identity endpoint with various (mis)behaviours.
 */

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

#include "discovery/http_probe.hpp"
#include "discovery/scanner.hpp"
#include "discovery/subnet.hpp"
#include "registry/device_registry.hpp"

// Same TSAN restriction as the HTTP handler tests: httplib's listen thread
// is not sanitizer-clean
#if defined(__SANITIZE_THREAD__)
#define DEVSCOUT_SKIP_HTTP_TESTS 1
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define DEVSCOUT_SKIP_HTTP_TESTS 1
#else
#define DEVSCOUT_SKIP_HTTP_TESTS 0
#endif
#else
#define DEVSCOUT_SKIP_HTTP_TESTS 0
#endif

using namespace devscout;
using namespace testing;
using discovery::MissReason;

//=============================================================================
// Body parsing (no socket)
//=============================================================================

TEST(IdentityBodyTest, AcceptsObjectWithStringId) {
    auto outcome = discovery::parse_identity_body(R"({"id":"dev-A","name":"bedroom","rev":2})", "192.168.1.5");

    ASSERT_TRUE(outcome.hit());
    EXPECT_EQ(outcome.record->id, "dev-A");
    EXPECT_EQ(outcome.record->ip, "192.168.1.5");
    EXPECT_EQ(outcome.record->attributes["name"], "bedroom");
    EXPECT_EQ(outcome.record->attributes["rev"], 2);
}

TEST(IdentityBodyTest, IntegerIdBecomesDecimalString) {
    auto outcome = discovery::parse_identity_body(R"({"id":42})", "192.168.1.6");

    ASSERT_TRUE(outcome.hit());
    EXPECT_EQ(outcome.record->id, "42");
}

TEST(IdentityBodyTest, MalformedBodiesAreMisses) {
    EXPECT_EQ(discovery::parse_identity_body("", "1.2.3.4").miss, MissReason::MALFORMED_BODY);
    EXPECT_EQ(discovery::parse_identity_body("<html></html>", "1.2.3.4").miss, MissReason::MALFORMED_BODY);
    EXPECT_EQ(discovery::parse_identity_body(R"(["dev-A"])", "1.2.3.4").miss, MissReason::MALFORMED_BODY);
    EXPECT_EQ(discovery::parse_identity_body(R"("dev-A")", "1.2.3.4").miss, MissReason::MALFORMED_BODY);
    EXPECT_FALSE(discovery::parse_identity_body(R"({"id":"dev-A")", "1.2.3.4").hit());
}

TEST(IdentityBodyTest, MissingOrUnusableIdIsAMiss) {
    EXPECT_EQ(discovery::parse_identity_body(R"({"name":"x"})", "1.2.3.4").miss, MissReason::MISSING_ID);
    EXPECT_EQ(discovery::parse_identity_body(R"({"id":""})", "1.2.3.4").miss, MissReason::MISSING_ID);
    EXPECT_EQ(discovery::parse_identity_body(R"({"id":null})", "1.2.3.4").miss, MissReason::MISSING_ID);
    EXPECT_EQ(discovery::parse_identity_body(R"({"id":{"a":1}})", "1.2.3.4").miss, MissReason::MISSING_ID);
    EXPECT_EQ(discovery::parse_identity_body(R"({"id":1.5})", "1.2.3.4").miss, MissReason::MISSING_ID);
}

TEST(ProbeTargetTest, InvalidTargetsThrow) {
    discovery::ProbeTarget target;
    target.ip = "192.168.1.5";

    target.timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(discovery::validate_target(target), std::invalid_argument);

    target.timeout = std::chrono::milliseconds(100);
    target.port = 0;
    EXPECT_THROW(discovery::validate_target(target), std::invalid_argument);

    target.port = 9000;
    target.ip.clear();
    EXPECT_THROW(discovery::validate_target(target), std::invalid_argument);

    target.ip = "192.168.1.5";
    EXPECT_NO_THROW(discovery::validate_target(target));
}

#if !DEVSCOUT_SKIP_HTTP_TESTS

//=============================================================================
// Probe against a live stub
//=============================================================================

class HttpProbeTest : public Test {
protected:
    static constexpr int kDevicePort = 19090;
    static constexpr int kClosedPort = 19099;

    void SetUp() override {
        device = std::make_unique<httplib::Server>();

        device->Get("/id", [](const httplib::Request &, httplib::Response &res) {
            res.set_content(R"({"id":"dev-A","name":"bedroom","fw":"1.4.2"})", "application/json");
        });
        device->Get("/text", [](const httplib::Request &, httplib::Response &res) {
            res.set_content("hello", "text/plain");
        });
        device->Get("/noid", [](const httplib::Request &, httplib::Response &res) {
            res.set_content(R"({"name":"nameless"})", "application/json");
        });
        device->Get("/empty", [](const httplib::Request &, httplib::Response &res) { res.status = 200; });
        device->Get("/error", [](const httplib::Request &, httplib::Response &res) {
            res.status = 500;
            res.set_content(R"({"id":"dev-A"})", "application/json");
        });
        device->Get("/slow", [](const httplib::Request &, httplib::Response &res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            res.set_content(R"({"id":"dev-slow"})", "application/json");
        });

        // One body byte every 100ms for 5s: each socket wait stays short
        device->Get("/trickle", [](const httplib::Request &, httplib::Response &res) {
            res.set_chunked_content_provider("application/json", [](size_t offset, httplib::DataSink &sink) {
                if (offset >= 50) {
                    sink.done();
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                return sink.write(offset == 0 ? "{" : " ", 1);
            });
        });
        device->Get("/huge", [](const httplib::Request &, httplib::Response &res) {
            std::string body = R"({"id":"dev-huge","pad":")";
            body.append(discovery::kMaxIdentityBodyBytes, 'x');
            body += "\"}";
            res.set_content(body, "application/json");
        });

        ASSERT_TRUE(device->bind_to_port("127.0.0.1", kDevicePort));
        device_thread = std::thread([this]() { device->listen_after_bind(); });

        // Give server time to bind
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    void TearDown() override {
        device->stop();
        if (device_thread.joinable()) {
            device_thread.join();
        }
    }

    discovery::ProbeTarget Target(const std::string &path, int timeout_ms = 500, int port = kDevicePort) {
        discovery::ProbeTarget target;
        target.ip = "127.0.0.1";
        target.port = port;
        target.path = path;
        target.timeout = std::chrono::milliseconds(timeout_ms);
        return target;
    }

    std::unique_ptr<httplib::Server> device;
    std::thread device_thread;
    discovery::HttpProbe probe;
};

TEST_F(HttpProbeTest, RespondingDeviceIsAHit) {
    auto outcome = probe.probe(Target("/id"));

    ASSERT_TRUE(outcome.hit()) << outcome.detail;
    EXPECT_EQ(outcome.record->id, "dev-A");
    EXPECT_EQ(outcome.record->ip, "127.0.0.1");
    EXPECT_EQ(outcome.record->attributes["fw"], "1.4.2");

    auto json = outcome.record->to_json();
    EXPECT_EQ(json["ip"], "127.0.0.1");
    EXPECT_EQ(json["name"], "bedroom");
}

TEST_F(HttpProbeTest, NonJsonBodyIsAMiss) {
    auto outcome = probe.probe(Target("/text"));
    EXPECT_FALSE(outcome.hit());
    EXPECT_EQ(outcome.miss, MissReason::MALFORMED_BODY);
}

TEST_F(HttpProbeTest, EmptyBodyIsAMiss) {
    auto outcome = probe.probe(Target("/empty"));
    EXPECT_FALSE(outcome.hit());
    EXPECT_EQ(outcome.miss, MissReason::MALFORMED_BODY);
}

TEST_F(HttpProbeTest, MissingIdIsAMiss) {
    auto outcome = probe.probe(Target("/noid"));
    EXPECT_FALSE(outcome.hit());
    EXPECT_EQ(outcome.miss, MissReason::MISSING_ID);
}

TEST_F(HttpProbeTest, ErrorStatusIsAMiss) {
    auto error = probe.probe(Target("/error"));
    EXPECT_FALSE(error.hit());
    EXPECT_EQ(error.miss, MissReason::BAD_STATUS);

    auto not_found = probe.probe(Target("/nothing-here"));
    EXPECT_FALSE(not_found.hit());
    EXPECT_EQ(not_found.miss, MissReason::BAD_STATUS);
}

TEST_F(HttpProbeTest, RefusedConnectionIsAMiss) {
    auto outcome = probe.probe(Target("/id", 500, kClosedPort));
    EXPECT_FALSE(outcome.hit());
    EXPECT_EQ(outcome.miss, MissReason::UNREACHABLE);
}

TEST_F(HttpProbeTest, SlowDeviceTimesOut) {
    auto started = std::chrono::steady_clock::now();
    auto outcome = probe.probe(Target("/slow", 200));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(outcome.hit());
    EXPECT_TRUE(outcome.miss == MissReason::READ_FAILED || outcome.miss == MissReason::TIMEOUT)
        << discovery::miss_reason_to_string(outcome.miss);
    EXPECT_LT(elapsed, std::chrono::milliseconds(900));
}

TEST_F(HttpProbeTest, TricklingBodyIsCutOffAtTheDeadline) {
    auto started = std::chrono::steady_clock::now();
    auto outcome = probe.probe(Target("/trickle", 300));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(outcome.hit());
    EXPECT_EQ(outcome.miss, MissReason::TIMEOUT) << outcome.detail;
    // Deadline plus at most one 100ms byte gap, far below the 5s the stub needs
    EXPECT_LT(elapsed, std::chrono::milliseconds(700));
}

TEST_F(HttpProbeTest, OversizedBodyIsAMiss) {
    auto outcome = probe.probe(Target("/huge", 2000));

    EXPECT_FALSE(outcome.hit());
    EXPECT_EQ(outcome.miss, MissReason::READ_FAILED) << outcome.detail;
}

TEST_F(HttpProbeTest, NonPositiveTimeoutThrows) {
    EXPECT_THROW(probe.probe(Target("/id", 0)), std::invalid_argument);
}

// Loopback /24: only 127.0.0.1 has a listener on the device port
TEST_F(HttpProbeTest, LoopbackSweepFindsOnlyTheStub) {
    discovery::DiscoveryConfig config;
    config.device_port = kDevicePort;
    config.identity_path = "/id";
    config.probe_timeout_ms = 300;

    discovery::StaticSubnetSource subnet("127.0.0");
    registry::DeviceRegistry registry;
    discovery::Scanner scanner(config, subnet, probe, registry);

    std::string error;
    ASSERT_TRUE(scanner.sweep(error)) << error;

    auto devices = registry.get_all();
    ASSERT_EQ(devices->size(), 1);
    EXPECT_EQ(devices->at("dev-A").ip, "127.0.0.1");
    EXPECT_EQ(scanner.last_stats().targets, 256);
    EXPECT_EQ(scanner.last_stats().miss_count(), 255);
}

#endif  // !DEVSCOUT_SKIP_HTTP_TESTS
