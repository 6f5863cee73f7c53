// tests/HttpManagerTest.cpp
#include <Courier/ApiError.hpp>
#include <Courier/HttpManager.hpp>
#include <Courier/KeyValueStore.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "FakeTransport.hpp"

using namespace Courier;
using Courier::Testing::FakeTransport;
using Courier::Testing::ManualConnectivityMonitor;

namespace {

class HttpManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeTransport>();
        cache = std::make_shared<ResponseCache>(std::make_unique<MemoryKeyValueStore>());
    }

    std::unique_ptr<HttpManager> makeManager(bool connected) {
        Config config("./.courier_test_data");
        config.assumeConnected = connected;
        return std::make_unique<HttpManager>(config, transport, cache);
    }

    static ApiError::Kind kindOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const ApiError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected an ApiError";
        return ApiError::Kind::TransportError;
    }

    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<ResponseCache> cache;
};

TEST_F(HttpManagerTest, OnlineGetReturnsBodyAndCachesIt) {
    auto manager = makeManager(true);
    transport->respond(200, "payload");

    EXPECT_EQ(manager->Handle(GetRequest{"https://api.test/items", {}}), "payload");
    EXPECT_EQ(cache->get("https://api.test/items"), std::optional<std::string>("payload"));
}

TEST_F(HttpManagerTest, GetBypassesTransportCacheAndKeepsCallerHeaders) {
    auto manager = makeManager(true);
    manager->Handle(GetRequest{"https://api.test/items", {{"Authorization", "Bearer t"}}});

    ASSERT_EQ(transport->callCount(), 1u);
    const auto call = transport->calls().front();
    EXPECT_EQ(call.verb, "GET");
    EXPECT_EQ(call.headers.at("Cache-Control"), "no-cache");
    EXPECT_EQ(call.headers.at("Authorization"), "Bearer t");
}

TEST_F(HttpManagerTest, OfflineWithCacheEntryServesCacheWithoutTransport) {
    cache->put("https://api.test/items", "stale");
    auto manager = makeManager(false);

    EXPECT_EQ(manager->Handle(GetRequest{"https://api.test/items", {}}), "stale");
    EXPECT_EQ(manager->Handle(PostRequest{"https://api.test/items", std::string("{}"), {}}), "stale");
    EXPECT_EQ(transport->callCount(), 0u);
    EXPECT_EQ(manager->PendingCount(), 0u);
}

TEST_F(HttpManagerTest, SuccessfulResponseIsServedLaterWhileOffline) {
    auto manager = makeManager(true);
    transport->respond(200, "fresh");
    manager->Handle(GetRequest{"https://api.test/profile", {}});

    manager->OnConnectivityChanged(false);
    EXPECT_EQ(manager->Handle(GetRequest{"https://api.test/profile", {}}), "fresh");
    EXPECT_EQ(transport->callCount(), 1u);
}

TEST_F(HttpManagerTest, OfflineWithoutCacheFailsFastForGetAndRest) {
    auto manager = makeManager(false);

    EXPECT_EQ(kindOf([&] { manager->Handle(GetRequest{"https://api.test/a", {}}); }), ApiError::Kind::NetworkUnavailable);
    EXPECT_EQ(kindOf([&] { manager->Handle(PostRequest{"https://api.test/b", std::nullopt, {}}); }), ApiError::Kind::NetworkUnavailable);
    EXPECT_EQ(kindOf([&] {
        manager->Handle(RestRequest{"https://api.test/c", HttpMethod::Delete, std::nullopt, {}});
    }), ApiError::Kind::NetworkUnavailable);
    EXPECT_EQ(transport->callCount(), 0u);
}

TEST_F(HttpManagerTest, OfflineMultipartUploadStillReachesTransport) {
    auto manager = makeManager(false);
    transport->respond(200, "uploaded");

    MultipartUpload upload{"https://api.test/upload", {{"a", "1"}}, {FileAttachment{"hi", "f.txt", "text/plain"}}, {}};
    EXPECT_EQ(manager->Handle(upload), "uploaded");
    ASSERT_EQ(transport->callCount(), 1u);
    EXPECT_EQ(transport->calls().front().verb, "UPLOAD");
}

TEST_F(HttpManagerTest, FailureWhileOfflineQueuesEveryAttempt) {
    auto manager = makeManager(false);
    const GetRequest request{"https://api.test/feed", {}};

    EXPECT_THROW(manager->Handle(request), ApiError);
    EXPECT_EQ(manager->PendingCount(), 1u);
    EXPECT_THROW(manager->Handle(request), ApiError);
    EXPECT_EQ(manager->PendingCount(), 2u);
}

TEST_F(HttpManagerTest, FailureWhileOnlineIsNotQueued) {
    auto manager = makeManager(true);
    transport->fail("Could not resolve host");

    EXPECT_EQ(kindOf([&] { manager->Handle(GetRequest{"https://api.test/feed", {}}); }), ApiError::Kind::TransportError);
    EXPECT_EQ(manager->PendingCount(), 0u);
}

TEST_F(HttpManagerTest, OfflineUploadFailureIsQueuedAndRethrown) {
    auto manager = makeManager(false);
    transport->fail("Connection refused");

    MultipartUpload upload{"https://api.test/upload", {}, {FileAttachment{"x", "x.bin", "application/octet-stream"}}, {}};
    try {
        manager->Handle(upload);
        FAIL() << "expected TransportError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.kind(), ApiError::Kind::TransportError);
        EXPECT_STREQ(e.what(), "Connection refused");
    }
    EXPECT_EQ(manager->PendingCount(), 1u);
}

TEST_F(HttpManagerTest, ReconnectRetriesQueueOnceInOrderAndEmptiesIt) {
    auto manager = makeManager(false);
    EXPECT_THROW(manager->Handle(GetRequest{"https://api.test/1", {}}), ApiError);
    EXPECT_THROW(manager->Handle(PostRequest{"https://api.test/2", std::string("{}"), {}}), ApiError);
    EXPECT_THROW(manager->Handle(RestRequest{"https://api.test/3", HttpMethod::Put, std::nullopt, {}}), ApiError);
    ASSERT_EQ(manager->PendingCount(), 3u);

    transport->respond(200, "one");
    transport->respond(500, "boom");
    transport->respond(200, "three");
    manager->OnConnectivityChanged(true);

    const auto calls = transport->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].url, "https://api.test/1");
    EXPECT_EQ(calls[1].url, "https://api.test/2");
    EXPECT_EQ(calls[1].verb, "POST");
    EXPECT_EQ(calls[2].url, "https://api.test/3");
    EXPECT_EQ(calls[2].verb, "PUT");
    EXPECT_EQ(manager->PendingCount(), 0u);

    // Successful retries refresh the cache; the failed one is dropped for good
    EXPECT_EQ(cache->get("https://api.test/1"), std::optional<std::string>("one"));
    EXPECT_FALSE(cache->get("https://api.test/2").has_value());

    manager->OnConnectivityChanged(true);
    EXPECT_EQ(transport->callCount(), 3u);
}

TEST_F(HttpManagerTest, DisconnectDoesNotDrain) {
    auto manager = makeManager(false);
    EXPECT_THROW(manager->Handle(GetRequest{"https://api.test/1", {}}), ApiError);

    manager->OnConnectivityChanged(false);
    EXPECT_EQ(manager->PendingCount(), 1u);
    EXPECT_EQ(transport->callCount(), 0u);
}

TEST_F(HttpManagerTest, NonOkGetIsInvalidResponse) {
    auto manager = makeManager(true);
    transport->respond(404, "missing");

    try {
        manager->Handle(GetRequest{"https://api.test/missing", {}});
        FAIL() << "expected InvalidResponse";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.kind(), ApiError::Kind::InvalidResponse);
        EXPECT_FALSE(cache->get("https://api.test/missing").has_value());
    }
}

TEST_F(HttpManagerTest, NonOkPostIsServerErrorWithStatus) {
    auto manager = makeManager(true);
    transport->respond(503, "");

    try {
        manager->Handle(PostRequest{"https://api.test/orders", std::string("{}"), {}});
        FAIL() << "expected ServerError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.kind(), ApiError::Kind::ServerError);
        EXPECT_EQ(e.statusCode(), std::optional<long>(503));
    }
}

TEST_F(HttpManagerTest, ServerErrorWithoutStatusDefaultsTo500) {
    auto manager = makeManager(true);
    transport->respond(0, "");

    try {
        manager->Handle(RestRequest{"https://api.test/orders/1", HttpMethod::Delete, std::nullopt, {}});
        FAIL() << "expected ServerError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.kind(), ApiError::Kind::ServerError);
        EXPECT_EQ(e.statusCode(), std::optional<long>(500));
    }
}

TEST_F(HttpManagerTest, JsonContentTypeIsDefaultUnlessOverridden) {
    auto manager = makeManager(true);
    manager->Handle(PostRequest{"https://api.test/a", std::string("{}"), {}});
    manager->Handle(RestRequest{"https://api.test/b", HttpMethod::Put, std::string("x"), {{"content-type", "text/plain"}}});

    const auto calls = transport->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].headers.at("Content-Type"), "application/json");
    EXPECT_EQ(calls[1].headers.count("Content-Type"), 0u);
    EXPECT_EQ(calls[1].headers.at("content-type"), "text/plain");
    EXPECT_EQ(calls[1].body, std::optional<std::string>("x"));
}

TEST_F(HttpManagerTest, UploadSendsMultipartContentTypeMatchingBody) {
    auto manager = makeManager(true);
    MultipartUpload upload{"https://api.test/upload", {{"a", "1"}}, {FileAttachment{"hi", "f.txt", "text/plain"}},
                           {{"Content-Type", "application/json"}}};
    manager->Handle(upload);

    const auto call = transport->calls().front();
    const std::string& contentType = call.headers.at("Content-Type");
    const std::string prefix = "multipart/form-data; boundary=";
    ASSERT_EQ(contentType.rfind(prefix, 0), 0u);
    const std::string boundary = contentType.substr(prefix.size());
    EXPECT_EQ(boundary.rfind("Boundary-", 0), 0u);
    ASSERT_TRUE(call.body.has_value());
    EXPECT_EQ(call.body->rfind("--" + boundary + "\r\n", 0), 0u);
    EXPECT_THAT(*call.body, ::testing::EndsWith("--" + boundary + "--\r\n"));
}

TEST_F(HttpManagerTest, UploadProgressIsMonotonicAndEndsAtOne) {
    auto manager = makeManager(true);
    transport->setUploadTicks({{0, 0}, {10, 100}, {50, 100}, {40, 100}, {90, 100}});

    std::vector<double> reported;
    MultipartUpload upload{"https://api.test/upload", {}, {FileAttachment{"hi", "f.txt", "text/plain"}}, {}};
    manager->Handle(upload, [&](double fraction) { reported.push_back(fraction); });

    ASSERT_FALSE(reported.empty());
    for (std::size_t i = 1; i < reported.size(); ++i) {
        EXPECT_GE(reported[i], reported[i - 1]);
    }
    for (double f : reported) {
        EXPECT_GE(f, 0.0);
        EXPECT_LE(f, 1.0);
    }
    EXPECT_DOUBLE_EQ(reported.back(), 1.0);
}

TEST_F(HttpManagerTest, FailedUploadDoesNotReportCompletion) {
    auto manager = makeManager(true);
    transport->setUploadTicks({{30, 100}});
    transport->fail("Connection reset by peer");

    std::vector<double> reported;
    MultipartUpload upload{"https://api.test/upload", {}, {}, {}};
    EXPECT_THROW(manager->Handle(upload, [&](double fraction) { reported.push_back(fraction); }), ApiError);
    EXPECT_EQ(reported, std::vector<double>({0.3}));
}

TEST_F(HttpManagerTest, AttachedMonitorDrivesConnectivityAndIsStoppedOnTeardown) {
    ManualConnectivityMonitor monitor;
    {
        auto manager = makeManager(false);
        manager->AttachMonitor(monitor);
        ASSERT_TRUE(monitor.isRunning());

        EXPECT_THROW(manager->Handle(GetRequest{"https://api.test/x", {}}), ApiError);
        monitor.emit(true);
        EXPECT_TRUE(manager->IsConnected());
        EXPECT_EQ(manager->PendingCount(), 0u);
        EXPECT_EQ(transport->callCount(), 1u);

        monitor.emit(false);
        EXPECT_FALSE(manager->IsConnected());
    }
    EXPECT_FALSE(monitor.isRunning());
    EXPECT_EQ(monitor.stopCount(), 1);
}

TEST_F(HttpManagerTest, AttachingMonitorAppliesObservedStateBeforeReturning) {
    ManualConnectivityMonitor monitor;
    monitor.setCurrent(true);
    auto manager = makeManager(false);

    manager->AttachMonitor(monitor);
    EXPECT_TRUE(manager->IsConnected());

    transport->respond(200, "live");
    EXPECT_EQ(manager->Handle(GetRequest{"https://api.test/now", {}}), "live");
    EXPECT_EQ(manager->PendingCount(), 0u);
}

TEST_F(HttpManagerTest, ProgressCallbackDoesNotBlockConcurrentTicks) {
    auto manager = makeManager(true);

    std::mutex mutex;
    std::condition_variable cv;
    bool firstEntered = false;
    bool secondSeen = false;

    // Two ticks from different threads; the second arrives while the first callback is still running
    transport->setUploadHook([&](const Http::UploadTick& tick) {
        std::thread first([&] { tick(10, 100); });
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, std::chrono::seconds(2), [&] { return firstEntered; });
        }
        tick(20, 100);
        first.join();
    });

    MultipartUpload upload{"https://api.test/upload", {}, {FileAttachment{"hi", "f.txt", "text/plain"}}, {}};
    manager->Handle(upload, [&](double fraction) {
        std::unique_lock<std::mutex> lock(mutex);
        if (fraction < 0.15) {
            firstEntered = true;
            cv.notify_all();
            cv.wait_for(lock, std::chrono::seconds(2), [&] { return secondSeen; });
        } else if (fraction < 0.25) {
            secondSeen = true;
            cv.notify_all();
        }
    });

    EXPECT_TRUE(firstEntered);
    EXPECT_TRUE(secondSeen);
}

TEST_F(HttpManagerTest, HandleAsyncResolvesWithBody) {
    auto manager = makeManager(true);
    transport->respond(200, "async");

    std::future<std::string> result = manager->HandleAsync(GetRequest{"https://api.test/async", {}});
    EXPECT_EQ(result.get(), "async");
}

TEST_F(HttpManagerTest, HandleAsyncCarriesErrors) {
    auto manager = makeManager(false);

    std::future<std::string> result = manager->HandleAsync(GetRequest{"https://api.test/async", {}});
    EXPECT_THROW(result.get(), ApiError);
    EXPECT_EQ(manager->PendingCount(), 1u);
}

TEST_F(HttpManagerTest, ConcurrentHandlesAndDrainLeaveConsistentState) {
    auto manager = makeManager(false);
    for (int i = 0; i < 20; ++i) {
        EXPECT_THROW(manager->Handle(GetRequest{"https://api.test/q" + std::to_string(i), {}}), ApiError);
    }
    manager->OnConnectivityChanged(true);
    ASSERT_EQ(manager->PendingCount(), 0u);

    std::vector<std::future<std::string>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(manager->HandleAsync(GetRequest{"https://api.test/shared", {}}));
    }
    for (auto& f : futures) {
        EXPECT_EQ(f.get(), "ok");
    }
    EXPECT_EQ(transport->callCount(), 36u);
    EXPECT_EQ(cache->get("https://api.test/shared"), std::optional<std::string>("ok"));
}

TEST_F(HttpManagerTest, RequestsDuringDrainPassInterleaveSafely) {
    auto manager = makeManager(false);
    EXPECT_THROW(manager->Handle(GetRequest{"https://api.test/held", {}}), ApiError);
    ASSERT_EQ(manager->PendingCount(), 1u);

    transport->holdNextCallTo("https://api.test/held");
    std::thread drain([&] { manager->OnConnectivityChanged(true); });
    if (!transport->waitUntilHolding()) {
        transport->release();
        drain.join();
        FAIL() << "retry never reached the transport";
    }

    // A connected request writes the same cache slot while the retry is parked
    transport->respond(200, "live");
    std::future<std::string> live = manager->HandleAsync(GetRequest{"https://api.test/held", {}});
    EXPECT_EQ(live.get(), "live");

    // Connectivity drops mid-pass; this failure belongs to the next pass
    manager->OnConnectivityChanged(false);
    std::future<std::string> late = manager->HandleAsync(GetRequest{"https://api.test/late", {}});
    EXPECT_THROW(late.get(), ApiError);
    EXPECT_EQ(manager->PendingCount(), 2u);

    transport->release();
    drain.join();

    const std::vector<Request> pending = manager->PendingRequests();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(endpointOf(pending.front()), "https://api.test/late");
    EXPECT_THAT(cache->get("https://api.test/held").value_or(""),
                ::testing::AnyOf(std::string("live"), std::string("ok")));

    manager->OnConnectivityChanged(true);
    EXPECT_EQ(manager->PendingCount(), 0u);
    EXPECT_EQ(cache->get("https://api.test/late"), std::optional<std::string>("ok"));
}

} // namespace
