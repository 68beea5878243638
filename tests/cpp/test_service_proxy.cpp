#include <gtest/gtest.h>
#include "fake_service.h"
#include "lmbridge/rpc/envelope.h"
#include "lmbridge/service/service_proxy.h"

using namespace lmbridge;
using lmbridge::test::FakeControl;
using lmbridge::test::FakeService;

namespace {

bool waitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

} // namespace

class ServiceProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        control = std::make_shared<FakeControl>();
        config.handshake_timeout_ms = 1000;
    }

    std::unique_ptr<ServiceProxy> makeProxy() {
        return std::unique_ptr<ServiceProxy>(new ServiceProxy(FakeService::factory(control), config));
    }

    std::shared_ptr<FakeControl> control;
    BridgeConfig config;
};

TEST_F(ServiceProxyTest, RoundTripThroughWorker) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();
    EXPECT_TRUE(proxy->isConnected());

    EXPECT_EQ(proxy->embed("hello").get(), (std::vector<float>{0.1f, 0.2f}));
    EXPECT_EQ(proxy->completion("hi").collect(), (std::vector<std::string>{"He", "llo"}));

    try {
        proxy->call<void>(static_cast<Method>(999)).get();
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_NE(std::string(e.what()).find("method#999"), std::string::npos) << e.what();
    }

    // The service was built once, off the calling thread
    EXPECT_EQ(control->created.load(), 1);
    std::lock_guard<std::mutex> lock(control->mutex);
    EXPECT_NE(control->created_on, std::this_thread::get_id());
}

TEST_F(ServiceProxyTest, RepliesMatchTheirCalls) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();

    // Shorter texts finish later, so replies arrive out of call order
    std::vector<std::string> texts = {"a", "ab", "abc", "abcd", "abcde", "abcdef"};
    std::vector<Future<std::vector<float>>> results;
    for (const auto& text : texts) {
        results.push_back(proxy->embed(text));
    }
    for (size_t i = 0; i < texts.size(); ++i) {
        EXPECT_EQ(results[i].get(), (std::vector<float>{static_cast<float>(texts[i].size())}));
    }
    EXPECT_TRUE(waitUntil([&] { return proxy->pendingCalls() == 0; }));
}

TEST_F(ServiceProxyTest, StreamsAndSingleCallsKeepTheirReplies) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();

    // Issued together so their replies interleave on the channel
    Stream<std::string> greeting = proxy->completion("hi");
    Future<std::vector<float>> slow = proxy->embed("a");
    Stream<std::string> history = proxy->chat({"q1", "a1", "q2"});
    Stream<std::string> echo = proxy->completion("echo me");
    Future<std::vector<float>> fast = proxy->embed("hello");

    EXPECT_EQ(history.collect(), (std::vector<std::string>{"q1", "a1", "q2"}));
    EXPECT_EQ(greeting.collect(), (std::vector<std::string>{"He", "llo"}));
    EXPECT_EQ(echo.collect(), (std::vector<std::string>{"echo me"}));
    EXPECT_EQ(fast.get(), (std::vector<float>{0.1f, 0.2f}));
    EXPECT_EQ(slow.get(), (std::vector<float>{1.0f}));
    EXPECT_TRUE(waitUntil([&] { return proxy->pendingCalls() == 0; }));
}

TEST_F(ServiceProxyTest, CallsBeforeInitFail) {
    auto proxy = makeProxy();

    try {
        proxy->embed("hello").get();
        FAIL() << "expected BridgeError";
    } catch (const BridgeError& e) {
        EXPECT_STREQ(e.what(), "service proxy not initialized: call init before embed");
    }

    Stream<std::string> stream = proxy->completion("hi");
    std::string piece;
    EXPECT_THROW(stream.next(piece), BridgeError);
    EXPECT_EQ(control->created.load(), 0);
}

TEST_F(ServiceProxyTest, CallsDuringHandshakeWaitForIt) {
    auto proxy = makeProxy();
    Future<void> init = proxy->init(InitParam());
    Future<std::vector<float>> embedding = proxy->embed("hello");
    Stream<std::string> stream = proxy->completion("hi");

    init.get();
    EXPECT_EQ(embedding.get(), (std::vector<float>{0.1f, 0.2f}));
    EXPECT_EQ(stream.collect(), (std::vector<std::string>{"He", "llo"}));
}

TEST_F(ServiceProxyTest, HandshakeTimeout) {
    control->fail_construction = true;
    config.handshake_timeout_ms = 100;
    auto proxy = makeProxy();

    EXPECT_THROW(proxy->init(InitParam()).get(), HandshakeError);
    EXPECT_FALSE(proxy->isConnected());
    EXPECT_THROW(proxy->embed("hello").get(), HandshakeError);

    // A later init spawns a fresh worker
    control->fail_construction = false;
    proxy->init(InitParam()).get();
    EXPECT_TRUE(proxy->isConnected());
    EXPECT_EQ(proxy->embed("hello").get(), (std::vector<float>{0.1f, 0.2f}));
}

TEST_F(ServiceProxyTest, SecondInitKeepsService) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();
    proxy->init(InitParam()).get();

    EXPECT_EQ(control->created.load(), 1);
    EXPECT_EQ(control->init_calls.load(), 2);
    EXPECT_EQ(proxy->embed("hello").get(), (std::vector<float>{0.1f, 0.2f}));
}

TEST_F(ServiceProxyTest, RemoteFailures) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();

    Stream<std::string> stream = proxy->completion("fail");
    std::string piece;
    ASSERT_TRUE(stream.next(piece));
    EXPECT_EQ(piece, "a");
    try {
        stream.next(piece);
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_STREQ(e.what(), "generation failed");
    }

    EXPECT_THROW(proxy->setImage("cat.png").get(), RemoteError);
    EXPECT_THROW(proxy->initRuntime(InitRuntimeParam()).get(), RemoteError);
    EXPECT_THROW(proxy->similarity(SimilarityParam({1.0f}, {})).get(), RemoteError);

    // Failures do not poison the channel
    proxy->initRuntime(InitRuntimeParam("model.gguf", "", Backend::LlamaCpp)).get();
    EXPECT_FLOAT_EQ(proxy->similarity(SimilarityParam({1.0f, 2.0f}, {3.0f, 4.0f})).get(), 2.0f);
    EXPECT_DOUBLE_EQ(proxy->getGenerationState().get().decode_speed, 42.0);
}

TEST_F(ServiceProxyTest, FailuresWithoutMessageAreRemoteErrors) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();

    EXPECT_THROW(proxy->call<void>(Method::Embed, toPayload(std::string(""))).get(), RemoteError);
    try {
        proxy->embed("").get();
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_STREQ(e.what(), kUnknownError);
    }

    Stream<std::string> stream = proxy->completion("silent");
    std::string piece;
    ASSERT_TRUE(stream.next(piece));
    EXPECT_EQ(piece, "a");
    EXPECT_THROW(stream.next(piece), RemoteError);
}

TEST_F(ServiceProxyTest, ReplyOfWrongShape) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();
    EXPECT_THROW(proxy->call<std::string>(Method::Embed, toPayload(std::string("hello"))).get(),
                 ProtocolError);
}

TEST_F(ServiceProxyTest, CancelStopsRemoteStream) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();

    Stream<std::string> stream = proxy->completion("endless");
    std::string piece;
    ASSERT_TRUE(stream.next(piece));
    ASSERT_TRUE(stream.next(piece));
    stream.cancel();

    EXPECT_TRUE(waitUntil([&] { return control->cancelled.load() == 1; }));
    EXPECT_TRUE(waitUntil([&] { return proxy->pendingCalls() == 0; }));
    EXPECT_FALSE(stream.next(piece));

    // The channel is still usable afterwards
    EXPECT_EQ(proxy->completion("hi").collect(), (std::vector<std::string>{"He", "llo"}));
}

TEST_F(ServiceProxyTest, DisposalFailsPendingCalls) {
    auto proxy = makeProxy();
    proxy->init(InitParam()).get();

    Future<void> pending = proxy->loadEmbedding("embed.gguf");
    Stream<std::string> stream = proxy->completion("endless");
    ASSERT_TRUE(waitUntil([&] { return proxy->pendingCalls() == 2; }));

    proxy.reset();

    try {
        pending.get();
        FAIL() << "expected BridgeError";
    } catch (const BridgeError& e) {
        EXPECT_STREQ(e.what(), "service proxy disposed");
    }
    EXPECT_THROW(stream.collect(), BridgeError);

    // Destroyed on the worker thread
    EXPECT_EQ(control->destroyed.load(), 1);
    std::lock_guard<std::mutex> lock(control->mutex);
    EXPECT_EQ(control->destroyed_on, control->created_on);
}

TEST_F(ServiceProxyTest, DeletedFromResultCallback) {
    ServiceProxy* proxy = makeProxy().release();
    proxy->init(InitParam()).get();

    // Settled on the proxy loop once the gate opens
    Future<void> loaded = proxy->loadEmbedding("embed.gguf");
    Promise<bool> deleted;
    loaded.onSettled([proxy, deleted]() mutable {
        delete proxy;
        deleted.setValue(true);
    });
    ASSERT_TRUE(waitUntil([&] { return proxy->pendingCalls() == 1; }));
    control->gate.setValue();

    ASSERT_TRUE(deleted.getFuture().waitFor(std::chrono::seconds(2)));
    EXPECT_NO_THROW(loaded.get());
    EXPECT_EQ(control->destroyed.load(), 1);
}

// The same script gives the same results in-process and through a worker
class ServiceModeTest : public ::testing::TestWithParam<bool> {};

TEST_P(ServiceModeTest, SameObservableResults) {
    auto control = std::make_shared<FakeControl>();
    std::unique_ptr<InferenceService> service = GetParam()
        ? createIsolatedService(FakeService::factory(control))
        : createLocalService(FakeService::factory(control));

    service->init(InitParam()).get();
    service->setSamplerParam(SamplerParam(0.7f, 40, 0.9f)).get();
    service->setGenerationParam(GenerationParam::initial().copyWith(64)).get();

    EXPECT_EQ(service->embed("hello").get(), (std::vector<float>{0.1f, 0.2f}));
    EXPECT_EQ(service->embed("abc").get(), (std::vector<float>{3.0f}));
    EXPECT_EQ(service->completion("hi").collect(), (std::vector<std::string>{"He", "llo"}));
    EXPECT_EQ(service->chat({"q", "a"}).collect(), (std::vector<std::string>{"q", "a"}));
    EXPECT_FLOAT_EQ(service->similarity(SimilarityParam({1.0f}, {2.0f})).get(), 1.0f);
    EXPECT_THROW(service->setAudio("a.wav").get(), std::runtime_error);

    std::lock_guard<std::mutex> lock(control->mutex);
    EXPECT_EQ(control->calls,
              (std::vector<std::string>{"setSamplerParam:40", "setGenerationParam:64"}));
}

INSTANTIATE_TEST_SUITE_P(LocalAndIsolated, ServiceModeTest, ::testing::Bool());

TEST(LocalServiceTest, FactoryWithoutInstance) {
    EXPECT_THROW(createLocalService([] { return std::unique_ptr<InferenceService>(); }),
                 BridgeError);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
