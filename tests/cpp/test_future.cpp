#include <gtest/gtest.h>
#include "lmbridge/async/future.h"
#include "lmbridge/common/errors.h"

#include <atomic>
#include <thread>

using namespace lmbridge;

TEST(FutureTest, ValueSetFromAnotherThread) {
    Promise<int> promise;
    Future<int> future = promise.getFuture();
    EXPECT_FALSE(future.isReady());

    std::thread producer([promise]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        promise.setValue(42);
    });

    EXPECT_EQ(future.get(), 42);
    EXPECT_TRUE(future.isReady());
    EXPECT_FALSE(future.hasError());
    producer.join();
}

TEST(FutureTest, FailureIsRethrown) {
    Future<int> future = makeFailedFuture<int>(std::make_exception_ptr(RemoteError("boom")));

    EXPECT_TRUE(future.isReady());
    EXPECT_TRUE(future.hasError());
    try {
        future.get();
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_STREQ(e.what(), "boom");
    }
}

TEST(FutureTest, SettlesOnlyOnce) {
    Promise<void> promise;
    EXPECT_TRUE(promise.setValue());
    EXPECT_FALSE(promise.setValue());
    EXPECT_FALSE(promise.setException(std::make_exception_ptr(BridgeError("late"))));
    EXPECT_NO_THROW(promise.getFuture().get());
}

TEST(FutureTest, CallbackRunsOnSettlement) {
    Promise<std::string> promise;
    Future<std::string> future = promise.getFuture();
    std::atomic<int> calls(0);

    future.onSettled([&calls] { ++calls; });
    EXPECT_EQ(calls.load(), 0);

    promise.setValue("done");
    EXPECT_EQ(calls.load(), 1);

    // Registered after settlement: runs immediately
    future.onSettled([&calls] { ++calls; });
    EXPECT_EQ(calls.load(), 2);
}

TEST(FutureTest, WaitForTimesOut) {
    Promise<int> promise;
    EXPECT_FALSE(promise.getFuture().waitFor(std::chrono::milliseconds(20)));
    promise.setValue(1);
    EXPECT_TRUE(promise.getFuture().waitFor(std::chrono::milliseconds(20)));
}

TEST(FutureTest, EmptyFutureThrowsLogicError) {
    Future<int> future;
    EXPECT_FALSE(future.valid());
    EXPECT_THROW(future.get(), std::logic_error);
}

TEST(FutureTest, ReadyFutures) {
    EXPECT_EQ(makeReadyFuture(3.5f).get(), 3.5f);
    EXPECT_NO_THROW(makeReadyFuture().get());
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
