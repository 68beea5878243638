#include <gtest/gtest.h>
#include "lmbridge/async/future.h"
#include "lmbridge/transport/receive_port.h"

#include <mutex>
#include <thread>
#include <vector>

using namespace lmbridge;

namespace {

Envelope numbered(CorrelationId id) {
    return Envelope(id, Method::Stop, Payload());
}

} // namespace

TEST(PortTest, DeliversInSendOrderOnOwningLoop) {
    auto loop = std::make_shared<EventLoop>("test.port");
    loop->start();
    ReceivePort port(loop, "inbox");

    std::mutex mutex;
    std::vector<CorrelationId> ids;
    bool all_on_loop = true;
    Promise<void> done;

    port.listen([&](Envelope envelope) {
        std::lock_guard<std::mutex> lock(mutex);
        all_on_loop = all_on_loop && loop->inLoopThread();
        ids.push_back(envelope.id);
        if (ids.size() == 50) {
            done.setValue();
        }
    });

    SendPort sender = port.sendPort();
    std::thread producer([sender] {
        for (CorrelationId id = 1; id <= 50; ++id) {
            sender.send(numbered(id));
        }
    });
    producer.join();

    ASSERT_TRUE(done.getFuture().waitFor(std::chrono::seconds(2)));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_TRUE(all_on_loop);
    for (CorrelationId id = 1; id <= 50; ++id) {
        EXPECT_EQ(ids[id - 1], id);
    }
}

TEST(PortTest, EnvelopesBeforeListenAreReplayed) {
    auto loop = std::make_shared<EventLoop>("test.port");
    loop->start();
    ReceivePort port(loop, "inbox");

    SendPort sender = port.sendPort();
    sender.send(numbered(1));
    sender.send(numbered(2));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    std::mutex mutex;
    std::vector<CorrelationId> ids;
    Promise<void> done;
    port.listen([&](Envelope envelope) {
        std::lock_guard<std::mutex> lock(mutex);
        ids.push_back(envelope.id);
        if (ids.size() == 3) {
            done.setValue();
        }
    });
    sender.send(numbered(3));

    ASSERT_TRUE(done.getFuture().waitFor(std::chrono::seconds(2)));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(ids, (std::vector<CorrelationId>{1, 2, 3}));
}

TEST(PortTest, ClosedPortRejectsSends) {
    auto loop = std::make_shared<EventLoop>("test.port");
    loop->start();
    ReceivePort port(loop, "inbox");
    SendPort sender = port.sendPort();

    EXPECT_EQ(sender.name(), "inbox");
    EXPECT_TRUE(sender.send(numbered(1)));

    port.close();
    EXPECT_TRUE(sender.isClosed());
    EXPECT_FALSE(sender.send(numbered(2)));
}

TEST(PortTest, StoppedLoopRejectsSends) {
    auto loop = std::make_shared<EventLoop>("test.port");
    loop->start();
    ReceivePort port(loop, "inbox");

    loop->stop();
    EXPECT_FALSE(port.sendPort().send(numbered(1)));
}

TEST(PortTest, EmptySendPort) {
    SendPort sender;
    EXPECT_FALSE(sender.valid());
    EXPECT_TRUE(sender.isClosed());
    EXPECT_FALSE(sender.send(numbered(1)));
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
