#include <catch2/catch.hpp>
#include "messaging/envelope.hpp"
#include "messaging/in_memory_broker.hpp"
#include "messaging/message_consumer.hpp"
#include "utils/errors.hpp"
#include <atomic>
#include <mutex>
#include <thread>

using namespace wordbase;
using namespace std::chrono_literals;

namespace {

const std::string kQueue = "test_queue";

struct Recorder {
    std::mutex mutex;
    std::vector<std::string> payloads;
    std::atomic<int> calls{0};

    PurposeHandler handler() {
        return [this](const std::string& payload) {
            std::lock_guard<std::mutex> lock(mutex);
            payloads.push_back(payload);
            calls++;
        };
    }
};

MessageConsumer::Options consumerOptions(size_t workers = 1) {
    MessageConsumer::Options options;
    options.queue = kQueue;
    options.workers = workers;
    options.poll_timeout = 20ms;
    options.error_backoff = 20ms;
    return options;
}

} // namespace

TEST_CASE("a handled message is acked once", "[consumer]") {
    InMemoryBroker broker;
    broker.declareQueue(kQueue);
    Recorder recorder;
    DispatchRegistry registry(std::vector<PurposeRoute>{{"ADD_USER", "user", recorder.handler()}});
    MessageConsumer consumer(broker, registry, consumerOptions());

    broker.publish(kQueue, encodeEnvelope("ADD_USER", "user", R"({"user_id":1})"));
    CHECK(consumer.processNext(100ms) == MessageConsumer::Outcome::Succeeded);

    REQUIRE(recorder.payloads.size() == 1);
    CHECK(recorder.payloads[0] == R"({"user_id":1})");
    CHECK(broker.unackedCount() == 0);
    CHECK(broker.ackedCount() == 1);
    CHECK(consumer.succeededCount() == 1);
}

TEST_CASE("an empty queue yields nothing", "[consumer]") {
    InMemoryBroker broker;
    broker.declareQueue(kQueue);
    DispatchRegistry registry(std::vector<PurposeRoute>{});
    MessageConsumer consumer(broker, registry, consumerOptions());

    CHECK(consumer.processNext(10ms) == MessageConsumer::Outcome::Idle);
    CHECK(broker.ackedCount() == 0);
}

TEST_CASE("an unknown purpose is acked without running a handler", "[consumer]") {
    InMemoryBroker broker;
    broker.declareQueue(kQueue);
    Recorder recorder;
    DispatchRegistry registry(std::vector<PurposeRoute>{{"ADD_USER", "user", recorder.handler()}});
    MessageConsumer consumer(broker, registry, consumerOptions());

    broker.publish(kQueue, encodeEnvelope("NOT_A_REAL_PURPOSE", "user", "{}"));
    CHECK(consumer.processNext(100ms) == MessageConsumer::Outcome::Dropped);

    CHECK(recorder.calls.load() == 0);
    CHECK(broker.unackedCount() == 0);
    CHECK(broker.ackedCount() == 1);
    CHECK(broker.pendingCount(kQueue) == 0);
}

TEST_CASE("malformed bodies and missing payloads are dropped", "[consumer]") {
    InMemoryBroker broker;
    broker.declareQueue(kQueue);
    Recorder recorder;
    DispatchRegistry registry(std::vector<PurposeRoute>{{"ADD_WORD", "word", recorder.handler()}});
    MessageConsumer consumer(broker, registry, consumerOptions());

    broker.publish(kQueue, "definitely not json");
    broker.publish(kQueue, R"({"word":"{}"})");
    broker.publish(kQueue, encodeEnvelope("ADD_WORD", "user", "{}"));

    CHECK(consumer.processNext(100ms) == MessageConsumer::Outcome::Dropped);
    CHECK(consumer.processNext(100ms) == MessageConsumer::Outcome::Dropped);
    CHECK(consumer.processNext(100ms) == MessageConsumer::Outcome::Dropped);

    CHECK(recorder.calls.load() == 0);
    CHECK(consumer.droppedCount() == 3);
    CHECK(broker.ackedCount() == 3);
    CHECK(broker.unackedCount() == 0);
}

TEST_CASE("a failing handler still acks", "[consumer]") {
    InMemoryBroker broker;
    broker.declareQueue(kQueue);
    PurposeHandler blocked = [](const std::string&) {
        throw PaymentRequiredError("subscription inactive");
    };
    PurposeHandler broken = [](const std::string&) {
        throw std::runtime_error("unexpected");
    };
    DispatchRegistry registry(std::vector<PurposeRoute>{{"ADD_WORD", "word", blocked},
                                                        {"ADD_PROFILE", "profile", broken}});
    MessageConsumer consumer(broker, registry, consumerOptions());

    broker.publish(kQueue, encodeEnvelope("ADD_WORD", "word", R"({"user_id":1,"word":"cat"})"));
    broker.publish(kQueue, encodeEnvelope("ADD_PROFILE", "profile", "{}"));

    CHECK(consumer.processNext(100ms) == MessageConsumer::Outcome::Failed);
    CHECK(consumer.processNext(100ms) == MessageConsumer::Outcome::Failed);

    CHECK(consumer.failedCount() == 2);
    CHECK(broker.unackedCount() == 0);
    CHECK(broker.ackedCount() == 2);
    CHECK(broker.pendingCount(kQueue) == 0);
}

TEST_CASE("worker threads drain the queue", "[consumer]") {
    InMemoryBroker broker;
    broker.declareQueue(kQueue);
    Recorder recorder;
    DispatchRegistry registry(std::vector<PurposeRoute>{{"ADD_USER", "user", recorder.handler()}});
    MessageConsumer consumer(broker, registry, consumerOptions(4));

    const int total = 50;
    for (int i = 0; i < total; ++i) {
        broker.publish(kQueue, encodeEnvelope("ADD_USER", "user", "{\"user_id\":" + std::to_string(i) + "}"));
    }
    broker.publish(kQueue, "garbage");

    consumer.start();
    CHECK(consumer.isRunning());
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (broker.ackedCount() < static_cast<uint64_t>(total + 1) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    consumer.stop();
    CHECK_FALSE(consumer.isRunning());

    CHECK(recorder.calls.load() == total);
    CHECK(consumer.succeededCount() == static_cast<uint64_t>(total));
    CHECK(consumer.droppedCount() == 1);
    CHECK(broker.ackedCount() == static_cast<uint64_t>(total + 1));
    CHECK(broker.unackedCount() == 0);
}

TEST_CASE("a broker error does not stop the workers", "[consumer]") {
    InMemoryBroker broker;
    DispatchRegistry registry(std::vector<PurposeRoute>{});
    MessageConsumer consumer(broker, registry, consumerOptions(2));

    consumer.start();
    std::this_thread::sleep_for(60ms);
    CHECK(consumer.isRunning());
    consumer.stop();
    CHECK(broker.ackedCount() == 0);
}

TEST_CASE("outcome names", "[consumer]") {
    CHECK(std::string(outcomeToString(MessageConsumer::Outcome::Idle)) == "idle");
    CHECK(std::string(outcomeToString(MessageConsumer::Outcome::Failed)) == "failed");
}
