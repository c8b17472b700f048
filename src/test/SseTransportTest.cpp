#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "domain/Messages.hpp"
#include "infrastructure/SseTransport.hpp"

using namespace campaignflow::domain;
using namespace campaignflow::infrastructure;

namespace {

void TestFrameAndUnknownClient() {
    auto frame = SseTransport::Frame(nlohmann::json{{"type", "assistant"}, {"message", "hi"}});
    assert(frame.rfind("data: ", 0) == 0);
    assert(frame.size() > 2 && frame.substr(frame.size() - 2) == "\n\n");
    assert(frame.find("\"hi\"") != std::string::npos);

    SseTransport transport(2);
    assert(!transport.isConnected("nobody"));
    assert(!transport.send("nobody", OutboundMessage::Make(OutboundType::Assistant, "lost")));
    assert(transport.connectionCount() == 0);
    std::cout << "[PASS] Frames are SSE data lines; unknown clients get nothing." << std::endl;
}

void TestSameClientIsSerializedInOrder() {
    SseTransport transport(2);

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::vector<std::string> handled;
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};

    transport.setOnMessage([&](const std::string&, const std::string& body) {
        int now = ++inFlight;
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {}

        if (body == "first") {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, std::chrono::seconds(5), [&] { return release; });
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            handled.push_back(body);
        }
        --inFlight;
    });

    std::thread first([&] { transport.dispatchInbound("c", "first"); });
    while (inFlight.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::thread second([&] { transport.dispatchInbound("c", "second"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::thread third([&] { transport.dispatchInbound("c", "third"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(handled.empty() && "Later messages wait for the one being handled.");
        release = true;
    }
    cv.notify_all();
    first.join();
    second.join();
    third.join();

    assert(maxInFlight.load() == 1);
    assert((handled == std::vector<std::string>{"first", "second", "third"}));
    std::cout << "[PASS] One client's messages are handled one at a time, in arrival order." << std::endl;
}

void TestClientsDoNotBlockEachOther() {
    SseTransport transport(2);

    std::mutex mutex;
    std::condition_variable cv;
    bool otherArrived = false;
    bool slowSawOther = false;

    transport.setOnMessage([&](const std::string& clientId, const std::string&) {
        std::unique_lock<std::mutex> lock(mutex);
        if (clientId == "slow") {
            slowSawOther = cv.wait_for(lock, std::chrono::seconds(5), [&] { return otherArrived; });
        } else {
            otherArrived = true;
            cv.notify_all();
        }
    });

    std::thread slow([&] { transport.dispatchInbound("slow", "x"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::thread fast([&] { transport.dispatchInbound("fast", "y"); });
    slow.join();
    fast.join();

    assert(slowSawOther && "Another client's message ran while the first was still busy.");
    std::cout << "[PASS] Different clients are handled in parallel." << std::endl;
}

void TestThrowingCallbackReleasesTurn() {
    SseTransport transport(2);
    std::vector<std::string> handled;
    transport.setOnMessage([&](const std::string&, const std::string& body) {
        handled.push_back(body);
        if (body == "bad") throw std::runtime_error("handler failed");
    });

    bool threw = false;
    try {
        transport.dispatchInbound("c", "bad");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::thread next([&] { transport.dispatchInbound("c", "good"); });
    next.join();
    assert((handled == std::vector<std::string>{"bad", "good"}));
    std::cout << "[PASS] A failing handler does not stall the client's inbox." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SseTransport Test..." << std::endl;
    TestFrameAndUnknownClient();
    TestSameClientIsSerializedInOrder();
    TestClientsDoNotBlockEachOther();
    TestThrowingCallbackReleasesTurn();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
