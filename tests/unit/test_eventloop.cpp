#include "relay/network/EventLoop.h"
#include "relay/network/EventLoopThread.h"
#include "relay/network/EventLoopThreadPool.h"
#include "relay/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

using namespace relay::network;
using namespace relay::common;

void testQuitFromAnotherThread() {
    EventLoop loop;
    assert(EventLoop::GetEventLoopOfCurrentThread() == &loop);
    assert(loop.IsInLoopThread());

    bool ranInline = false;
    loop.RunInLoop([&]() { ranInline = true; });
    assert(ranInline);

    std::thread t([&loop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        LOG_INFO << "Quitting main loop from thread";
        loop.Quit();
    });

    loop.Loop();
    t.join();
    LOG_INFO << "Quit From Another Thread PASS";
}

void testCrossThreadTasksRunOnLoopThread() {
    EventLoopThread loopThread("task-loop");
    EventLoop* loop = loopThread.StartLoop();
    assert(loop != nullptr);
    assert(!loop->IsInLoopThread());

    std::atomic<int> ran{0};
    std::atomic<bool> wrongThread{false};
    std::atomic<bool> nestedRan{false};

    for (int i = 0; i < 100; ++i) {
        loop->RunInLoop([&, loop]() {
            if (!loop->IsInLoopThread()) wrongThread = true;
            ++ran;
        });
    }
    // A functor queued while draining the queue still runs.
    loop->QueueInLoop([&, loop]() {
        loop->QueueInLoop([&]() { nestedRan = true; });
    });

    for (int i = 0; i < 200 && (ran.load() < 100 || !nestedRan.load()); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(ran.load() == 100);
    assert(nestedRan.load());
    assert(!wrongThread.load());
    LOG_INFO << "Cross Thread Tasks PASS";
}

void testThreadPoolRoundRobin() {
    EventLoop base;
    {
        EventLoopThreadPool empty(&base, "none");
        empty.Start(0);
        assert(empty.size() == 0);
        assert(empty.GetNextLoop() == &base);
    }

    EventLoopThreadPool pool(&base, "workers");
    pool.Start(3);
    assert(pool.size() == 3);
    std::vector<EventLoop*> seen;
    for (int i = 0; i < 6; ++i) seen.push_back(pool.GetNextLoop());
    assert(seen[0] != &base);
    assert(seen[0] != seen[1] && seen[1] != seen[2] && seen[0] != seen[2]);
    assert(seen[0] == seen[3] && seen[1] == seen[4] && seen[2] == seen[5]);
    LOG_INFO << "Thread Pool Round Robin PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    LOG_INFO << "Starting EventLoop test";
    testQuitFromAnotherThread();
    testCrossThreadTasksRunOnLoopThread();
    testThreadPoolRoundRobin();
    return 0;
}
