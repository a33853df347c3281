#include <catch2/catch_test_macros.hpp>
#include "background.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

using namespace finly;

TEST_CASE("BackgroundTasks: spawn runs the job", "[background]") {
    BackgroundTasks tasks;
    std::atomic<int> ran{0};
    tasks.spawn("one", [&] { ran++; });
    tasks.wait_idle();
    REQUIRE(ran.load() == 1);
    REQUIRE(tasks.running() == 0);
}

TEST_CASE("BackgroundTasks: spawn does not wait for the job", "[background]") {
    BackgroundTasks tasks;
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<bool> finished{false};

    tasks.spawn("blocked", [&] {
        opened.wait();
        finished = true;
    });
    REQUIRE(tasks.running() == 1);
    REQUIRE_FALSE(finished.load());

    gate.set_value();
    tasks.wait_idle();
    REQUIRE(finished.load());
}

TEST_CASE("BackgroundTasks: many jobs run concurrently", "[background]") {
    BackgroundTasks tasks;
    std::atomic<int> ran{0};
    for (int i = 0; i < 20; i++) {
        tasks.spawn("job " + std::to_string(i), [&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ran++;
        });
    }
    tasks.wait_idle();
    REQUIRE(ran.load() == 20);
}

TEST_CASE("BackgroundTasks: throwing job is contained", "[background]") {
    BackgroundTasks tasks;
    std::atomic<int> ran{0};
    tasks.spawn("bad", [] { throw std::runtime_error("boom"); });
    tasks.wait_idle();

    tasks.spawn("good", [&] { ran++; });
    tasks.wait_idle();
    REQUIRE(ran.load() == 1);
    REQUIRE(tasks.running() == 0);
}

TEST_CASE("BackgroundTasks: non-standard exception is contained", "[background]") {
    BackgroundTasks tasks;
    tasks.spawn("odd", [] { throw 42; });
    tasks.wait_idle();
    REQUIRE(tasks.running() == 0);
}

TEST_CASE("BackgroundTasks: finished workers are reaped on next spawn", "[background]") {
    BackgroundTasks tasks;
    std::atomic<int> ran{0};
    for (int round = 0; round < 5; round++) {
        tasks.spawn("round", [&] { ran++; });
        tasks.wait_idle();
    }
    REQUIRE(ran.load() == 5);
}

TEST_CASE("BackgroundTasks: destructor waits for running jobs", "[background]") {
    std::atomic<bool> finished{false};
    {
        BackgroundTasks tasks;
        tasks.spawn("slow", [&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            finished = true;
        });
    }
    REQUIRE(finished.load());
}

TEST_CASE("BackgroundTasks: wait_idle with nothing spawned returns", "[background]") {
    BackgroundTasks tasks;
    tasks.wait_idle();
    REQUIRE(tasks.running() == 0);
}
