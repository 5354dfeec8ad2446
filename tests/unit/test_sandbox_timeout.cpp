#include <catch2/catch_test_macros.hpp>
#include <safepy/sandbox.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace safepy;

namespace {

// Records requests without delivering them
class RecordingHook : public CancellationHook {
public:
    explicit RecordingHook(int& calls) : calls_(calls) {}

    bool RequestCancel(unsigned long python_thread_id) override {
        ++calls_;
        last_thread_id = python_thread_id;
        return false;
    }

    unsigned long last_thread_id = 0;

private:
    int& calls_;
};

Sandbox::Config ShortTimeout() {
    Sandbox::Config config;
    config.timeout = std::chrono::milliseconds(1000);
    config.interrupt_grace = std::chrono::milliseconds(2000);
    return config;
}

long long ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

TEST_CASE("Quick code finishes inside the budget", "[sandbox][timeout]") {
    Sandbox sandbox(ShortTimeout());

    ExecutionResult result = sandbox.Execute("x = 1 + 1\nprint(f'Result: {x}')");
    REQUIRE(result.IsSuccess());
    REQUIRE(result.output == "Result: 2\n");
    REQUIRE(result.fault == FaultKind::None);
}

TEST_CASE("Infinite loop times out and is interrupted", "[sandbox][timeout]") {
    Sandbox sandbox(ShortTimeout());

    auto start = std::chrono::steady_clock::now();
    ExecutionResult result = sandbox.Execute(
        "print('Starting infinite loop...')\n"
        "i = 0\n"
        "while True:\n"
        "    i += 1\n");
    long long elapsed = ElapsedMs(start);

    REQUIRE_FALSE(result.IsSuccess());
    REQUIRE(result.fault == FaultKind::Timeout);
    REQUIRE(result.error == kTimeoutMessage);
    REQUIRE(result.error == "Code execution timed out");
    REQUIRE(result.output == "Starting infinite loop...\n");
    REQUIRE(elapsed >= 900);
    REQUIRE(elapsed < 3500);

    // The interrupt stopped the worker, so it was joined rather than detached
    REQUIRE(sandbox.DetachedWorkerCount() == 0);

    SECTION("the sandbox stays usable") {
        ExecutionResult next = sandbox.Execute("i > 0");
        REQUIRE(next.IsSuccess());
        REQUIRE(next.output == "True");
    }
}

TEST_CASE("Heavy computation times out", "[sandbox][timeout]") {
    Sandbox sandbox(ShortTimeout());

    auto start = std::chrono::steady_clock::now();
    ExecutionResult result = sandbox.Execute(
        "result = 0\n"
        "for i in range(10**12):\n"
        "    result += i\n"
        "result\n");
    long long elapsed = ElapsedMs(start);

    REQUIRE(result.fault == FaultKind::Timeout);
    REQUIRE(result.output.empty());
    REQUIRE(elapsed < 3500);
    REQUIRE(sandbox.DetachedWorkerCount() == 0);
}

TEST_CASE("Interrupt inside the tail expression", "[sandbox][timeout]") {
    Sandbox sandbox(ShortTimeout());

    SECTION("while evaluating the tail") {
        ExecutionResult result = sandbox.Execute("total = 7\nsum(i for i in range(10**12))");
        REQUIRE(result.fault == FaultKind::Timeout);
        REQUIRE(sandbox.DetachedWorkerCount() == 0);
    }

    SECTION("while converting the tail value to text") {
        ExecutionResult result = sandbox.Execute(
            "total = 7\n"
            "class Slow:\n"
            "    def __str__(self):\n"
            "        while True:\n"
            "            pass\n"
            "Slow()\n");
        REQUIRE(result.fault == FaultKind::Timeout);
        REQUIRE(sandbox.DetachedWorkerCount() == 0);
    }

    // Output streams and namespace survive the interrupt
    ExecutionResult next = sandbox.Execute("print('after')\ntotal");
    REQUIRE(next.IsSuccess());
    REQUIRE(next.output == "after\n7");
}

TEST_CASE("A late detached worker leaves the current capture alone", "[sandbox][timeout]") {
    Sandbox::Config config;
    config.timeout = std::chrono::milliseconds(100);
    Sandbox sandbox(config);

    int calls = 0;
    sandbox.SetCancellationHook(std::make_unique<RecordingHook>(calls));

    ExecutionResult first = sandbox.Execute(
        "import time\n"
        "first_deadline = time.monotonic() + 0.5\n"
        "while time.monotonic() < first_deadline:\n"
        "    pass\n");
    REQUIRE(first.fault == FaultKind::Timeout);
    REQUIRE(sandbox.DetachedWorkerCount() == 1);

    // The detached worker finishes while this run is still going
    Sandbox::Config relaxed;
    relaxed.timeout = std::chrono::milliseconds(5000);
    sandbox.SetConfig(relaxed);
    ExecutionResult second = sandbox.Execute(
        "import sys\n"
        "import time\n"
        "second_deadline = time.monotonic() + 0.8\n"
        "while time.monotonic() < second_deadline:\n"
        "    pass\n"
        "print('late print')\n"
        "n = sys.stdout.write('late write')\n");
    REQUIRE(second.IsSuccess());
    REQUIRE(second.output == "late print\nlate write");
}

TEST_CASE("Workers that ignore cancellation are detached", "[sandbox][timeout]") {
    Sandbox::Config config;
    config.timeout = std::chrono::milliseconds(100);
    Sandbox sandbox(config);

    int calls = 0;
    sandbox.SetCancellationHook(std::make_unique<RecordingHook>(calls));

    // Bounded so the detached worker finishes on its own
    ExecutionResult result = sandbox.Execute(
        "import time\n"
        "deadline = time.monotonic() + 0.5\n"
        "while time.monotonic() < deadline:\n"
        "    pass\n");

    REQUIRE(result.fault == FaultKind::Timeout);
    REQUIRE(result.error == kTimeoutMessage);
    REQUIRE(calls == 1);
    REQUIRE(sandbox.DetachedWorkerCount() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
}

TEST_CASE("Interrupt can be turned off", "[sandbox][timeout]") {
    Sandbox::Config config;
    config.timeout = std::chrono::milliseconds(100);
    config.interrupt_on_timeout = false;
    Sandbox sandbox(config);

    int calls = 0;
    sandbox.SetCancellationHook(std::make_unique<RecordingHook>(calls));

    ExecutionResult result = sandbox.Execute(
        "import time\n"
        "deadline = time.monotonic() + 0.5\n"
        "while time.monotonic() < deadline:\n"
        "    pass\n");

    REQUIRE(result.fault == FaultKind::Timeout);
    REQUIRE(calls == 0);
    REQUIRE(sandbox.DetachedWorkerCount() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
}

TEST_CASE("Timeout applies to restricted execution", "[sandbox][timeout][policy]") {
    Sandbox sandbox(ShortTimeout());
    REQUIRE(sandbox.Setup("counter = 0").IsSuccess());

    ExecutionResult result = sandbox.Execute("while True:\n    counter += 1\n");
    REQUIRE(result.fault == FaultKind::Timeout);
    REQUIRE(sandbox.DetachedWorkerCount() == 0);
}
