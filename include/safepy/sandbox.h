#pragma once

#include "api_export.h"
#include "block_splitter.h"
#include "cancellation.h"
#include "namespace.h"
#include "output_sink.h"
#include "policy_checker.h"
#include "tool_schema.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace safepy {

enum class ExecutionStatus {
    Success,
    Error
};

// Why an execution ended in ExecutionStatus::Error
enum class FaultKind {
    None,
    PolicyViolation,  // Rejected before running, nothing executed
    RuntimeFault,     // Raised while running, partial output kept
    Timeout           // Time budget exceeded, worker may still be running
};

SAFEPY_API const char* GetFaultKindName(FaultKind kind);

// stderr text of every timed-out execution
constexpr const char* kTimeoutMessage = "Code execution timed out";

// Upper bound for Config::timeout and Config::interrupt_grace. Keeps the
// steady_clock deadline inside its representable range.
constexpr std::chrono::seconds kMaxTimeout{1000000000};

struct SAFEPY_API ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Success;
    std::string output;   // Captured stdout (partial on error)
    std::string error;    // Formatted fault, empty on success
    FaultKind fault = FaultKind::None;
    std::string violation_reason;
    std::chrono::milliseconds execution_time{0};

    bool IsSuccess() const { return status == ExecutionStatus::Success; }

    // {"status": "success"|"error", "stdout": ..., "stderr": ...}
    nlohmann::json ToJson() const;

    static ExecutionResult Success(const std::string& output);
    static ExecutionResult Failure(FaultKind fault, const std::string& output, const std::string& error);
};

/**
 * Sandbox - restricted, stateful code execution
 *
 * Every Execute() call:
 *   1. vets the source with the PolicyChecker (restricted once Setup() ran)
 *   2. splits it into top-level statement groups
 *   3. runs the groups on a fresh worker thread against the persistent
 *      Namespace, evaluating the last group as an expression when it is one
 *   4. waits at most Config::timeout for the worker
 *
 * Faults never escape as exceptions; they come back as ExecutionResult.
 * A worker that overruns the budget is asked to stop through the
 * CancellationHook and detached if it does not, so it may keep running.
 *
 * sys.stdout is process-wide: while a run is in progress, writes to it from
 * any thread land in that run's output.
 *
 * Precondition: one caller at a time per Sandbox.
 */
class SAFEPY_API Sandbox {
public:
    struct Config {
        std::chrono::milliseconds timeout{std::chrono::seconds(1200)};

        // Ask a timed-out worker to stop and wait this long before detaching it
        bool interrupt_on_timeout{true};
        std::chrono::milliseconds interrupt_grace{2000};

        PolicyConfig policy;
    };

    Sandbox();
    explicit Sandbox(const Config& config);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Runs unrestricted once to seed the namespace, then latches restriction on.
    ExecutionResult Setup(const std::string& code);

    ExecutionResult Execute(const std::string& code);
    ExecutionResult ExecuteFile(const std::string& filepath);

    bool IsRestricted() const { return setup_done_; }

    const Namespace& GetNamespace() const { return *namespace_; }
    const PolicyChecker& GetPolicyChecker() const { return policy_; }
    ToolSchema GetToolSchema() const { return ToolSchema::ForSandbox(); }

    void SetConfig(const Config& config);
    const Config& GetConfig() const { return config_; }

    // Replaces the default AsyncInterruptHook; nullptr disables cancellation
    void SetCancellationHook(std::unique_ptr<CancellationHook> hook);

    // Number of timed-out workers that were detached while still running
    size_t DetachedWorkerCount() const { return detached_workers_; }

private:
    struct RunState;

    ExecutionResult Run(const std::string& code, bool restricted);
    ExecutionResult WaitForWorker(const std::shared_ptr<RunState>& state, std::thread& worker);

    static void RunWorker(std::shared_ptr<RunState> state,
                          std::shared_ptr<Namespace> ns,
                          CodeBlock block);

    Config config_;
    PolicyChecker policy_;
    std::shared_ptr<Namespace> namespace_;
    std::unique_ptr<CancellationHook> cancellation_hook_;
    bool setup_done_ = false;
    size_t detached_workers_ = 0;
};

} // namespace safepy
