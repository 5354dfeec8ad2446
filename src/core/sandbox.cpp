#include "safepy/sandbox.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <system_error>

namespace py = pybind11;

namespace safepy {

namespace {

// Formats an exception the way Python prints an uncaught one.
// GIL must be held.
std::string FormatTraceback(const py::error_already_set& e) {
    try {
        py::module_ traceback = py::module_::import("traceback");
        py::object lines = traceback.attr("format_exception")(e.type(), e.value(), e.trace());

        std::string formatted;
        for (auto line : lines) {
            formatted += py::str(line).cast<std::string>();
        }
        return formatted;
    } catch (const py::error_already_set& format_error) {
        // Only the type name: str() of the value runs user code again
        spdlog::error("Failed to format traceback: {}", format_error.what());
        return py::str(e.type().attr("__name__")).cast<std::string>();
    }
}

// Final line of a traceback, e.g. "ZeroDivisionError: division by zero"
std::string LastLine(const std::string& text) {
    size_t end = text.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return "";
    }
    size_t begin = text.rfind('\n', end);
    begin = (begin == std::string::npos) ? 0 : begin + 1;
    return text.substr(begin, end - begin + 1);
}

/**
 * Points print() in the namespace's builtins and sys.stdout at the call's
 * output sink, and puts the process objects back when the run ends, however
 * it ends. Each slot is restored only while it still holds this call's
 * object, so a detached worker finishing late leaves a newer call's
 * binding in place. Constructed and destroyed with the GIL held.
 */
class OutputBinding {
public:
    OutputBinding(Namespace& ns, const std::shared_ptr<OutputSink>& sink)
        : builtins_(ns.Builtins())
        , sys_(py::module_::import("sys"))
    {
        py::module_ io = py::module_::import("_safepy_io");
        sink_object_ = py::cast(sink);
        original_print_ = py::module_::import("builtins").attr("print");

        // A still-running detached worker may own sys.stdout; restore the
        // process stream instead of its sink
        original_stdout_ = sys_.attr("stdout");
        if (py::isinstance(original_stdout_, io.attr("OutputSink"))) {
            original_stdout_ = sys_.attr("__stdout__");
        }

        py::object original_print = original_print_;
        py::object sink_object = sink_object_;
        sandbox_print_ = py::cpp_function(
            [original_print, sink_object](py::args args, py::kwargs kwargs) {
                if (!kwargs.contains("file") || kwargs["file"].is_none()) {
                    kwargs["file"] = sink_object;
                }
                return original_print(*args, **kwargs);
            },
            py::name("print"));

        builtins_["print"] = sandbox_print_;
        sys_.attr("stdout") = sink_object_;
    }

    ~OutputBinding() {
        try {
            if (builtins_.contains("print") && builtins_["print"].is(sandbox_print_)) {
                builtins_["print"] = original_print_;
            }
            if (sys_.attr("stdout").is(sink_object_)) {
                sys_.attr("stdout") = original_stdout_;
            }
        } catch (const py::error_already_set& e) {
            spdlog::error("Failed to restore output streams: {}", e.what());
        }
    }

    OutputBinding(const OutputBinding&) = delete;
    OutputBinding& operator=(const OutputBinding&) = delete;

private:
    py::dict builtins_;
    py::module_ sys_;
    py::object sink_object_;
    py::object sandbox_print_;
    py::object original_print_;
    py::object original_stdout_;
};

// Caps the waits and drops negative grace periods
Sandbox::Config Sanitize(Sandbox::Config config) {
    if (config.timeout > kMaxTimeout) {
        spdlog::warn("Sandbox timeout of {} ms capped to {} s", config.timeout.count(), kMaxTimeout.count());
        config.timeout = kMaxTimeout;
    }
    if (config.interrupt_grace > kMaxTimeout) {
        config.interrupt_grace = kMaxTimeout;
    }
    if (config.interrupt_grace.count() < 0) {
        config.interrupt_grace = std::chrono::milliseconds(0);
    }
    return config;
}

} // anonymous namespace

// Shared between the caller and the worker so a detached worker never
// touches freed memory.
struct Sandbox::RunState {
    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;

    std::shared_ptr<OutputSink> sink = std::make_shared<OutputSink>();
    std::string fault;            // Formatted traceback, empty if none
    std::atomic<unsigned long> python_thread_id{0};
};

const char* GetFaultKindName(FaultKind kind) {
    switch (kind) {
        case FaultKind::None: return "None";
        case FaultKind::PolicyViolation: return "PolicyViolation";
        case FaultKind::RuntimeFault: return "RuntimeFault";
        case FaultKind::Timeout: return "Timeout";
    }
    return "Unknown";
}

nlohmann::json ExecutionResult::ToJson() const {
    return {
        {"status", IsSuccess() ? "success" : "error"},
        {"stdout", output},
        {"stderr", error}
    };
}

ExecutionResult ExecutionResult::Success(const std::string& output) {
    ExecutionResult result;
    result.status = ExecutionStatus::Success;
    result.output = output;
    return result;
}

ExecutionResult ExecutionResult::Failure(FaultKind fault, const std::string& output, const std::string& error) {
    ExecutionResult result;
    result.status = ExecutionStatus::Error;
    result.fault = fault;
    result.output = output;
    result.error = error;
    return result;
}

Sandbox::Sandbox()
    : Sandbox(Config())
{
}

Sandbox::Sandbox(const Config& config)
    : config_(Sanitize(config))
    , policy_(config.policy)
    , namespace_(std::make_shared<Namespace>())
    , cancellation_hook_(std::make_unique<AsyncInterruptHook>())
{
    spdlog::info("Sandbox created");
    spdlog::info("  Timeout: {} ms", config_.timeout.count());
    spdlog::info("  Allowed functions: {}", config_.policy.allowed_functions.size());
    spdlog::info("  Allowed methods: {}", config_.policy.allowed_methods.size());
}

Sandbox::~Sandbox() {
    if (detached_workers_ > 0) {
        spdlog::warn("~Sandbox: {} timed-out worker(s) may still be running", detached_workers_);
    }
}

void Sandbox::SetConfig(const Config& config) {
    config_ = Sanitize(config);
    policy_.SetConfig(config.policy);
    spdlog::info("Sandbox configuration updated");
}

void Sandbox::SetCancellationHook(std::unique_ptr<CancellationHook> hook) {
    cancellation_hook_ = std::move(hook);
}

ExecutionResult Sandbox::Setup(const std::string& code) {
    if (setup_done_) {
        spdlog::warn("Sandbox setup already ran, refusing to run it again");
        return ExecutionResult::Failure(FaultKind::RuntimeFault, "",
            "RuntimeError: sandbox setup has already run");
    }

    spdlog::info("Running sandbox setup ({} bytes, unrestricted)", code.size());
    ExecutionResult result = Run(code, false);
    setup_done_ = true;

    if (result.IsSuccess()) {
        spdlog::info("Sandbox setup complete, restriction enabled");
    } else {
        spdlog::error("Sandbox setup failed ({}), restriction enabled anyway",
            GetFaultKindName(result.fault));
    }
    return result;
}

ExecutionResult Sandbox::Execute(const std::string& code) {
    return Run(code, setup_done_);
}

ExecutionResult Sandbox::ExecuteFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to open file: {}", filepath);
        return ExecutionResult::Failure(FaultKind::RuntimeFault, "",
            "OSError: failed to open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return Execute(buffer.str());
}

ExecutionResult Sandbox::Run(const std::string& code, bool restricted) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    if (!Py_IsInitialized()) {
        spdlog::error("Execute called without an initialized interpreter");
        return ExecutionResult::Failure(FaultKind::RuntimeFault, "",
            "RuntimeError: Python interpreter is not initialized");
    }

    spdlog::debug("Executing code ({} bytes, restricted={})", code.size(), restricted);

    PolicyDecision decision = policy_.Check(code, restricted);
    if (!decision.allowed) {
        ExecutionResult result = ExecutionResult::Failure(FaultKind::PolicyViolation, "",
            "PolicyViolation: " + decision.reason);
        result.violation_reason = decision.reason;
        result.execution_time = elapsed();
        return result;
    }

    CodeBlock block = SplitCodeBlocks(code);
    if (block.Empty()) {
        return ExecutionResult::Success("");
    }

    // The worker needs the GIL; never hold it while waiting for one
    std::optional<py::gil_scoped_release> release;
    if (PyGILState_Check()) {
        release.emplace();
    }

    auto state = std::make_shared<RunState>();
    std::thread worker;
    try {
        worker = std::thread(&Sandbox::RunWorker, state, namespace_, std::move(block));
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start worker thread: {}", e.what());
        return ExecutionResult::Failure(FaultKind::RuntimeFault, "",
            std::string("RuntimeError: failed to start worker thread: ") + e.what());
    }

    ExecutionResult result = WaitForWorker(state, worker);
    result.execution_time = elapsed();
    return result;
}

ExecutionResult Sandbox::WaitForWorker(const std::shared_ptr<RunState>& state, std::thread& worker) {
    bool completed = false;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        completed = state->cv.wait_for(lock, config_.timeout, [&state] { return state->finished; });
    }

    if (completed) {
        worker.join();

        std::string output = state->sink->Contents();
        if (!state->fault.empty()) {
            spdlog::info("Execution raised: {}", LastLine(state->fault));
            return ExecutionResult::Failure(FaultKind::RuntimeFault, output, state->fault);
        }
        return ExecutionResult::Success(output);
    }

    // Whatever the worker printed up to the deadline
    std::string partial_output = state->sink->Contents();
    spdlog::warn("Code execution timed out after {} ms", config_.timeout.count());

    bool stopped = false;
    if (config_.interrupt_on_timeout && cancellation_hook_ &&
        cancellation_hook_->RequestCancel(state->python_thread_id.load())) {
        std::unique_lock<std::mutex> lock(state->mutex);
        stopped = state->cv.wait_for(lock, config_.interrupt_grace, [&state] { return state->finished; });
    } else {
        // The worker may have finished between the deadline and now
        std::lock_guard<std::mutex> lock(state->mutex);
        stopped = state->finished;
    }

    if (stopped) {
        worker.join();
        spdlog::info("Timed-out worker stopped after interrupt");
    } else {
        worker.detach();
        ++detached_workers_;
        spdlog::error("Timed-out worker did not stop and was detached; it may keep consuming resources");
    }

    return ExecutionResult::Failure(FaultKind::Timeout, partial_output, kTimeoutMessage);
}

void Sandbox::RunWorker(std::shared_ptr<RunState> state,
                        std::shared_ptr<Namespace> ns,
                        CodeBlock block) {
    {
        py::gil_scoped_acquire acquire;
        state->python_thread_id.store(PyThread_get_thread_ident());

        try {
            OutputBinding binding(*ns, state->sink);

            py::module_ builtins = py::module_::import("builtins");
            py::object compile = builtins.attr("compile");
            py::object exec = builtins.attr("exec");
            py::object eval = builtins.attr("eval");
            py::dict& globals = ns->Globals();

            for (const auto& group : block.body) {
                exec(compile(group, "<sandbox>", "exec"), globals);
            }

            if (!block.tail.empty()) {
                // Compiling never touches the namespace; only the chosen form runs
                py::object expression;
                try {
                    expression = compile(block.tail, "<sandbox>", "eval");
                } catch (const py::error_already_set& e) {
                    if (!e.matches(PyExc_SyntaxError)) {
                        throw;
                    }
                }

                if (expression) {
                    py::object value = eval(expression, globals);
                    if (!value.is_none()) {
                        state->sink->Write(py::str(value).cast<std::string>());
                    }
                } else {
                    exec(compile(block.tail, "<sandbox>", "exec"), globals);
                }
            }
        } catch (const py::error_already_set& e) {
            state->fault = FormatTraceback(e);
        } catch (const std::exception& e) {
            state->fault = std::string("RuntimeError: ") + e.what();
        }

        ns->BumpVersion();
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->finished = true;
    }
    state->cv.notify_all();
}

} // namespace safepy
