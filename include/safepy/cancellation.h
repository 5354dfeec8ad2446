#pragma once

#include "api_export.h"

namespace safepy {

// Invoked by the Sandbox when a worker overruns its time budget.
// Implementations must not block; the worker may or may not stop.
class SAFEPY_API CancellationHook {
public:
    virtual ~CancellationHook() = default;

    // python_thread_id is the worker's PyThread_get_thread_ident() value.
    // Returns true if a cancellation request was delivered.
    virtual bool RequestCancel(unsigned long python_thread_id) = 0;
};

// Leaves the worker alone (fire-and-forget)
class SAFEPY_API NoCancellation : public CancellationHook {
public:
    bool RequestCancel(unsigned long) override { return false; }
};

// Schedules a KeyboardInterrupt in the worker thread. Delivered at the next
// bytecode boundary; a worker blocked inside a C call is not interrupted.
class SAFEPY_API AsyncInterruptHook : public CancellationHook {
public:
    bool RequestCancel(unsigned long python_thread_id) override;
};

} // namespace safepy
