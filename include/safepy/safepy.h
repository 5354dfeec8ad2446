#pragma once

// Main header file for safepy
// Include this to get access to the whole sandbox

#define SAFEPY_VERSION_MAJOR 0
#define SAFEPY_VERSION_MINOR 1
#define SAFEPY_VERSION_PATCH 0

// API export macros
#include "api_export.h"

// Embedded interpreter lifetime
#include "interpreter.h"

// Static analysis (no dependencies on the engine)
#include "syntax_tree.h"
#include "policy_checker.h"
#include "block_splitter.h"

// Execution
#include "namespace.h"
#include "cancellation.h"
#include "sandbox.h"

// Tool description, configuration and logging
#include "tool_schema.h"
#include "config_manager.h"
#include "logging.h"

namespace safepy {

// Start the embedded interpreter for the process (idempotent)
SAFEPY_API bool Initialize();

// Finalize the interpreter if Initialize() started it
SAFEPY_API void Shutdown();

// Get version string
SAFEPY_API const char* GetVersionString();

} // namespace safepy
