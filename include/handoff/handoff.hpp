// ============================================================================
// handoff/handoff.hpp - Main Include Header
// ============================================================================
//
// Pulls in the whole library except the stdexec bridge, which needs
// stdexec on the include path:
//
//   #include <handoff/execution/sender.hpp>
//
// USAGE:
// ------
//   #include <handoff/handoff.hpp>
//   using namespace handoff;
//
// ============================================================================

#pragma once

// Core
#include "handoff/core/cancellation.hpp"
#include "handoff/core/channel.hpp"
#include "handoff/core/check.hpp"
#include "handoff/core/error.hpp"
#include "handoff/core/result.hpp"

// Threads
#include "handoff/thread/scoped_thread.hpp"

// Interop
#include "handoff/execution/stop_token_adapter.hpp"
