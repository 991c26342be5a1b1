#ifndef NOTIFY_HPP
#define NOTIFY_HPP

// =============================================================================
// notify - Change notification without polling
// =============================================================================
//
// - var: a value plus a one-shot signal that fires when that value is
//   replaced; get() returns both as one consistent snapshot
// - aggregation: wait for a change on any of a runtime-sized, heterogeneous
//   set of vars, then take the changed ones out one at a time
// - signal / select: the one-shot signal and a dynamic wait-any over them,
//   blocking or co_await-able
// - watch helpers: wait_for_change, wait_for_value, do_when_changed, ...
//
// Coroutines parked on signals are resumed on the task_scheduler workers.
//
// =============================================================================

// Foundation headers
#include "notify/concepts.hpp"
#include "notify/policies.hpp"
#include "notify/crtp_base.hpp"
#include "notify/continuation_handoff.hpp"

// Primitive headers
#include "notify/signal.hpp"
#include "notify/var.hpp"
#include "notify/aggregation.hpp"

// Runtime headers
#include "cancellation.hpp"
#include "select.hpp"
#include "task_scheduler.hpp"
#include "detached_task.hpp"
#include "watch.hpp"

#endif // NOTIFY_HPP
