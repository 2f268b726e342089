#pragma once

// CallGuard: guarded remote model calls
//
// Sliding-window admission, per-attempt timeouts with classified retries,
// nested spending caps, and typed results checked against a Shape.

// Core
#include "callguard/types.hpp"
#include "callguard/exceptions.hpp"
#include "callguard/config.hpp"
#include "callguard/cancellation.hpp"
#include "callguard/monitor.hpp"
#include "callguard/provider.hpp"

// Components
#include "callguard/budget_ledger.hpp"
#include "callguard/admission_limiter.hpp"
#include "callguard/call_envelope.hpp"
#include "callguard/shape.hpp"
#include "callguard/typed_invocation.hpp"

// Caller surface
#include "callguard/client.hpp"
