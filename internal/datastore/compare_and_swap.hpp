#pragma once

#include <functional>
#include <string>

#include "imc/v1.hpp"
#include "internal/datastore/api/datastore.hpp"

namespace imc::datastore {

enum class SwapOutcome {
  kApplied,
  kUnchanged,
  kConflict,
  kNotFound,
  kAbandoned,
  kFailed,
};

struct SwapResult {
  SwapOutcome outcome = SwapOutcome::kUnchanged;
  std::string message;

  bool ok() const {
    return outcome == SwapOutcome::kApplied || outcome == SwapOutcome::kUnchanged;
  }
};

const char* ToString(SwapOutcome outcome);

/*
  Persists `modified` if it differs from `original` (the value it was copied
  from). A version conflict is returned as kConflict, never thrown.
*/
SwapResult CompareAndSwap(DataStore& store, const imc::v1::InstanceManager& original, imc::v1::InstanceManager& modified);

// Returns false to abandon the update without writing.
using InstanceManagerMutation = std::function<bool(imc::v1::InstanceManager&)>;

// Sleeps before the next attempt. Returns false when the caller is shutting down.
using RetryWait = std::function<bool()>;

/*
  Read-mutate-write loop for writers that do not own a reconciliation: re-reads
  the resource on every conflict and stops at the first non-conflict outcome.
*/
SwapResult UpdateInstanceManagerWithRetry(DataStore& store, const std::string& name, const InstanceManagerMutation& mutate,
                                          const RetryWait& wait_before_retry);

} // namespace imc::datastore
