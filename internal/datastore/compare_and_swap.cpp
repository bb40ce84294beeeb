#include "internal/datastore/compare_and_swap.hpp"

#include <google/protobuf/util/message_differencer.h>

namespace imc::datastore {

namespace {

SwapResult FromStoreResult(const Result& result) {
  if (result) return {SwapOutcome::kApplied, {}};

  switch (result.code) {
    case ErrorCode::Conflict:
      return {SwapOutcome::kConflict, result.message};
    case ErrorCode::NotFound:
      return {SwapOutcome::kNotFound, result.message};
    default:
      return {SwapOutcome::kFailed, std::string(ToString(result.code)) + ": " + result.message};
  }
}

} // namespace

const char* ToString(SwapOutcome outcome) {
  switch (outcome) {
    case SwapOutcome::kApplied:
      return "applied";
    case SwapOutcome::kUnchanged:
      return "unchanged";
    case SwapOutcome::kConflict:
      return "conflict";
    case SwapOutcome::kNotFound:
      return "not found";
    case SwapOutcome::kAbandoned:
      return "abandoned";
    case SwapOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

SwapResult CompareAndSwap(DataStore& store, const imc::v1::InstanceManager& original, imc::v1::InstanceManager& modified) {
  if (google::protobuf::util::MessageDifferencer::Equals(original, modified)) {
    return {SwapOutcome::kUnchanged, {}};
  }
  return FromStoreResult(store.UpdateInstanceManager(modified));
}

SwapResult UpdateInstanceManagerWithRetry(DataStore& store, const std::string& name, const InstanceManagerMutation& mutate,
                                          const RetryWait& wait_before_retry) {
  while (true) {
    auto current = store.GetInstanceManager(name);
    if (!current) {
      return {SwapOutcome::kNotFound, "instance manager " + name};
    }

    auto modified = *current;
    if (!mutate(modified)) {
      return {SwapOutcome::kAbandoned, {}};
    }

    auto result = CompareAndSwap(store, *current, modified);
    if (result.outcome != SwapOutcome::kConflict) {
      return result;
    }

    if (!wait_before_retry()) {
      return {SwapOutcome::kAbandoned, "shutting down"};
    }
  }
}

} // namespace imc::datastore
