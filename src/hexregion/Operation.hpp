#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace hexregion {

class RegionData;

// Cooperative cancellation flag. Copies share the same flag, so the caller keeps
// one copy and hands another to the running operation.
class CancellationToken {
public:
  CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { m_flag->store(true, std::memory_order_relaxed); }
  void reset() { m_flag->store(false, std::memory_order_relaxed); }
  bool cancelled() const { return m_flag->load(std::memory_order_relaxed); }

private:
  std::shared_ptr<std::atomic<bool>> m_flag;
};

enum class OpStatus : std::uint8_t {
  Ok = 0,
  Cancelled,
  ValidationFailed, // corrupt or unsupported data
  IoFailed,         // file missing, permission denied, short write...
  Busy,             // another operation is already running for this region
};

const char* ToString(OpStatus s);

struct OpResult {
  OpStatus status = OpStatus::Ok;
  std::string message;

  bool ok() const { return status == OpStatus::Ok; }
  bool cancelled() const { return status == OpStatus::Cancelled; }

  static OpResult Success() { return OpResult{}; }
  static OpResult Failure(OpStatus s, std::string msg) { return OpResult{s, std::move(msg)}; }
  static OpResult Cancel() { return OpResult{OpStatus::Cancelled, "Cancelled"}; }
};

struct OperationProgress {
  std::string stage;
  float fraction = 0.0f; // 0..1
};

using OperationProgressFn = std::function<void(const OperationProgress&)>;

// Cancellation + progress channel threaded through every long-running call.
struct OperationContext {
  CancellationToken cancel;
  OperationProgressFn progress;

  bool cancelled() const { return cancel.cancelled(); }

  void report(const char* stage, float fraction) const
  {
    if (!progress) return;
    OperationProgress p;
    p.stage = stage ? stage : "";
    p.fraction = fraction;
    progress(p);
  }
};

// Everything a generation pass needs: the grid it mutates, the global seed, and
// the cancellation/progress channel. Passes never reach for global state.
struct GenerationContext {
  RegionData* region = nullptr;
  std::int32_t seed = 0;
  OperationContext op;

  bool cancelled() const { return op.cancelled(); }
};

} // namespace hexregion
