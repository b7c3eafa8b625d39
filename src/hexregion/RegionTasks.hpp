#pragma once

#include "hexregion/GenerationConfig.hpp"
#include "hexregion/Operation.hpp"
#include "hexregion/Region.hpp"
#include "hexregion/RegionGenerator.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

namespace hexregion {

// Runs one generate/save/load at a time on a worker thread.
//
// The target RegionData belongs to the running operation until its future is
// ready; callers must not touch it before then. A request made while another
// is in flight resolves immediately with OpStatus::Busy.
class RegionTaskRunner {
public:
  RegionTaskRunner() = default;
  ~RegionTaskRunner();

  RegionTaskRunner(const RegionTaskRunner&) = delete;
  RegionTaskRunner& operator=(const RegionTaskRunner&) = delete;

  std::future<OpResult> generate(const RegionParams& params, const GenerationConfig& cfg, OperationContext op,
                                 RegionData& target);
  std::future<OpResult> save(const RegionData& region, const std::filesystem::path& path, OperationContext op);
  std::future<OpResult> load(const std::filesystem::path& path, RegionData& target, OperationContext op);

  bool busy() const { return m_busy.load(); }

  // Requests cancellation of the in-flight operation, if any.
  void cancel();

  // Blocks until the worker (if any) has finished.
  void wait();

private:
  using Work = std::function<OpResult(const OperationContext&)>;

  std::future<OpResult> launch(OperationContext op, Work work);

  std::mutex m_mutex;
  std::atomic<bool> m_busy{false};
  CancellationToken m_current;
  std::thread m_worker;
};

} // namespace hexregion
