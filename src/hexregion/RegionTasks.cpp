#include "hexregion/RegionTasks.hpp"

#include "hexregion/RegionSerializer.hpp"

#include <exception>
#include <utility>

namespace hexregion {

namespace {

static std::future<OpResult> Ready(OpResult r)
{
  std::promise<OpResult> p;
  p.set_value(std::move(r));
  return p.get_future();
}

} // namespace

RegionTaskRunner::~RegionTaskRunner()
{
  wait();
}

std::future<OpResult> RegionTaskRunner::launch(OperationContext op, Work work)
{
  std::scoped_lock<std::mutex> lock(m_mutex);
  if (m_busy.load()) {
    return Ready(OpResult::Failure(OpStatus::Busy, "Another region operation is in progress"));
  }

  // The previous worker has already cleared m_busy, so this join is short.
  if (m_worker.joinable()) m_worker.join();

  m_busy.store(true);
  m_current = op.cancel;

  std::promise<OpResult> promise;
  std::future<OpResult> future = promise.get_future();
  m_worker = std::thread([this, op = std::move(op), work = std::move(work), promise = std::move(promise)]() mutable {
    try {
      OpResult r = work(op);
      // Clear before publishing so a caller woken by the future can start the next task.
      m_busy.store(false);
      promise.set_value(std::move(r));
    } catch (...) {
      m_busy.store(false);
      promise.set_exception(std::current_exception());
    }
  });
  return future;
}

std::future<OpResult> RegionTaskRunner::generate(const RegionParams& params, const GenerationConfig& cfg,
                                                 OperationContext op, RegionData& target)
{
  RegionData* out = &target;
  return launch(std::move(op), [params, cfg, out](const OperationContext& ctx) {
    return GenerateRegion(params, cfg, ctx, *out);
  });
}

std::future<OpResult> RegionTaskRunner::save(const RegionData& region, const std::filesystem::path& path,
                                             OperationContext op)
{
  const RegionData* in = &region;
  return launch(std::move(op), [in, path](const OperationContext& ctx) { return SaveRegion(*in, path, ctx); });
}

std::future<OpResult> RegionTaskRunner::load(const std::filesystem::path& path, RegionData& target,
                                             OperationContext op)
{
  RegionData* out = &target;
  return launch(std::move(op), [path, out](const OperationContext& ctx) { return LoadRegion(path, *out, ctx); });
}

void RegionTaskRunner::cancel()
{
  std::scoped_lock<std::mutex> lock(m_mutex);
  if (m_busy.load()) m_current.cancel();
}

void RegionTaskRunner::wait()
{
  std::scoped_lock<std::mutex> lock(m_mutex);
  if (m_worker.joinable()) m_worker.join();
}

} // namespace hexregion
