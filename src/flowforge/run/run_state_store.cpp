#include "flowforge/run/run_state_store.hpp"

#include "flowforge/util/log.hpp"

#include <algorithm>

namespace flowforge {

namespace {

[[nodiscard]] auto is_settled(const RunState &state) -> bool {
  return is_terminal(state.status()) && state.running_count() == 0;
}

} // namespace

RunStateStore::RunStateStore(std::size_t partitions) {
  partitions = std::max<std::size_t>(1, partitions);
  partitions_.reserve(partitions);
  for (std::size_t i = 0; i < partitions; ++i) {
    partitions_.push_back(std::make_unique<Partition>());
  }
}

RunStateStore::~RunStateStore() = default;

auto RunStateStore::partition_for(const RunId &run_id) const -> Partition & {
  return *partitions_[std::hash<RunId>{}(run_id) % partitions_.size()];
}

auto RunStateStore::find_cell(const RunId &run_id) const
    -> std::shared_ptr<Cell> {
  auto &partition = partition_for(run_id);
  std::scoped_lock lock(partition.mu);
  auto it = partition.runs.find(run_id);
  return it == partition.runs.end() ? nullptr : it->second;
}

auto RunStateStore::insert(RunState state) -> Result<void> {
  auto run_id = state.id();
  auto &partition = partition_for(run_id);
  auto cell = std::make_shared<Cell>(std::move(state));
  std::scoped_lock lock(partition.mu);
  auto [_, inserted] = partition.runs.try_emplace(run_id, std::move(cell));
  if (!inserted) {
    return fail(Error::AlreadyExists);
  }
  return ok();
}

auto RunStateStore::begin_attempt(const RunId &run_id, NodeIndex task)
    -> Result<std::uint32_t> {
  return modify(run_id,
                [&](RunState &state) { return state.begin_attempt(task); });
}

auto RunStateStore::confirm_dispatch(const RunId &run_id, NodeIndex task,
                                     std::uint32_t attempt, TimePoint now)
    -> Result<void> {
  return modify(run_id, [&](RunState &state) {
    return state.confirm_dispatch(task, attempt, now);
  });
}

auto RunStateStore::request_cancel(const RunId &run_id, TimePoint now)
    -> Result<bool> {
  return modify(run_id, [&](RunState &state) -> Result<bool> {
    return ok(state.request_cancel(now));
  });
}

auto RunStateStore::snapshot(const RunId &run_id) const
    -> Result<RunSnapshot> {
  auto cell = find_cell(run_id);
  if (!cell) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(cell->mu);
  return ok(cell->state.snapshot());
}

auto RunStateStore::status(const RunId &run_id) const -> Result<RunStatus> {
  auto cell = find_cell(run_id);
  if (!cell) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(cell->mu);
  return ok(cell->state.status());
}

auto RunStateStore::contains(const RunId &run_id) const -> bool {
  return find_cell(run_id) != nullptr;
}

auto RunStateStore::list() const -> std::vector<RunId> {
  std::vector<RunId> out;
  for (const auto &partition : partitions_) {
    std::scoped_lock lock(partition->mu);
    for (const auto &[id, _] : partition->runs) {
      out.push_back(id);
    }
  }
  std::ranges::sort(out);
  return out;
}

auto RunStateStore::size() const -> std::size_t {
  std::size_t total = 0;
  for (const auto &partition : partitions_) {
    std::scoped_lock lock(partition->mu);
    total += partition->runs.size();
  }
  return total;
}

auto RunStateStore::purge(const RunId &run_id) -> Result<void> {
  auto &partition = partition_for(run_id);
  std::scoped_lock lock(partition.mu);
  auto it = partition.runs.find(run_id);
  if (it == partition.runs.end()) {
    return fail(Error::NotFound);
  }
  {
    std::scoped_lock cell_lock(it->second->mu);
    if (!is_settled(it->second->state)) {
      return fail(Error::InvalidState);
    }
  }
  partition.runs.erase(it);
  log::debug("Purged run {}", run_id);
  return ok();
}

auto RunStateStore::purge_finished_before(TimePoint cutoff) -> std::size_t {
  std::size_t purged = 0;
  for (auto &partition : partitions_) {
    std::scoped_lock lock(partition->mu);
    std::vector<RunId> expired;
    for (const auto &[id, cell] : partition->runs) {
      std::scoped_lock cell_lock(cell->mu);
      const auto &run = cell->state.run();
      if (is_settled(cell->state) && run.finished_at != TimePoint{} &&
          run.finished_at < cutoff) {
        expired.push_back(id);
      }
    }
    for (const auto &id : expired) {
      partition->runs.erase(id);
    }
    purged += expired.size();
  }
  if (purged > 0) {
    log::info("Retention purge removed {} runs", purged);
  }
  return purged;
}

} // namespace flowforge
