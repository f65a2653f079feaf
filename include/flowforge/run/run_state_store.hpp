#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/run/run_state.hpp"
#include "flowforge/run/run_types.hpp"

#include <ankerl/unordered_dense.h>

#include <concepts>
#include <cstddef>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>

namespace flowforge {

// Partitioned registry of run state. A partition lock covers only the
// id -> cell lookup; each run has its own cell mutex, so writers to different
// runs never contend and writers to the same run are serialized.
class RunStateStore {
public:
  static constexpr std::size_t kDefaultPartitions = 16;

  explicit RunStateStore(std::size_t partitions = kDefaultPartitions);
  ~RunStateStore();

  RunStateStore(const RunStateStore &) = delete;
  auto operator=(const RunStateStore &) -> RunStateStore & = delete;

  [[nodiscard]] auto insert(RunState state) -> Result<void>;

  /// Runs `fn` with exclusive access to the run. `fn` returns a Result.
  template <typename F>
    requires std::invocable<F, RunState &>
  [[nodiscard]] auto modify(const RunId &run_id, F &&fn)
      -> std::invoke_result_t<F, RunState &> {
    auto cell = find_cell(run_id);
    if (!cell) {
      return fail(Error::NotFound);
    }
    std::scoped_lock lock(cell->mu);
    return std::forward<F>(fn)(cell->state);
  }

  /// Creates the attempt record for a ready task. Fails with Conflict when
  /// the run was cancelled after eligibility was computed; nothing is
  /// recorded in that case.
  [[nodiscard]] auto begin_attempt(const RunId &run_id, NodeIndex task)
      -> Result<std::uint32_t>;
  /// Second half of dispatch, taken after the worker slot is acquired. Fails
  /// with Conflict, and discards the claimed attempt, if the run was
  /// cancelled while the attempt waited.
  [[nodiscard]] auto confirm_dispatch(const RunId &run_id, NodeIndex task,
                                      std::uint32_t attempt, TimePoint now)
      -> Result<void>;

  /// Returns true if this call moved the run to Cancelled.
  [[nodiscard]] auto request_cancel(const RunId &run_id, TimePoint now)
      -> Result<bool>;

  [[nodiscard]] auto snapshot(const RunId &run_id) const
      -> Result<RunSnapshot>;
  [[nodiscard]] auto status(const RunId &run_id) const -> Result<RunStatus>;
  [[nodiscard]] auto contains(const RunId &run_id) const -> bool;
  [[nodiscard]] auto list() const -> std::vector<RunId>;
  [[nodiscard]] auto size() const -> std::size_t;

  /// Removes a terminal run with no attempt still in flight.
  [[nodiscard]] auto purge(const RunId &run_id) -> Result<void>;
  /// Retention sweep: purges every settled run that finished before `cutoff`.
  [[nodiscard]] auto purge_finished_before(TimePoint cutoff) -> std::size_t;

private:
  struct Cell {
    explicit Cell(RunState s) : state(std::move(s)) {}
    std::mutex mu;
    RunState state;
  };

  struct alignas(64) Partition {
    mutable std::mutex mu;
    ankerl::unordered_dense::map<RunId, std::shared_ptr<Cell>> runs;
  };

  [[nodiscard]] auto partition_for(const RunId &run_id) const -> Partition &;
  [[nodiscard]] auto find_cell(const RunId &run_id) const
      -> std::shared_ptr<Cell>;

  std::vector<std::unique_ptr<Partition>> partitions_;
};

} // namespace flowforge
