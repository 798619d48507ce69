#include "tradeguard/execution/execution_scheduler.hpp"

#include <iostream>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
ExecutionScheduler::ExecutionScheduler(
    EventBus& bus, OrderLifecycleEngine& lifecycle, PositionLedger& ledger,
    const RiskRuleEngine& rules, const RiskConfigStore& config,
    const IMarketDataSource* market, IdGenerator& slice_ids,
    const ITimeProvider& clock, std::chrono::milliseconds fill_timeout,
    HaltHandler on_halt, std::size_t retained_reports)
    : ctx_{bus,        lifecycle, ledger,          rules,
           config,     market,    slice_ids,       clock,
           fill_timeout, admission_mutex_, std::move(on_halt), {}},
      retained_reports_(retained_reports) {
  ctx_.on_finished = [this] {
    std::lock_guard lock(done_mutex_);
    done_cv_.notify_all();
  };
}

ExecutionScheduler::~ExecutionScheduler() { shutdown(); }

SliceSequence ExecutionScheduler::schedule(const domain::OrderIntent& intent) {
  return SliceSequence(intent.quantity, intent.pacing);
}

// -----------------------------------------------------------------------------
// launch / cancel / halt
// -----------------------------------------------------------------------------
bool ExecutionScheduler::launch(domain::OrderId id,
                                domain::OrderIntent intent) {
  std::lock_guard lock(mutex_);
  if (shut_down_ || halted_) {
    std::cerr << "[ExecutionScheduler] launch of order_id=" << id
              << " refused: scheduler is "
              << (shut_down_ ? "shut down" : "halted") << ".\n";
    return false;
  }
  reapLocked();

  auto task = std::make_unique<ParentOrderTask>(ctx_, id, std::move(intent));
  task->start();
  tasks_.emplace(id, std::move(task));
  return true;
}

bool ExecutionScheduler::cancel(domain::OrderId id) {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(id);
  if (it == tasks_.end() || it->second->finished()) {
    return false;
  }
  std::cout << "[ExecutionScheduler] cancel requested for order_id=" << id
            << "\n";
  it->second->requestCancel();
  return true;
}

void ExecutionScheduler::halt() {
  std::lock_guard lock(mutex_);
  halted_ = true;
  for (auto& [id, task] : tasks_) {
    if (!task->finished()) {
      task->requestCancel();
    }
  }
}

void ExecutionScheduler::resume() {
  std::lock_guard lock(mutex_);
  halted_ = false;
}

bool ExecutionScheduler::halted() const {
  std::lock_guard lock(mutex_);
  return halted_;
}

void ExecutionScheduler::shutdown() {
  std::map<domain::OrderId, std::unique_ptr<ParentOrderTask>> tasks;
  {
    std::lock_guard lock(mutex_);
    shut_down_ = true;
    for (auto& [id, task] : tasks_) {
      task->abort();
    }
    tasks.swap(tasks_);
  }

  // Join outside the lock: a finishing task may still call halt().
  for (auto& [id, task] : tasks) {
    task->join();
    std::lock_guard lock(mutex_);
    retireLocked(id, task->report());
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::ParentOrderReport> ExecutionScheduler::report(
    domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(id);
  if (it != tasks_.end()) {
    return it->second->finished() ? withLateFills(it->second->report())
                                  : it->second->report();
  }
  auto done = completed_.find(id);
  if (done != completed_.end()) {
    return withLateFills(done->second);
  }
  return std::nullopt;
}

std::vector<domain::ParentOrderReport> ExecutionScheduler::reports() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::ParentOrderReport> out;
  out.reserve(tasks_.size() + completed_.size());
  for (const auto& [id, report] : completed_) {
    out.push_back(withLateFills(report));
  }
  for (const auto& [id, task] : tasks_) {
    out.push_back(task->finished() ? withLateFills(task->report())
                                   : task->report());
  }
  return out;
}

std::optional<domain::ParentOrderReport> ExecutionScheduler::awaitCompletion(
    domain::OrderId id, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto current = report(id);
    if (!current || domain::isTerminal(current->status) ||
        std::chrono::steady_clock::now() >= deadline) {
      return current;
    }
    std::unique_lock lock(done_mutex_);
    done_cv_.wait_for(lock, std::chrono::milliseconds(10));
  }
}

std::size_t ExecutionScheduler::activeCount() {
  std::lock_guard lock(mutex_);
  reapLocked();
  return tasks_.size();
}

void ExecutionScheduler::reapLocked() {
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (it->second->finished()) {
      it->second->join();
      retireLocked(it->first, it->second->report());
      it = tasks_.erase(it);
    } else {
      ++it;
    }
  }
}

void ExecutionScheduler::retireLocked(domain::OrderId id,
                                      domain::ParentOrderReport report) {
  if (completed_.find(id) == completed_.end()) {
    completed_order_.push_back(id);
  }
  completed_[id] = std::move(report);

  while (completed_order_.size() > retained_reports_) {
    domain::OrderId oldest = completed_order_.front();
    completed_order_.pop_front();
    completed_.erase(oldest);
    ctx_.lifecycle.releaseParent(oldest);
  }
}

// Fills booked after the task finished (for example after a fill timeout
// cancel) only reach the lifecycle engine.
domain::ParentOrderReport ExecutionScheduler::withLateFills(
    domain::ParentOrderReport report) const {
  if (auto filled = ctx_.lifecycle.filledQuantity(report.order_id)) {
    report.filled_quantity = *filled;
  }
  return report;
}

}  // namespace tradeguard
