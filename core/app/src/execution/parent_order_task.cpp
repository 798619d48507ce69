#include "tradeguard/execution/parent_order_task.hpp"
#include "tradeguard/domain/to_string.hpp"
#include "tradeguard/events/event_types.hpp"
#include "tradeguard/events/parent_order_update_event.hpp"
#include "tradeguard/execution/slice_sequence.hpp"

#include <algorithm>
#include <iostream>

namespace tradeguard {

namespace {

constexpr std::chrono::milliseconds kSliceWaitStep{50};

}  // namespace

ParentOrderTask::ParentOrderTask(const SchedulerContext& ctx,
                                 domain::OrderId id,
                                 domain::OrderIntent intent)
    : ctx_(ctx), id_(id), intent_(std::move(intent)) {
  report_.order_id = id_;
  report_.instrument = intent_.instrument;
  report_.side = intent_.side;
  report_.target_quantity = intent_.quantity;
  report_.status = domain::ParentStatus::Working;
  report_.updated_at = ctx_.clock.now();
}

ParentOrderTask::~ParentOrderTask() { join(); }

void ParentOrderTask::start() {
  thread_ = std::thread(&ParentOrderTask::run, this);
}

void ParentOrderTask::requestCancel() {
  {
    std::lock_guard lock(wait_mutex_);
    cancel_requested_.store(true);
  }
  wait_cv_.notify_all();
}

void ParentOrderTask::abort() {
  abort_requested_.store(true);
  requestCancel();
}

void ParentOrderTask::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

domain::ParentOrderReport ParentOrderTask::report() const {
  std::lock_guard lock(report_mutex_);
  return report_;
}

bool ParentOrderTask::waitFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(wait_mutex_);
  if (delay > std::chrono::milliseconds(0)) {
    wait_cv_.wait_for(lock, delay,
                      [this] { return cancel_requested_.load(); });
  }
  return !cancel_requested_.load();
}

std::optional<domain::ChildOrderSlice> ParentOrderTask::awaitSlice(
    domain::SliceId slice_id) {
  auto deadline = std::chrono::steady_clock::now() + ctx_.fill_timeout;
  std::optional<domain::ChildOrderSlice> current;
  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto step = std::max(std::chrono::milliseconds(0),
                         std::min(left, kSliceWaitStep));
    current = ctx_.lifecycle.awaitTerminal(slice_id, step);
    if (!current || domain::isTerminal(current->status) ||
        abort_requested_.load() || left <= kSliceWaitStep) {
      return current;
    }
  }
}

void ParentOrderTask::publishReport() {
  ParentOrderUpdateEvent update;
  {
    std::lock_guard lock(report_mutex_);
    report_.updated_at = ctx_.clock.now();
    update.report = report_;
  }
  ctx_.bus.publish(update);
}

void ParentOrderTask::finish(domain::ParentStatus status,
                             domain::ErrorCode reason, std::string message) {
  domain::ParentOrderReport final_report;
  {
    std::lock_guard lock(report_mutex_);
    report_.status = status;
    report_.halt_reason = reason;
    report_.message = std::move(message);
    final_report = report_;
  }

  std::ostream& out = status == domain::ParentStatus::Filled ||
                              status == domain::ParentStatus::Canceled
                          ? std::cout
                          : std::cerr;
  out << "[ParentOrderTask] order_id=" << id_ << " "
      << domain::toString(status) << " filled=" << final_report.filled_quantity
      << "/" << final_report.target_quantity;
  if (!final_report.message.empty()) {
    out << " (" << final_report.message << ")";
  }
  out << "\n";

  publishReport();
  finished_.store(true);
  if (ctx_.on_finished) {
    ctx_.on_finished();
  }
}

// -----------------------------------------------------------------------------
// run: the per-parent slice loop
// -----------------------------------------------------------------------------
void ParentOrderTask::run() {
  SliceSequence sequence(intent_.quantity, intent_.pacing);

  std::cout << "[ParentOrderTask] order_id=" << id_ << " started: "
            << domain::toString(intent_.side) << " " << intent_.quantity
            << " " << intent_.instrument << " via "
            << domain::pacingName(intent_.pacing) << "\n";
  publishReport();

  while (!sequence.exhausted()) {
    // --- 1. Suspend until the slice is due -----------------------------------
    if (!waitFor(sequence.pendingDelay())) {
      finish(domain::ParentStatus::Canceled, domain::ErrorCode::None,
             abort_requested_.load() ? "engine stopped" : "canceled");
      return;
    }

    // --- 2. Size from the latest market snapshot ------------------------------
    std::optional<domain::MarketSnapshot> market;
    if (ctx_.market != nullptr) {
      market = ctx_.market->snapshot(intent_.instrument);
    }
    auto instruction = sequence.next(market);
    if (!instruction) {
      break;
    }

    // --- 3. Risk check on the cumulative delta, then register ----------------
    domain::ChildOrderSlice slice;
    slice.parent_id = id_;
    slice.index = instruction->index;
    slice.instrument = intent_.instrument;
    slice.side = intent_.side;
    slice.quantity = instruction->quantity;
    slice.limit_price = intent_.limit_price;

    domain::ProposedDelta delta;
    delta.instrument = intent_.instrument;
    domain::RiskDecision decision;
    bool registered = false;
    {
      // Held until the slice counts as outstanding for the next check.
      std::lock_guard admit(ctx_.admission);
      auto limits = ctx_.config.current();
      delta.signed_quantity =
          domain::signedQuantity(intent_.side, instruction->quantity) +
          ctx_.lifecycle.outstandingQuantity(intent_.instrument);
      decision = ctx_.rules.evaluate(delta, ctx_.ledger.snapshot(), *limits);
      if (decision.accepted()) {
        slice.id = ctx_.slice_ids.next_id();
        slice.scheduled_at = ctx_.clock.now();
        registered = ctx_.lifecycle.registerSlice(slice);
      }
    }

    if (!decision.accepted()) {
      RiskRejectEvent reject;
      reject.order_id = id_;
      reject.instrument = intent_.instrument;
      reject.proposed_quantity = delta.signed_quantity;
      reject.at_intake = false;
      reject.slice_index = instruction->index;
      reject.violations = decision.violations;
      reject.timestamp = ctx_.clock.now();
      ctx_.bus.publish(reject);

      {
        std::lock_guard lock(report_mutex_);
        report_.violations = decision.violations;
      }
      finish(domain::ParentStatus::PartiallyExecuted,
             domain::ErrorCode::RiskRejected,
             "slice " + std::to_string(instruction->index) +
                 " rejected: " + decision.violations.front().message);
      return;
    }

    if (!registered) {
      finish(domain::ParentStatus::Canceled, domain::ErrorCode::None,
             "engine stopped");
      return;
    }

    // --- 4. Submit -------------------------------------------------------------
    {
      std::lock_guard lock(report_mutex_);
      report_.scheduled_quantity += slice.quantity;
      ++report_.slices_submitted;
    }

    SubmitOutcome outcome = ctx_.lifecycle.submitRegistered(slice.id);
    if (!outcome.accepted()) {
      std::string message = "slice " + std::to_string(slice.index) + " " +
                            domain::toString(outcome.status) + ": " +
                            outcome.reason;
      if (outcome.error == domain::ErrorCode::LedgerInconsistency) {
        auto refused = ctx_.lifecycle.slice(slice.id);
        {
          std::lock_guard lock(report_mutex_);
          report_.filled_quantity += refused ? refused->filled_quantity : 0;
        }
        finish(domain::ParentStatus::Failed,
               domain::ErrorCode::LedgerInconsistency, message);
      } else {
        finish(domain::ParentStatus::PartiallyExecuted, outcome.error,
               message);
      }
      return;
    }

    // --- 5. Wait for the slice outcome ---------------------------------------
    auto settled = awaitSlice(slice.id);
    if (!settled || !domain::isTerminal(settled->status)) {
      ctx_.lifecycle.cancelSlice(slice.id);
      settled = ctx_.lifecycle.slice(slice.id);
      {
        std::lock_guard lock(report_mutex_);
        report_.filled_quantity += settled ? settled->filled_quantity : 0;
      }
      if (abort_requested_.load()) {
        finish(domain::ParentStatus::Canceled, domain::ErrorCode::None,
               "engine stopped");
        return;
      }
      std::string message = "slice " + std::to_string(slice.index) +
                            " not terminal after fill timeout";
      if (ctx_.on_halt) {
        ctx_.on_halt(domain::ErrorCode::FillTimeout, message);
      }
      finish(domain::ParentStatus::PartiallyExecuted,
             domain::ErrorCode::FillTimeout, message);
      return;
    }

    {
      std::lock_guard lock(report_mutex_);
      report_.filled_quantity += settled->filled_quantity;
      if (settled->status == domain::SliceStatus::Filled) {
        ++report_.slices_filled;
      }
    }

    switch (settled->status) {
      case domain::SliceStatus::Filled:
        publishReport();
        break;

      case domain::SliceStatus::Failed:
        finish(domain::ParentStatus::Failed,
               domain::ErrorCode::LedgerInconsistency,
               "slice " + std::to_string(slice.index) +
                   " failed: ledger refused a fill");
        return;

      case domain::SliceStatus::Canceled:
        if (cancel_requested_.load()) {
          finish(domain::ParentStatus::Canceled, domain::ErrorCode::None,
                 "canceled");
        } else {
          finish(domain::ParentStatus::PartiallyExecuted,
                 domain::ErrorCode::None,
                 "slice " + std::to_string(slice.index) +
                     " canceled at the venue");
        }
        return;

      case domain::SliceStatus::Rejected:
        finish(domain::ParentStatus::PartiallyExecuted,
               domain::ErrorCode::VenueRejected,
               "slice " + std::to_string(slice.index) + " rejected");
        return;

      case domain::SliceStatus::Created:
      case domain::SliceStatus::Submitted:
      case domain::SliceStatus::PartiallyFilled:
        break;
    }
  }

  domain::Quantity filled = report().filled_quantity;
  if (filled == intent_.quantity) {
    finish(domain::ParentStatus::Filled, domain::ErrorCode::None, "");
  } else {
    finish(domain::ParentStatus::PartiallyExecuted, domain::ErrorCode::None,
           "sequence exhausted with " + std::to_string(filled) + " filled");
  }
}

}  // namespace tradeguard
