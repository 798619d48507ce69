#include "tradeguard/execution/slice_sequence.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <variant>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Sizer: dispatches next() to the algorithm held by the PacingSpec
// -----------------------------------------------------------------------------
struct SliceSequence::Sizer {
  SliceSequence& seq;
  const std::optional<domain::MarketSnapshot>& market;

  std::optional<SliceInstruction> operator()(const domain::TwapParams& p) {
    return seq.nextTwap(p);
  }
  std::optional<SliceInstruction> operator()(const domain::VwapParams& p) {
    return seq.nextVwap(p);
  }
  std::optional<SliceInstruction> operator()(const domain::IcebergParams& p) {
    return seq.nextIceberg(p);
  }
  std::optional<SliceInstruction> operator()(
      const domain::MinSlippageParams& p) {
    return seq.nextMinSlippage(p, market);
  }
  std::optional<SliceInstruction> operator()(
      const domain::ParticipationParams& p) {
    return seq.nextParticipation(p, market);
  }
};

SliceSequence::SliceSequence(domain::Quantity total, domain::PacingSpec pacing)
    : total_(std::max<domain::Quantity>(total, 0)),
      pacing_(std::move(pacing)) {
  if (const auto* vwap = std::get_if<domain::VwapParams>(&pacing_)) {
    double sum = 0.0;
    for (double w : vwap->weights) {
      sum += std::max(w, 0.0);
    }
    if (sum > 0.0) {
      for (double w : vwap->weights) {
        weights_.push_back(std::max(w, 0.0) / sum);
      }
    }
  }
}

std::optional<SliceInstruction> SliceSequence::next(
    const std::optional<domain::MarketSnapshot>& market) {
  if (exhausted()) {
    return std::nullopt;
  }
  return std::visit(Sizer{*this, market}, pacing_);
}

std::chrono::milliseconds SliceSequence::pendingDelay() const {
  using std::chrono::milliseconds;

  if (count_ == 0 || exhausted()) {
    return milliseconds(0);
  }

  if (const auto* twap = std::get_if<domain::TwapParams>(&pacing_)) {
    return twap->horizon / twapSlices(*twap);
  }
  if (const auto* ice = std::get_if<domain::IcebergParams>(&pacing_)) {
    return ice->interval;
  }
  if (const auto* ms = std::get_if<domain::MinSlippageParams>(&pacing_)) {
    return ms->interval;
  }
  if (const auto* pov = std::get_if<domain::ParticipationParams>(&pacing_)) {
    return pov->interval;
  }

  const auto& vwap = std::get<domain::VwapParams>(pacing_);
  if (weights_.empty()) {
    return milliseconds(0);
  }
  auto step = vwap.horizon / static_cast<std::int64_t>(weights_.size());
  for (std::size_t pos = weight_pos_; pos < weights_.size(); ++pos) {
    domain::Quantity qty = remaining();
    if (pos + 1 < weights_.size()) {
      auto target = static_cast<domain::Quantity>(
          std::llround(weights_[pos] * static_cast<double>(total_)));
      qty = std::min(target, remaining());
    }
    if (qty > 0) {
      return step * static_cast<std::int64_t>(pos) - last_offset_;
    }
  }
  return milliseconds(0);
}

SliceInstruction SliceSequence::emit(domain::Quantity qty,
                                     std::chrono::milliseconds delay) {
  SliceInstruction instr;
  instr.index = count_;
  instr.quantity = qty;
  instr.delay = count_ == 0 ? std::chrono::milliseconds(0) : delay;
  emitted_ += qty;
  ++count_;
  return instr;
}

// -----------------------------------------------------------------------------
// TWAP
// -----------------------------------------------------------------------------
domain::Quantity SliceSequence::twapSlices(const domain::TwapParams& p) const {
  constexpr auto kMax =
      static_cast<std::size_t>(std::numeric_limits<domain::Quantity>::max());
  auto slices = static_cast<domain::Quantity>(
      std::clamp<std::size_t>(p.slices, 1, kMax));
  return std::max<domain::Quantity>(std::min(slices, total_), 1);
}

std::optional<SliceInstruction> SliceSequence::nextTwap(
    const domain::TwapParams& p) {
  domain::Quantity n = twapSlices(p);
  auto step = p.horizon / n;

  bool last = static_cast<domain::Quantity>(count_) + 1 >= n;
  domain::Quantity qty = last ? remaining() : total_ / n;
  return emit(qty, step);
}

// -----------------------------------------------------------------------------
// VWAP
// -----------------------------------------------------------------------------
std::optional<SliceInstruction> SliceSequence::nextVwap(
    const domain::VwapParams& p) {
  if (weights_.empty()) {
    // Unusable curve: emit everything at once rather than never finishing.
    return emit(remaining(), std::chrono::milliseconds(0));
  }

  auto step = p.horizon / static_cast<std::int64_t>(weights_.size());

  while (weight_pos_ < weights_.size()) {
    std::size_t pos = weight_pos_++;
    bool last = weight_pos_ == weights_.size();

    domain::Quantity qty = remaining();
    if (!last) {
      auto target = static_cast<domain::Quantity>(
          std::llround(weights_[pos] * static_cast<double>(total_)));
      qty = std::min(target, remaining());
    }
    if (qty <= 0) {
      continue;
    }

    auto offset = step * static_cast<std::int64_t>(pos);
    auto delay = offset - last_offset_;
    last_offset_ = offset;
    return emit(qty, delay);
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Iceberg
// -----------------------------------------------------------------------------
std::optional<SliceInstruction> SliceSequence::nextIceberg(
    const domain::IcebergParams& p) {
  domain::Quantity clip = p.clip_size > 0 ? p.clip_size : remaining();
  return emit(std::min(clip, remaining()), p.interval);
}

// -----------------------------------------------------------------------------
// MinSlippage
// -----------------------------------------------------------------------------
std::optional<SliceInstruction> SliceSequence::nextMinSlippage(
    const domain::MinSlippageParams& p,
    const std::optional<domain::MarketSnapshot>& market) {
  domain::Quantity clip = p.clip_size > 0 ? p.clip_size : remaining();
  domain::Quantity capped = std::min(clip, remaining());

  domain::Quantity adaptive = remaining();
  if (market && p.base_spread_bps > 0.0) {
    double spread = market->spreadBps();
    if (spread > p.base_spread_bps) {
      auto scaled = static_cast<domain::Quantity>(std::floor(
          static_cast<double>(capped) * p.base_spread_bps / spread));
      adaptive = std::max<domain::Quantity>(scaled, 1);
    }
  }

  return emit(std::min(capped, adaptive), p.interval);
}

// -----------------------------------------------------------------------------
// Participation
// -----------------------------------------------------------------------------
std::optional<SliceInstruction> SliceSequence::nextParticipation(
    const domain::ParticipationParams& p,
    const std::optional<domain::MarketSnapshot>& market) {
  domain::Quantity qty = p.clip_size > 0 ? p.clip_size : remaining();
  if (market && market->volume > 0.0) {
    auto share = static_cast<domain::Quantity>(
        std::floor(market->volume * p.participation_rate));
    qty = std::max<domain::Quantity>(share, 1);
  }
  return emit(std::min(qty, remaining()), p.interval);
}

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
std::optional<std::string> SliceSequence::validate(
    const domain::PacingSpec& pacing) {
  using std::chrono::milliseconds;

  if (const auto* twap = std::get_if<domain::TwapParams>(&pacing)) {
    if (twap->slices == 0) {
      return "TWAP slices must be >= 1";
    }
    if (twap->slices >
        static_cast<std::size_t>(std::numeric_limits<domain::Quantity>::max())) {
      return "TWAP slices out of range";
    }
    if (twap->horizon < milliseconds(0)) {
      return "TWAP horizon must be >= 0";
    }
    return std::nullopt;
  }

  if (const auto* vwap = std::get_if<domain::VwapParams>(&pacing)) {
    if (vwap->weights.empty()) {
      return "VWAP needs at least one weight";
    }
    for (double w : vwap->weights) {
      if (!std::isfinite(w) || w < 0.0) {
        return "VWAP weights must be finite and >= 0";
      }
    }
    if (std::accumulate(vwap->weights.begin(), vwap->weights.end(), 0.0) <=
        0.0) {
      return "VWAP weights must not all be zero";
    }
    if (vwap->horizon < milliseconds(0)) {
      return "VWAP horizon must be >= 0";
    }
    return std::nullopt;
  }

  if (const auto* ice = std::get_if<domain::IcebergParams>(&pacing)) {
    if (ice->clip_size <= 0) {
      return "Iceberg clip_size must be > 0";
    }
    if (ice->interval < milliseconds(0)) {
      return "Iceberg interval must be >= 0";
    }
    return std::nullopt;
  }

  if (const auto* ms = std::get_if<domain::MinSlippageParams>(&pacing)) {
    if (ms->clip_size <= 0) {
      return "MinSlippage clip_size must be > 0";
    }
    if (ms->interval < milliseconds(0)) {
      return "MinSlippage interval must be >= 0";
    }
    if (!std::isfinite(ms->base_spread_bps) || ms->base_spread_bps <= 0.0) {
      return "MinSlippage base_spread_bps must be > 0";
    }
    return std::nullopt;
  }

  if (const auto* pov = std::get_if<domain::ParticipationParams>(&pacing)) {
    if (!std::isfinite(pov->participation_rate) ||
        pov->participation_rate <= 0.0 || pov->participation_rate > 1.0) {
      return "Participation rate must be in (0, 1]";
    }
    if (pov->clip_size <= 0) {
      return "Participation clip_size must be > 0";
    }
    if (pov->interval < milliseconds(0)) {
      return "Participation interval must be >= 0";
    }
    return std::nullopt;
  }

  return "unknown pacing algorithm";
}

}  // namespace tradeguard
