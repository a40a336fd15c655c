#include <cw/core/stats.hpp>

#include <algorithm> // std::sort, std::remove_if
#include <cmath>     // std::sqrt, std::floor, std::isfinite
#include <limits>    // std::numeric_limits
#include <stdexcept> // std::invalid_argument

namespace cw {
namespace core {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

// --- RunningStats -----------------------------------------------------------

RunningStats::RunningStats() noexcept = default;

void RunningStats::add(double x) noexcept {
  if (!std::isfinite(x)) return;
  if (n_ == 0) {
    min_ = max_ = x;
  } else {
    min_ = std::min(min_, x);
    max_ = std::max(max_, x);
  }
  // Algorithme de Welford (stable numériquement, une passe)
  n_ += 1;
  const double delta  = x - mean_;
  mean_ += delta / static_cast<double>(n_);
  const double delta2 = x - mean_;
  m2_   += delta * delta2;
}

std::size_t RunningStats::count() const noexcept {
  return n_;
}

double RunningStats::mean() const noexcept {
  return n_ == 0 ? kNaN : mean_;
}

double RunningStats::min() const noexcept { return n_ == 0 ? kNaN : min_; }
double RunningStats::max() const noexcept { return n_ == 0 ? kNaN : max_; }

double RunningStats::variance() const noexcept {
  if (n_ < 2) {
    return kNaN; // politique: indéfini si n<2
  }
  return m2_ / static_cast<double>(n_ - 1); // variance d'échantillon
}

double RunningStats::stddev() const noexcept {
  return std::sqrt(variance());
}

// --- Quantiles --------------------------------------------------------------

std::optional<double> quantile_linear(std::vector<double> values, double q) {
  if (!(q >= 0.0 && q <= 1.0)) {
    throw std::invalid_argument("quantile_linear: q must be in [0, 1]");
  }
  values.erase(std::remove_if(values.begin(), values.end(),
                              [](double v){ return !std::isfinite(v); }),
               values.end());
  if (values.empty()) return std::nullopt;
  std::sort(values.begin(), values.end());

  const double idx = q * static_cast<double>(values.size() - 1);
  const std::size_t lo = static_cast<std::size_t>(std::floor(idx));
  const std::size_t hi = std::min(lo + 1, values.size() - 1);
  const double a = idx - static_cast<double>(lo);
  if (hi == lo || a == 0.0) return values[lo];
  return values[lo] + a * (values[hi] - values[lo]);
}

std::optional<double> median(std::vector<double> values) {
  return quantile_linear(std::move(values), 0.5);
}

std::optional<double> pearson_correlation(const std::vector<double>& x,
                                          const std::vector<double>& y) {
  const std::size_t n = std::min(x.size(), y.size());
  RunningStats sx, sy;
  std::vector<std::size_t> keep;
  keep.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (std::isfinite(x[i]) && std::isfinite(y[i])) {
      keep.push_back(i);
      sx.add(x[i]);
      sy.add(y[i]);
    }
  }
  if (keep.size() < 2) return std::nullopt;

  double cov = 0.0;
  for (std::size_t i : keep) cov += (x[i] - sx.mean()) * (y[i] - sy.mean());
  cov /= static_cast<double>(keep.size() - 1);

  const double den = sx.stddev() * sy.stddev();
  if (!(den > 0.0)) return std::nullopt;
  return cov / den;
}

} // namespace core
} // namespace cw
