#include <pitwall/weighted_stats.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

#include <Eigen/Dense>

namespace pitwall {

double round3(double v) {
  return std::round(v * 1000.0) / 1000.0;
}

std::optional<double> weighted_median(const std::vector<double>& values,
                                      const std::vector<double>& weights) {
  const std::size_t n = values.size();
  if (n == 0 || weights.size() != n) return std::nullopt;

  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b){ return values[a] < values[b]; });

  double total = 0.0;
  for (double w : weights) total += std::max(0.0, w);
  if (total <= 0.0) return std::nullopt;

  const double cutoff = total * 0.5;
  const double eps = 1e-12 * total;
  double cdf = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    cdf += std::max(0.0, weights[order[i]]);
    if (cdf + eps < cutoff) continue;
    if (std::fabs(cdf - cutoff) <= eps && i + 1 < n) {
      return 0.5 * (values[order[i]] + values[order[i + 1]]);
    }
    return values[order[i]];
  }
  return values[order[n - 1]];
}

std::optional<double> quantile(std::vector<double> values, double q) {
  if (values.empty()) return std::nullopt;
  q = std::clamp(q, 0.0, 1.0);
  std::sort(values.begin(), values.end());
  const double pos = q * static_cast<double>(values.size() - 1);
  const std::size_t lo = static_cast<std::size_t>(std::floor(pos));
  const std::size_t hi = std::min(lo + 1, values.size() - 1);
  const double frac = pos - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

std::optional<LineFit> weighted_linear_fit(const std::vector<double>& x,
                                           const std::vector<double>& y,
                                           const std::vector<double>& w) {
  const std::size_t n = x.size();
  if (n < 2 || y.size() != n || w.size() != n) return std::nullopt;

  const auto [xmin, xmax] = std::minmax_element(x.begin(), x.end());
  if (!(*xmax > *xmin)) return std::nullopt;

  double wsum = 0.0;
  for (double wi : w) wsum += std::max(0.0, wi);
  if (wsum <= 0.0) return std::nullopt;

  // Row-scale by w: the weight multiplies the unsquared residual, so the
  // squared error of point i counts w^2.
  Eigen::MatrixXd A(static_cast<Eigen::Index>(n), 2);
  Eigen::VectorXd b(static_cast<Eigen::Index>(n));
  for (std::size_t i = 0; i < n; ++i) {
    const auto r = static_cast<Eigen::Index>(i);
    const double sw = std::max(0.0, w[i]);
    A(r, 0) = sw * x[i];
    A(r, 1) = sw;
    b(r) = sw * y[i];
  }

  const Eigen::Vector2d coef = A.colPivHouseholderQr().solve(b);
  if (!std::isfinite(coef(0)) || !std::isfinite(coef(1))) return std::nullopt;
  return LineFit{coef(0), coef(1)};
}

} // namespace pitwall
