#include "vc/math/RiskMetrics.hpp"

#include <algorithm>
#include <cmath>

namespace vc {

static double mean(const std::vector<double>& v, std::size_t n) {
  if (n == 0) return 0;
  double s = 0;
  for (std::size_t i = 0; i < n; ++i) s += v[i];
  return s / static_cast<double>(n);
}

static double sampleStd(const std::vector<double>& v) {
  if (v.size() < 2) return 0;
  double m = mean(v, v.size());
  double acc = 0;
  for (double x : v) acc += (x - m) * (x - m);
  return std::sqrt(acc / static_cast<double>(v.size() - 1));
}

double computeSharpe(const std::vector<double>& returns, double riskFreeRate) {
  double sd = sampleStd(returns);
  if (sd <= 0) return 0;
  double annualReturn = mean(returns, returns.size()) * kTradingDaysPerYear;
  double annualVol = sd * std::sqrt(kTradingDaysPerYear);
  return (annualReturn - riskFreeRate) / annualVol;
}

double computeSortino(const std::vector<double>& returns, double riskFreeRate) {
  if (returns.size() < 2) return 0;
  double acc = 0;
  for (double r : returns) {
    if (r < 0) acc += r * r;
  }
  // No losing days: no downside deviation to scale by.
  if (acc <= 0) return 0;
  double downside = std::sqrt(acc / static_cast<double>(returns.size())) *
                    std::sqrt(kTradingDaysPerYear);
  double annualReturn = mean(returns, returns.size()) * kTradingDaysPerYear;
  return (annualReturn - riskFreeRate) / downside;
}

double computeMaxDrawdown(const std::vector<double>& prices) {
  double peak = 0, worst = 0;
  for (double p : prices) {
    if (p > peak) peak = p;
    if (peak > 0) worst = std::max(worst, (peak - p) / peak);
  }
  return worst;
}

double computeCalmar(const std::vector<double>& prices) {
  if (prices.size() < 2 || prices.front() <= 0) return 0;
  double mdd = computeMaxDrawdown(prices);
  if (mdd <= 0) return 0;
  double growth = prices.back() / prices.front();
  if (growth <= 0) return 0;
  double years = static_cast<double>(prices.size() - 1) / kTradingDaysPerYear;
  double annualReturn = std::pow(growth, 1.0 / years) - 1.0;
  return annualReturn / mdd;
}

double computeBeta(const std::vector<double>& returns, const std::vector<double>& benchmark) {
  std::size_t n = std::min(returns.size(), benchmark.size());
  if (n < 2) return 0;
  double mr = mean(returns, n), mb = mean(benchmark, n);
  double cov = 0, var = 0;
  for (std::size_t i = 0; i < n; ++i) {
    cov += (returns[i] - mr) * (benchmark[i] - mb);
    var += (benchmark[i] - mb) * (benchmark[i] - mb);
  }
  return var > 0 ? cov / var : 0.0;
}

double computeAlpha(const std::vector<double>& returns, const std::vector<double>& benchmark,
                    double riskFreeRate) {
  std::size_t n = std::min(returns.size(), benchmark.size());
  if (n < 2) return 0;
  double rfDaily = riskFreeRate / kTradingDaysPerYear;
  double beta = computeBeta(returns, benchmark);
  double excess = (mean(returns, n) - rfDaily) - beta * (mean(benchmark, n) - rfDaily);
  return excess * kTradingDaysPerYear;
}

double computeHistoricalVar(const std::vector<double>& returns, double confidence) {
  if (returns.empty()) return 0;
  std::vector<double> sorted = returns;
  std::sort(sorted.begin(), sorted.end());
  double c = std::min(1.0, std::max(0.0, confidence));
  auto idx = static_cast<std::size_t>(std::floor(c * static_cast<double>(sorted.size())));
  if (idx >= sorted.size()) idx = sorted.size() - 1;
  return sorted[idx];
}

std::vector<double> pricesFromReturns(const std::vector<double>& returns) {
  std::vector<double> prices;
  prices.reserve(returns.size() + 1);
  double p = 1.0;
  prices.push_back(p);
  for (double r : returns) {
    p *= 1.0 + r;
    prices.push_back(p);
  }
  return prices;
}

} // namespace vc
