#pragma once
#include <vector>

namespace vc {

constexpr double kTradingDaysPerYear = 252.0;

// Scalar performance metrics over daily return / price series.
// Degenerate input (too few points, zero variance, zero drawdown) returns 0.

double computeSharpe(const std::vector<double>& returns, double riskFreeRate = 0.02);
double computeSortino(const std::vector<double>& returns, double riskFreeRate = 0.02);
// Positive fraction, e.g. 0.25 for a 25% peak-to-trough fall.
double computeMaxDrawdown(const std::vector<double>& prices);
double computeCalmar(const std::vector<double>& prices);
double computeBeta(const std::vector<double>& returns, const std::vector<double>& benchmark);
// Annualized Jensen's alpha.
double computeAlpha(const std::vector<double>& returns, const std::vector<double>& benchmark,
                    double riskFreeRate = 0.02);
// Historical VaR: the `confidence` quantile of returns (a loss reads negative).
double computeHistoricalVar(const std::vector<double>& returns, double confidence = 0.05);

// Compounds daily returns into a price path starting at 1.
std::vector<double> pricesFromReturns(const std::vector<double>& returns);

} // namespace vc
