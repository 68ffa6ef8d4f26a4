#include "adf.hpp"

#include <Eigen/Dense>
#include <boost/math/distributions/normal.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numbers>
#include <vector>

namespace {

// MacKinnon (1994) response surface, constant term, one variable
constexpr double kTauMax = 2.74;
constexpr double kTauMin = -18.83;
constexpr double kTauStar = -1.61;
constexpr double kSmallP[] = {2.1659, 1.4412, 0.038269};
constexpr double kLargeP[] = {1.7339, 0.93202, -0.12745, -0.010368};

// MacKinnon (2010) critical values, constant term: b0 + b1/T + b2/T^2 + b3/T^3
struct CritRow { const char* level; double b[4]; };
constexpr CritRow kCrit[] = {
    {"1%",  {-3.43035, -6.5393, -16.786, -79.433}},
    {"5%",  {-2.86154, -2.8903, -4.234, -40.040}},
    {"10%", {-2.56677, -1.5384, -2.809, 0.0}},
};

struct OlsFit {
    bool ok{false};
    double ssr{0};
    Eigen::VectorXd beta;
    Eigen::MatrixXd xtx_inv;
};

OlsFit ols(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
    OlsFit fit;
    if (X.rows() <= X.cols()) return fit;

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
    if (qr.rank() < X.cols()) return fit;
    fit.beta = qr.solve(y);

    const Eigen::MatrixXd xtx = X.transpose() * X;
    Eigen::FullPivLU<Eigen::MatrixXd> lu(xtx);
    if (!lu.isInvertible()) return fit;
    fit.xtx_inv = lu.inverse();

    fit.ssr = (y - X * fit.beta).squaredNorm();
    fit.ok = fit.beta.allFinite() && std::isfinite(fit.ssr);
    return fit;
}

// Regressors of the ADF equation for diff-lag count `lags` on rows
// j = first..n-2 of dx:  [x_j, dx_{j-1} .. dx_{j-lags}, 1]
void build_design(const std::vector<double>& x, const std::vector<double>& dx,
                  std::size_t first, std::size_t lags,
                  Eigen::MatrixXd& X, Eigen::VectorXd& y) {
    const auto rows = static_cast<Eigen::Index>(dx.size() - first);
    const auto cols = static_cast<Eigen::Index>(lags + 2);
    X.resize(rows, cols);
    y.resize(rows);
    for (Eigen::Index r = 0; r < rows; ++r) {
        const std::size_t j = first + static_cast<std::size_t>(r);
        y(r) = dx[j];
        X(r, 0) = x[j];
        for (std::size_t l = 1; l <= lags; ++l) {
            X(r, static_cast<Eigen::Index>(l)) = dx[j - l];
        }
        X(r, cols - 1) = 1.0;
    }
}

double aic(const OlsFit& fit, Eigen::Index nobs, Eigen::Index k) {
    const double n = static_cast<double>(nobs);
    const double llf = -n / 2.0 * (std::log(2.0 * std::numbers::pi) + std::log(fit.ssr / n) + 1.0);
    return -2.0 * llf + 2.0 * static_cast<double>(k);
}

} // namespace

double mackinnon_pvalue(double statistic) {
    if (statistic > kTauMax) return 1.0;
    if (statistic < kTauMin) return 0.0;

    double z = 0.0;
    double p = 1.0;
    if (statistic <= kTauStar) {
        for (double c : kSmallP) { z += c * p; p *= statistic; }
    } else {
        for (double c : kLargeP) { z += c * p; p *= statistic; }
    }
    static const boost::math::normal_distribution<double> unit;
    return boost::math::cdf(unit, z);
}

AdfResult compute_adf_test(const Series& s, std::optional<std::size_t> maxlag_opt) {
    std::vector<double> x;
    x.reserve(s.size());
    for (const auto& p : s) {
        if (!is_missing(p.value)) x.push_back(p.value);
    }

    const std::size_t n = x.size();
    if (n < kAdfMinObservations) return {};

    const auto [lo, hi] = std::minmax_element(x.begin(), x.end());
    if (*lo == *hi) {
        std::cerr << "[analytics] adf: constant series, no test\n";
        return {};
    }

    const auto cap = static_cast<std::ptrdiff_t>(n / 2) - 2;
    if (cap < 0) return {};
    std::size_t maxlag = maxlag_opt
        ? *maxlag_opt
        : static_cast<std::size_t>(std::ceil(12.0 * std::pow(static_cast<double>(n) / 100.0, 0.25)));
    maxlag = std::min(maxlag, static_cast<std::size_t>(cap));

    std::vector<double> dx(n - 1);
    for (std::size_t i = 0; i + 1 < n; ++i) dx[i] = x[i + 1] - x[i];

    // Lag selection on the common sample trimmed by maxlag
    Eigen::MatrixXd X;
    Eigen::VectorXd y;
    build_design(x, dx, maxlag, maxlag, X, y);

    std::size_t best_lag = 0;
    double best_aic = std::numeric_limits<double>::infinity();
    for (std::size_t lag = 0; lag <= maxlag; ++lag) {
        // level, `lag` diff lags, then the constant
        Eigen::MatrixXd Xl(X.rows(), static_cast<Eigen::Index>(lag + 2));
        Xl.leftCols(static_cast<Eigen::Index>(lag + 1)) = X.leftCols(static_cast<Eigen::Index>(lag + 1));
        Xl.col(static_cast<Eigen::Index>(lag + 1)) = X.col(X.cols() - 1);
        const OlsFit fit = ols(Xl, y);
        if (!fit.ok || fit.ssr <= 0.0) continue;
        const double a = aic(fit, Xl.rows(), Xl.cols());
        if (a < best_aic) {
            best_aic = a;
            best_lag = lag;
        }
    }
    if (!std::isfinite(best_aic)) {
        std::cerr << "[analytics] adf: lag selection failed\n";
        return {};
    }

    // Final regression on the longest sample the chosen lag allows
    build_design(x, dx, best_lag, best_lag, X, y);
    const OlsFit fit = ols(X, y);
    const Eigen::Index k = X.cols();
    const Eigen::Index nobs = X.rows();
    if (!fit.ok || nobs <= k) {
        std::cerr << "[analytics] adf: regression failed\n";
        return {};
    }

    const double sigma2 = fit.ssr / static_cast<double>(nobs - k);
    const double se = std::sqrt(sigma2 * fit.xtx_inv(0, 0));
    const double stat = fit.beta(0) / se;
    if (!std::isfinite(stat)) {
        std::cerr << "[analytics] adf: degenerate statistic\n";
        return {};
    }

    AdfResult r;
    r.statistic = stat;
    r.p_value = mackinnon_pvalue(stat);
    r.is_stationary = r.p_value < 0.05;
    r.used_lag = best_lag;
    r.nobs = static_cast<std::size_t>(nobs);

    const double inv_t = 1.0 / static_cast<double>(nobs);
    for (const auto& row : kCrit) {
        r.critical_values[row.level] =
            row.b[0] + row.b[1] * inv_t + row.b[2] * inv_t * inv_t + row.b[3] * inv_t * inv_t * inv_t;
    }
    return r;
}
