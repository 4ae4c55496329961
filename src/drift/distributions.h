#pragma once

/// @file distributions.h
/// @brief Tail probabilities used by the hypothesis-test metrics

namespace driftguard::drift {

/// @brief Regularized upper incomplete gamma function Q(a, x)
///
/// Series expansion for x < a + 1, Lentz continued fraction otherwise.
/// Returns 1.0 for x <= 0.
double RegularizedGammaQ(double a, double x);

/// @brief Survival function of the chi-squared distribution
/// @param x Chi-squared statistic
/// @param degrees_of_freedom Degrees of freedom (> 0)
/// @return P(X >= x)
double ChiSquaredSurvival(double x, double degrees_of_freedom);

/// @brief Survival function of the Kolmogorov distribution
///
/// Q_KS(z) = 2 * sum_{j>=1} (-1)^(j-1) exp(-2 j^2 z^2), evaluated with the
/// small-z Jacobi form below z = 1.18. Result is clamped to [0, 1].
double KolmogorovSurvival(double z);

}  // namespace driftguard::drift
