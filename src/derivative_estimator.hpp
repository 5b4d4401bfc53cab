#ifndef DERIVATIVE_ESTIMATOR_HPP
#define DERIVATIVE_ESTIMATOR_HPP

#include "calculus_types.hpp"
#include "math_expression_parser.hpp"

/**
 * @brief The DerivativeEstimator class approximates f'(x) by forward difference
 *
 * f'(x) ~ (f(x + h) - f(x)) / h
 *
 * The truncation error grows linearly with h.
 */
class DerivativeEstimator
{
public:
    static constexpr double DEFAULT_STEP = 1e-4;

    /**
     * @brief Estimate the derivative of a formula at x
     * @return The estimate, or {0, "derivative unavailable"} if either
     *         evaluation fails or the quotient is not finite
     */
    static CalculationResult derivative(const QString& formula, double x, double h = DEFAULT_STEP);

    static CalculationResult derivative(const MathExpressionParser& expression, double x,
                                        double h = DEFAULT_STEP);

    /**
     * @brief Sample the derivative across a range for plotting
     *
     * Uses the same stepCount + 1 positions as PointSampler; points whose
     * derivative is unavailable are dropped.
     */
    static SampleList derivativePoints(const QString& formula, double xMin, double xMax,
                                       int stepCount, double h = DEFAULT_STEP);

    static SampleList derivativePoints(const MathExpressionParser& expression, double xMin, double xMax,
                                       int stepCount, double h = DEFAULT_STEP);
};

#endif // DERIVATIVE_ESTIMATOR_HPP
