#ifndef INTEGRAL_ESTIMATOR_HPP
#define INTEGRAL_ESTIMATOR_HPP

#include "calculus_types.hpp"
#include "math_expression_parser.hpp"

/**
 * @brief The IntegralEstimator class approximates definite integrals
 *
 * Three composite quadrature rules are available:
 * - Simpson's rule (parabolic segments, needs an even subinterval count)
 * - Trapezoidal rule (linear segments)
 * - Midpoint Riemann sum (also yields rectangles for visualization)
 */
class IntegralEstimator
{
public:
    enum Method
    {
        SIMPSON,
        TRAPEZOIDAL,
        RIEMANN_MIDPOINT
    };

    /**
     * @brief Composite Simpson's rule over [a, b]
     * @param n Subinterval count; odd values are bumped to the next even number
     * @return The estimate, or an error result if any point fails to evaluate
     */
    static CalculationResult integral(const QString& formula, double a, double b, int n);
    static CalculationResult integral(const MathExpressionParser& expression, double a, double b, int n);

    //! Even subinterval count Simpson's rule uses for n (64-bit so INT_MAX rounds up)
    static qint64 simpsonSubintervals(int n);

    /**
     * @brief Composite trapezoidal rule over [a, b]
     *
     * (h/2) * (f(a) + 2 * sum(f(interior)) + f(b))
     */
    static CalculationResult trapezoidal(const QString& formula, double a, double b, int n);
    static CalculationResult trapezoidal(const MathExpressionParser& expression, double a, double b, int n);

    /**
     * @brief Midpoint Riemann sum over [a, b] with n equal subintervals
     *
     * Subintervals whose midpoint fails to evaluate are left out of both
     * the sum and the rectangle list; the width of the remaining bars is
     * not adjusted. skippedSubintervals reports how many were dropped.
     */
    static RiemannSumResult riemannSum(const QString& formula, double a, double b, int n);
    static RiemannSumResult riemannSum(const MathExpressionParser& expression, double a, double b, int n);

    /**
     * @brief Integrate with the selected method
     */
    static CalculationResult integrate(const QString& formula, double a, double b, int n, Method method);

    static QString methodName(Method method);

    /**
     * @brief Convert "simpson", "trapezoidal" or "riemann" to a Method
     * @return false if the name is not recognized
     */
    static bool methodFromName(const QString& name, Method& method);
};

#endif // INTEGRAL_ESTIMATOR_HPP
