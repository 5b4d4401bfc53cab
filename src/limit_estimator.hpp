#ifndef LIMIT_ESTIMATOR_HPP
#define LIMIT_ESTIMATOR_HPP

#include "calculus_types.hpp"
#include "math_expression_parser.hpp"

/**
 * @brief The LimitEstimator class approximates two-sided limits numerically
 *
 * The formula is evaluated at a - s and a + s for the fixed, shrinking
 * steps s = 0.1, 0.01, 0.001, 0.0001. Each one-sided limit is the value at
 * the smallest step that evaluated to a finite number.
 */
class LimitEstimator
{
public:
    static constexpr double DEFAULT_EPSILON = 0.001;

    /**
     * @brief Estimate the limit of a formula as x approaches a
     * @param epsilon Maximum difference between the one-sided limits for
     *                the limit to be considered existing
     *
     * - Both sides close: exists = true, limit = their average
     * - Both sides but too far apart: no limit
     * - One side only: limit = that side, exists = false
     * - Neither side: everything absent
     */
    static LimitResult limit(const QString& formula, double a, double epsilon = DEFAULT_EPSILON);

    static LimitResult limit(const MathExpressionParser& expression, double a,
                             double epsilon = DEFAULT_EPSILON);
};

#endif // LIMIT_ESTIMATOR_HPP
