#ifndef TANGENT_LINE_BUILDER_HPP
#define TANGENT_LINE_BUILDER_HPP

#include "calculus_types.hpp"

/**
 * @brief The TangentLineBuilder class constructs tangent and normal lines at a point
 *
 * The slope comes from DerivativeEstimator, so it carries the same
 * forward-difference error.
 */
class TangentLineBuilder
{
public:
    /**
     * @brief Tangent line to the curve at x0
     *
     * point = (x0, f(x0)), slope = f'(x0), intercept = f(x0) - slope * x0.
     * If f(x0) cannot be computed the returned line has its error set and
     * reads "y = 0". If only f'(x0) fails the slope is 0 and the reason is
     * kept in Line::warning.
     */
    static Line tangentLine(const QString& formula, double x0);

    /**
     * @brief Normal line (perpendicular to the tangent) at x0
     *
     * A horizontal tangent yields the vertical line "x = x0" with an
     * infinite slope.
     */
    static Line normalLine(const QString& formula, double x0);

    /**
     * @brief Format a slope-intercept equation with two decimals
     *
     * Slopes of exactly 0, 1 and -1 get the short forms "y = b", "y = x + b"
     * and "y = -x + b".
     */
    static QString formatEquation(double slope, double intercept);

private:
    static Line unavailableLine(double x0, const QString& reason);
    static QString formatNumber(double value);
};

#endif // TANGENT_LINE_BUILDER_HPP
