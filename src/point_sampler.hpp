#ifndef POINT_SAMPLER_HPP
#define POINT_SAMPLER_HPP

#include "calculus_types.hpp"
#include "math_expression_parser.hpp"

/**
 * @brief The PointSampler class evaluates a formula across a range for plotting
 *
 * Points that fail to evaluate (division by zero, domain errors) are
 * silently dropped, so the returned list may have gaps.
 */
class PointSampler
{
public:
    /**
     * @brief Sample a formula at stepCount + 1 evenly spaced points
     * @param formula The formula text
     * @param xMin First sample position (inclusive)
     * @param xMax Last sample position (inclusive)
     * @param stepCount Number of intervals between xMin and xMax
     * @return Valid samples in increasing x order (empty if the formula does not parse)
     *
     * Reversed bounds are swapped, so the order holds for xMin > xMax too.
     */
    static SampleList generatePoints(const QString& formula, double xMin, double xMax, int stepCount);

    static SampleList generatePoints(const MathExpressionParser& expression,
                                     double xMin, double xMax, int stepCount);

    /**
     * @brief Position of sample i in a range split into stepCount intervals
     */
    static double samplePosition(double xMin, double xMax, int stepCount, qint64 i);

    //! Upper bound on the capacity reserved up front for a sample list
    static constexpr int RESERVE_LIMIT = 1 << 16;
};

#endif // POINT_SAMPLER_HPP
