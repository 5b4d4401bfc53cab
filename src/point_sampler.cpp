#include "point_sampler.hpp"
#include <utility>

SampleList PointSampler::generatePoints(const QString& formula, double xMin, double xMax, int stepCount)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        return SampleList();
    }

    return generatePoints(parser, xMin, xMax, stepCount);
}

SampleList PointSampler::generatePoints(const MathExpressionParser& expression,
                                        double xMin, double xMax, int stepCount)
{
    SampleList points;
    if (stepCount < 0)
    {
        return points;
    }

    if (xMin > xMax)
    {
        std::swap(xMin, xMax);
    }

    points.reserve(qMin(stepCount, RESERVE_LIMIT) + 1);

    // 64-bit index: i <= stepCount must terminate for stepCount == INT_MAX
    for (qint64 i = 0; i <= stepCount; ++i)
    {
        Sample sample;
        sample.x = samplePosition(xMin, xMax, stepCount, i);

        // Skip invalid points
        if (!expression.evaluate(sample.x, sample.y) || !std::isfinite(sample.y))
        {
            continue;
        }

        points.append(sample);
    }

    return points;
}

double PointSampler::samplePosition(double xMin, double xMax, int stepCount, qint64 i)
{
    if (stepCount <= 0)
    {
        return xMin;
    }

    const double stepSize = (xMax - xMin) / stepCount;
    return xMin + i * stepSize;
}
