#include "derivative_estimator.hpp"
#include "point_sampler.hpp"
#include <utility>

namespace
{
const char* const DERIVATIVE_UNAVAILABLE = "derivative unavailable";

CalculationResult unavailable()
{
    CalculationResult result;
    result.value = 0.0;
    result.error = DERIVATIVE_UNAVAILABLE;
    return result;
}
}

CalculationResult DerivativeEstimator::derivative(const QString& formula, double x, double h)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        return unavailable();
    }

    return derivative(parser, x, h);
}

CalculationResult DerivativeEstimator::derivative(const MathExpressionParser& expression, double x, double h)
{
    double fxPlusH = 0.0;
    double fx = 0.0;

    if (!expression.evaluate(x + h, fxPlusH) || !expression.evaluate(x, fx))
    {
        return unavailable();
    }

    // h == 0 or an overflowing difference both end up here
    const double quotient = (fxPlusH - fx) / h;
    if (!std::isfinite(quotient))
    {
        return unavailable();
    }

    CalculationResult result;
    result.value = quotient;
    return result;
}

SampleList DerivativeEstimator::derivativePoints(const QString& formula, double xMin, double xMax,
                                                 int stepCount, double h)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        return SampleList();
    }

    return derivativePoints(parser, xMin, xMax, stepCount, h);
}

SampleList DerivativeEstimator::derivativePoints(const MathExpressionParser& expression, double xMin, double xMax,
                                                 int stepCount, double h)
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

    points.reserve(qMin(stepCount, PointSampler::RESERVE_LIMIT) + 1);

    for (qint64 i = 0; i <= stepCount; ++i)
    {
        const double x = PointSampler::samplePosition(xMin, xMax, stepCount, i);
        CalculationResult slope = derivative(expression, x, h);
        if (slope.hasError())
        {
            continue;
        }

        Sample sample;
        sample.x = x;
        sample.y = slope.value;
        points.append(sample);
    }

    return points;
}
