#include "limit_estimator.hpp"
#include <QDebug>

namespace
{
const double APPROACH_STEPS[] = { 0.1, 0.01, 0.001, 0.0001 };
}

LimitResult LimitEstimator::limit(const QString& formula, double a, double epsilon)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        qWarning() << "Limit unavailable:" << parser.getError();
        return LimitResult();
    }

    return limit(parser, a, epsilon);
}

LimitResult LimitEstimator::limit(const MathExpressionParser& expression, double a, double epsilon)
{
    LimitResult result;

    // Approach from both sides; later (smaller) steps overwrite earlier ones
    for (double step : APPROACH_STEPS)
    {
        double leftVal = 0.0;
        if (expression.evaluate(a - step, leftVal) && std::isfinite(leftVal))
        {
            result.leftLimit = leftVal;
            result.hasLeftLimit = true;
        }

        double rightVal = 0.0;
        if (expression.evaluate(a + step, rightVal) && std::isfinite(rightVal))
        {
            result.rightLimit = rightVal;
            result.hasRightLimit = true;
        }
    }

    if (result.hasLeftLimit && result.hasRightLimit)
    {
        if (std::fabs(result.leftLimit - result.rightLimit) < epsilon)
        {
            result.limit = (result.leftLimit + result.rightLimit) / 2.0;
            result.hasLimit = true;
            result.exists = true;
        }
    }
    else if (result.hasLeftLimit)
    {
        result.limit = result.leftLimit;
        result.hasLimit = true;
    }
    else if (result.hasRightLimit)
    {
        result.limit = result.rightLimit;
        result.hasLimit = true;
    }

    return result;
}
