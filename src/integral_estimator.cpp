#include "integral_estimator.hpp"
#include "point_sampler.hpp"
#include <QDebug>

namespace
{
CalculationResult failure(const QString& reason)
{
    CalculationResult result;
    result.value = 0.0;
    result.error = reason;
    return result;
}
}

CalculationResult IntegralEstimator::integral(const QString& formula, double a, double b, int n)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        qWarning() << "Integral unavailable:" << parser.getError();
        return failure("integral unavailable");
    }

    return integral(parser, a, b, n);
}

/**
 * @brief Composite Simpson's rule
 *
 * Weights over the n + 1 points: 1 at both ends, 4 at odd indices and
 * 2 at even interior indices.
 *
 *   integral ~ (h / 3) * (f0 + 4 f1 + 2 f2 + 4 f3 + ... + 4 f(n-1) + fn)
 */
CalculationResult IntegralEstimator::integral(const MathExpressionParser& expression, double a, double b, int n)
{
    if (n <= 0)
    {
        return failure("invalid subinterval count");
    }

    const qint64 count = simpsonSubintervals(n);
    const double h = (b - a) / count;

    double fa = 0.0;
    double fb = 0.0;
    if (!expression.evaluate(a, fa) || !expression.evaluate(b, fb))
    {
        return failure("integral unavailable");
    }

    double sum = fa + fb;

    for (qint64 i = 1; i < count; ++i)
    {
        double fx = 0.0;
        if (!expression.evaluate(a + i * h, fx))
        {
            return failure("integral unavailable");
        }

        const double coefficient = (i % 2 == 0) ? 2.0 : 4.0;
        sum += coefficient * fx;
    }

    CalculationResult result;
    result.value = (h / 3.0) * sum;
    return result;
}

qint64 IntegralEstimator::simpsonSubintervals(int n)
{
    qint64 count = n;
    if (count % 2 != 0)
    {
        count++;
    }

    return count;
}

CalculationResult IntegralEstimator::trapezoidal(const QString& formula, double a, double b, int n)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        qWarning() << "Integral unavailable:" << parser.getError();
        return failure("integral unavailable");
    }

    return trapezoidal(parser, a, b, n);
}

CalculationResult IntegralEstimator::trapezoidal(const MathExpressionParser& expression, double a, double b, int n)
{
    if (n <= 0)
    {
        return failure("invalid subinterval count");
    }

    const double h = (b - a) / n;

    double fa = 0.0;
    double fb = 0.0;
    if (!expression.evaluate(a, fa) || !expression.evaluate(b, fb))
    {
        return failure("integral unavailable");
    }

    double interior = 0.0;
    for (int i = 1; i < n; ++i)
    {
        double fx = 0.0;
        if (!expression.evaluate(a + i * h, fx))
        {
            return failure("integral unavailable");
        }
        interior += fx;
    }

    CalculationResult result;
    result.value = (h / 2.0) * (fa + 2.0 * interior + fb);
    return result;
}

RiemannSumResult IntegralEstimator::riemannSum(const QString& formula, double a, double b, int n)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        RiemannSumResult empty;
        empty.skippedSubintervals = qMax(n, 0);
        return empty;
    }

    return riemannSum(parser, a, b, n);
}

RiemannSumResult IntegralEstimator::riemannSum(const MathExpressionParser& expression, double a, double b, int n)
{
    RiemannSumResult result;
    if (n <= 0)
    {
        return result;
    }

    const double dx = (b - a) / n;
    result.rectangles.reserve(qMin(n, PointSampler::RESERVE_LIMIT));

    for (int i = 0; i < n; ++i)
    {
        const double x = a + i * dx;

        // Midpoint rule
        double height = 0.0;
        if (!expression.evaluate(x + dx / 2.0, height))
        {
            result.skippedSubintervals++;
            continue;
        }

        result.value += height * dx;

        RiemannRectangle rectangle;
        rectangle.x = x;
        rectangle.y = qMin(0.0, height);
        rectangle.width = dx;
        rectangle.height = std::fabs(height);
        result.rectangles.append(rectangle);
    }

    return result;
}

CalculationResult IntegralEstimator::integrate(const QString& formula, double a, double b, int n, Method method)
{
    switch (method)
    {
    case SIMPSON:
        return integral(formula, a, b, n);

    case TRAPEZOIDAL:
        return trapezoidal(formula, a, b, n);

    case RIEMANN_MIDPOINT:
    {
        if (n <= 0)
        {
            return failure("invalid subinterval count");
        }

        MathExpressionParser parser;
        if (!parser.parse(formula))
        {
            qWarning() << "Integral unavailable:" << parser.getError();
            return failure("integral unavailable");
        }

        RiemannSumResult riemann = riemannSum(parser, a, b, n);
        if (riemann.rectangles.isEmpty())
        {
            return failure("integral unavailable");
        }

        CalculationResult result;
        result.value = riemann.value;
        return result;
    }
    }

    return failure("unknown integration method");
}

QString IntegralEstimator::methodName(Method method)
{
    switch (method)
    {
    case SIMPSON:
        return "simpson";
    case TRAPEZOIDAL:
        return "trapezoidal";
    case RIEMANN_MIDPOINT:
        return "riemann";
    }

    return QString();
}

bool IntegralEstimator::methodFromName(const QString& name, Method& method)
{
    const QString key = name.trimmed().toLower();

    if (key == "simpson")
    {
        method = SIMPSON;
        return true;
    }
    if (key == "trapezoidal")
    {
        method = TRAPEZOIDAL;
        return true;
    }
    if (key == "riemann")
    {
        method = RIEMANN_MIDPOINT;
        return true;
    }

    return false;
}
