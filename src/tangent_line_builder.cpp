#include "tangent_line_builder.hpp"
#include "derivative_estimator.hpp"
#include "math_expression_parser.hpp"
#include <limits>

Line TangentLineBuilder::tangentLine(const QString& formula, double x0)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        return unavailableLine(x0, parser.getError());
    }

    double y0 = 0.0;
    ExpressionError error;
    if (!parser.evaluate(x0, y0, &error))
    {
        return unavailableLine(x0, error.toString());
    }

    // A failed derivative leaves value 0, so the point stays exact
    CalculationResult slope = DerivativeEstimator::derivative(parser, x0);

    Line line;
    line.warning = slope.error;
    line.slope = slope.value;
    line.intercept = y0 - slope.value * x0;
    line.point.x = x0;
    line.point.y = y0;
    line.equation = formatEquation(line.slope, line.intercept);
    return line;
}

Line TangentLineBuilder::normalLine(const QString& formula, double x0)
{
    Line tangent = tangentLine(formula, x0);
    if (tangent.hasError())
    {
        return tangent;
    }

    Line normal;
    normal.point = tangent.point;
    normal.warning = tangent.warning;

    // Horizontal tangent: the normal is vertical
    if (tangent.slope == 0.0)
    {
        normal.slope = std::numeric_limits<double>::infinity();
        normal.intercept = 0.0;
        normal.equation = QString("x = %1").arg(formatNumber(x0));
        return normal;
    }

    normal.slope = -1.0 / tangent.slope;
    normal.intercept = normal.point.y - normal.slope * x0;
    normal.equation = formatEquation(normal.slope, normal.intercept);
    return normal;
}

QString TangentLineBuilder::formatEquation(double slope, double intercept)
{
    if (slope == 0.0)
    {
        return QString("y = %1").arg(formatNumber(intercept));
    }

    QString slopeTerm;
    if (slope == 1.0)
    {
        slopeTerm = "x";
    }
    else if (slope == -1.0)
    {
        slopeTerm = "-x";
    }
    else
    {
        slopeTerm = formatNumber(slope) + "x";
    }

    if (intercept >= 0.0)
    {
        return QString("y = %1 + %2").arg(slopeTerm, formatNumber(intercept));
    }

    return QString("y = %1 - %2").arg(slopeTerm, formatNumber(std::fabs(intercept)));
}

Line TangentLineBuilder::unavailableLine(double x0, const QString& reason)
{
    Line line;
    line.equation = "y = 0";
    line.point.x = x0;
    line.error = reason.isEmpty() ? QString("line unavailable") : reason;
    return line;
}

QString TangentLineBuilder::formatNumber(double value)
{
    return QString::number(value, 'f', 2);
}
