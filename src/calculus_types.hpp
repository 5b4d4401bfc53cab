#ifndef CALCULUS_TYPES_HPP
#define CALCULUS_TYPES_HPP

#include <QString>
#include <QVector>
#include <cmath>

//! One (x, y) point of a sampled function
struct Sample
{
    double x = 0.0;
    double y = 0.0;
};

Q_DECLARE_TYPEINFO(Sample, Q_PRIMITIVE_TYPE);

typedef QVector<Sample> SampleList;

/**
 * @brief Value of a numerical operation that may have failed
 *
 * An empty error string means the value can be trusted.
 */
struct CalculationResult
{
    double value = 0.0;
    QString error;

    bool hasError() const { return !error.isEmpty(); }
};

//! Visual bar for one Riemann subinterval
struct RiemannRectangle
{
    double x = 0.0;       // Left edge of the subinterval
    double y = 0.0;       // Bottom of the bar: min(0, height)
    double width = 0.0;
    double height = 0.0;  // Magnitude of the function value
};

Q_DECLARE_TYPEINFO(RiemannRectangle, Q_PRIMITIVE_TYPE);

struct RiemannSumResult
{
    double value = 0.0;
    QVector<RiemannRectangle> rectangles;

    //! Subintervals dropped because the midpoint could not be evaluated
    int skippedSubintervals = 0;
};

/**
 * @brief Outcome of a two-sided limit estimate
 *
 * A has* flag set to false means the matching value is absent.
 */
struct LimitResult
{
    bool hasLeftLimit = false;
    double leftLimit = 0.0;

    bool hasRightLimit = false;
    double rightLimit = 0.0;

    bool hasLimit = false;
    double limit = 0.0;

    bool exists = false;
};

/**
 * @brief A straight line through a point of the curve
 *
 * A non-finite slope denotes the vertical line x = point.x.
 */
struct Line
{
    double slope = 0.0;
    double intercept = 0.0;
    QString equation;
    Sample point;

    //! f(x0) could not be evaluated; the other fields are placeholders
    QString error;

    //! f'(x0) could not be estimated; the line is drawn with slope 0
    QString warning;

    bool isVertical() const { return !std::isfinite(slope); }
    bool hasError() const { return !error.isEmpty(); }
    bool hasWarning() const { return !warning.isEmpty(); }
};

#endif // CALCULUS_TYPES_HPP
