#include "calculus_settings.hpp"
#include "command_line_options.hpp"
#include "derivative_estimator.hpp"
#include "integral_estimator.hpp"
#include "limit_estimator.hpp"
#include "math_expression_parser.hpp"
#include "point_sampler.hpp"
#include "preset_functions.hpp"
#include "tangent_line_builder.hpp"

#include <QCoreApplication>
#include <QTextStream>

namespace
{
QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString formatValue(double value)
{
    return QString::number(value, 'g', 10);
}

QString formatOptional(bool present, double value)
{
    return present ? formatValue(value) : QString("none");
}

void printSamples(const SampleList& samples)
{
    for (const Sample& sample : samples)
    {
        out() << formatValue(sample.x) << "\t" << formatValue(sample.y) << "\n";
    }
}

void printLine(const QString& title, const Line& line)
{
    if (line.hasError())
    {
        out() << title << ": unavailable (" << line.error << ")\n";
        return;
    }

    out() << title << ": " << line.equation;
    if (line.hasWarning())
    {
        out() << " (" << line.warning << ", slope taken as 0)";
    }
    out() << "\n";
}

void printLimit(const QString& expression, double target, double epsilon)
{
    LimitResult limit = LimitEstimator::limit(expression, target, epsilon);
    out() << "limit x->" << formatValue(target) << ": " << formatOptional(limit.hasLimit, limit.limit)
          << (limit.exists ? " (exists)" : " (does not exist)") << "\n";
    out() << "  left:  " << formatOptional(limit.hasLeftLimit, limit.leftLimit) << "\n";
    out() << "  right: " << formatOptional(limit.hasRightLimit, limit.rightLimit) << "\n";
}

void printIntegral(const QString& expression, const CalculusSettings& settings)
{
    CalculationResult integral = IntegralEstimator::integrate(expression,
                                                              settings.integralLower,
                                                              settings.integralUpper,
                                                              settings.subdivisions,
                                                              settings.integrationMethod);

    out() << "integral [" << formatValue(settings.integralLower) << ", " << formatValue(settings.integralUpper)
          << "] (" << IntegralEstimator::methodName(settings.integrationMethod) << ", n="
          << settings.subdivisions << "): ";
    if (integral.hasError())
    {
        out() << "unavailable (" << integral.error << ")\n";
    }
    else
    {
        out() << formatValue(integral.value) << "\n";
    }
}

// Full analysis at the point of interest, mirroring what a front end shows
void printReport(const QString& expression, const CalculusSettings& settings)
{
    const double x0 = settings.pointOfInterest;

    double value = 0.0;
    ExpressionError error;
    if (MathExpressionParser::evaluateFormula(expression, x0, value, &error))
    {
        out() << "f(" << formatValue(x0) << ") = " << formatValue(value) << "\n";
    }
    else
    {
        out() << "f(" << formatValue(x0) << ") unavailable: " << error.getMessage() << "\n";
    }

    CalculationResult slope = DerivativeEstimator::derivative(expression, x0, settings.derivativeStep);
    out() << "f'(" << formatValue(x0) << ") = "
          << (slope.hasError() ? slope.error : formatValue(slope.value)) << "\n";

    printLine("tangent", TangentLineBuilder::tangentLine(expression, x0));
    printLine("normal", TangentLineBuilder::normalLine(expression, x0));
    printIntegral(expression, settings);

    RiemannSumResult riemann = IntegralEstimator::riemannSum(expression,
                                                             settings.integralLower,
                                                             settings.integralUpper,
                                                             settings.riemannRectangleCount());
    out() << "riemann midpoint sum: " << formatValue(riemann.value) << " (" << riemann.rectangles.size()
          << " rectangles, " << riemann.skippedSubintervals << " skipped)\n";

    printLimit(expression, settings.limitTarget, settings.limitEpsilon);

    SampleList points = PointSampler::generatePoints(expression, settings.xMin, settings.xMax, settings.plotSteps);
    out() << "plot samples: " << points.size() << " of " << (qint64(settings.plotSteps) + 1) << " in ["
          << formatValue(settings.xMin) << ", " << formatValue(settings.xMax) << "]\n";
}
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("calcscope");
    QCoreApplication::setApplicationVersion("1.0.0");

    CommandLineOptions options;
    switch (options.resolve(QCoreApplication::arguments()))
    {
    case CommandLineOptions::PROCEED:
        break;

    case CommandLineOptions::SHOW_HELP:
        out() << options.helpText();
        return 0;

    case CommandLineOptions::SHOW_VERSION:
        out() << QCoreApplication::applicationName() << " " << QCoreApplication::applicationVersion() << "\n";
        return 0;

    case CommandLineOptions::LIST_PRESETS:
        for (const PresetFunctions::Preset& preset : PresetFunctions::all())
        {
            out() << preset.name << "\t" << preset.expression << "\n";
        }
        return 0;

    case CommandLineOptions::FAILED:
        err() << options.getError() << Qt::endl;
        return 1;
    }

    const QString mode = options.getMode();
    const QString expression = options.getExpression();
    CalculusSettings settings = options.getSettings();

    MathExpressionParser parser;
    if (!parser.parse(expression))
    {
        err() << parser.getError() << Qt::endl;
        return 1;
    }

    if (mode == "evaluate")
    {
        double value = 0.0;
        ExpressionError error;
        if (!parser.evaluate(settings.pointOfInterest, value, &error))
        {
            err() << error.toString() << Qt::endl;
            return 1;
        }
        out() << formatValue(value) << "\n";
    }
    else if (mode == "points")
    {
        printSamples(PointSampler::generatePoints(parser, settings.xMin, settings.xMax, settings.plotSteps));
    }
    else if (mode == "derivative")
    {
        if (options.hasExplicitRange())
        {
            printSamples(DerivativeEstimator::derivativePoints(parser, settings.xMin, settings.xMax,
                                                               settings.derivativeSteps, settings.derivativeStep));
        }
        else
        {
            CalculationResult slope = DerivativeEstimator::derivative(parser, settings.pointOfInterest,
                                                                      settings.derivativeStep);
            if (slope.hasError())
            {
                err() << slope.error << Qt::endl;
                return 1;
            }
            out() << formatValue(slope.value) << "\n";
        }
    }
    else if (mode == "integral")
    {
        printIntegral(expression, settings);
    }
    else if (mode == "limit")
    {
        printLimit(expression, settings.limitTarget, settings.limitEpsilon);
    }
    else if (mode == "tangent")
    {
        printLine("tangent", TangentLineBuilder::tangentLine(expression, settings.pointOfInterest));
        printLine("normal", TangentLineBuilder::normalLine(expression, settings.pointOfInterest));
    }
    else
    {
        printReport(expression, settings);
    }

    out().flush();
    return 0;
}
