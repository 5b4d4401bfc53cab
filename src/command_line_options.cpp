#include "command_line_options.hpp"
#include "math_expression_parser.hpp"
#include <QFileInfo>
#include <QSettings>
#include <cmath>

CommandLineOptions::CommandLineOptions()
    : helpOption(parser.addHelpOption()),
      versionOption(parser.addVersionOption()),
      modeOption(QStringList() << "m" << "mode",
                 "evaluate, points, derivative, integral, limit, tangent or report.",
                 "mode", "report"),
      atOption("at", "Point of interest and limit target.", "value"),
      fromOption("from", "Range start or lower integral bound.", "value"),
      toOption("to", "Range end or upper integral bound.", "value"),
      stepsOption(QStringList() << "n" << "steps", "Sample or subinterval count.", "count"),
      methodOption("method", "Integration method: simpson, trapezoidal or riemann.", "name"),
      configOption(QStringList() << "c" << "config", "INI file with default settings.", "file"),
      presetsOption("presets", "List preset functions and exit."),
      explicitRange(false)
{
    parser.setApplicationDescription("Numerical calculus for single-variable formulas in x");
    parser.addPositionalArgument("expression",
                                 "Formula in x, e.g. \"x^2 + 3*x - 5\". "
                                 "Put -- before a formula that starts with '-'.");

    parser.addOption(modeOption);
    parser.addOption(atOption);
    parser.addOption(fromOption);
    parser.addOption(toOption);
    parser.addOption(stepsOption);
    parser.addOption(methodOption);
    parser.addOption(configOption);
    parser.addOption(presetsOption);
}

QStringList CommandLineOptions::modes()
{
    return QStringList() << "evaluate" << "points" << "derivative" << "integral"
                         << "limit" << "tangent" << "report";
}

CommandLineOptions::Status CommandLineOptions::resolve(const QStringList& arguments)
{
    mode.clear();
    expression.clear();
    settings = CalculusSettings();
    explicitRange = false;
    errorText.clear();

    if (!parser.parse(arguments))
    {
        return fail(parser.errorText());
    }

    if (parser.isSet(helpOption))
    {
        return SHOW_HELP;
    }
    if (parser.isSet(versionOption))
    {
        return SHOW_VERSION;
    }
    if (parser.isSet(presetsOption))
    {
        return LIST_PRESETS;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1)
    {
        return fail("Expected exactly one expression");
    }

    mode = parser.value(modeOption).trimmed().toLower();
    if (!modes().contains(mode))
    {
        return fail(QString("Unknown mode: %1").arg(mode));
    }

    // Built-in defaults, then the settings file, then the command line
    if (parser.isSet(configOption))
    {
        const QString path = parser.value(configOption);
        if (!QFileInfo::exists(path))
        {
            return fail(QString("Settings file not found: %1").arg(path));
        }

        QSettings store(path, QSettings::IniFormat);
        settings = CalculusSettings::load(store);
    }

    const bool rangeMode = (mode == "points" || mode == "derivative");

    if (!readDouble(atOption, settings.pointOfInterest) ||
        !readDouble(atOption, settings.limitTarget) ||
        !readDouble(fromOption, rangeMode ? settings.xMin : settings.integralLower) ||
        !readDouble(toOption, rangeMode ? settings.xMax : settings.integralUpper))
    {
        return FAILED;
    }

    int& steps = (mode == "points")       ? settings.plotSteps
                 : (mode == "derivative") ? settings.derivativeSteps
                                          : settings.subdivisions;
    if (!readCount(stepsOption, steps))
    {
        return FAILED;
    }

    if (parser.isSet(methodOption) &&
        !IntegralEstimator::methodFromName(parser.value(methodOption), settings.integrationMethod))
    {
        return fail(QString("Unknown integration method: %1").arg(parser.value(methodOption)));
    }

    explicitRange = parser.isSet(fromOption) || parser.isSet(toOption) || parser.isSet(stepsOption);

    MathExpressionParser validator;
    if (!validator.parse(positional.first()))
    {
        return fail(validator.getError());
    }

    expression = positional.first();
    return PROCEED;
}

CommandLineOptions::Status CommandLineOptions::fail(const QString& message)
{
    errorText = message;
    return FAILED;
}

bool CommandLineOptions::readDouble(const QCommandLineOption& option, double& value)
{
    if (!parser.isSet(option))
    {
        return true;
    }

    bool ok = false;
    double parsed = parser.value(option).toDouble(&ok);
    if (!ok || !std::isfinite(parsed))
    {
        fail(QString("Invalid number for --%1: %2").arg(option.names().last(), parser.value(option)));
        return false;
    }

    value = parsed;
    return true;
}

bool CommandLineOptions::readCount(const QCommandLineOption& option, int& value)
{
    if (!parser.isSet(option))
    {
        return true;
    }

    bool ok = false;
    int parsed = parser.value(option).toInt(&ok);
    if (!ok || parsed <= 0)
    {
        fail(QString("Invalid count for --%1: %2").arg(option.names().last(), parser.value(option)));
        return false;
    }

    value = parsed;
    return true;
}
