#include "calculus_settings.hpp"
#include <QSettings>
#include <QDebug>
#include <cmath>

namespace
{
// Read a double; keep the fallback and warn if the stored text is not a number
double readDouble(QSettings& settings, const QString& key, double fallback)
{
    if (!settings.contains(key))
    {
        return fallback;
    }

    bool ok = false;
    double value = settings.value(key).toDouble(&ok);
    if (!ok || !std::isfinite(value))
    {
        qWarning() << "Ignoring invalid setting" << key << "=" << settings.value(key).toString();
        return fallback;
    }

    return value;
}

// Read a strictly positive integer
int readCount(QSettings& settings, const QString& key, int fallback)
{
    if (!settings.contains(key))
    {
        return fallback;
    }

    bool ok = false;
    int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0)
    {
        qWarning() << "Ignoring invalid setting" << key << "=" << settings.value(key).toString();
        return fallback;
    }

    return value;
}

double readPositive(QSettings& settings, const QString& key, double fallback)
{
    double value = readDouble(settings, key, fallback);
    if (value <= 0.0)
    {
        qWarning() << "Ignoring non-positive setting" << key << "=" << value;
        return fallback;
    }

    return value;
}
}

CalculusSettings CalculusSettings::load(QSettings& settings)
{
    CalculusSettings defaults;
    CalculusSettings loaded;

    loaded.xMin = readDouble(settings, "plot/xMin", defaults.xMin);
    loaded.xMax = readDouble(settings, "plot/xMax", defaults.xMax);
    if (loaded.xMin >= loaded.xMax)
    {
        qWarning() << "Ignoring plot range" << loaded.xMin << "to" << loaded.xMax
                   << "- xMin must be less than xMax";
        loaded.xMin = defaults.xMin;
        loaded.xMax = defaults.xMax;
    }
    loaded.plotSteps = readCount(settings, "plot/steps", defaults.plotSteps);

    loaded.derivativeSteps = readCount(settings, "derivative/steps", defaults.derivativeSteps);
    loaded.derivativeStep = readPositive(settings, "derivative/step", defaults.derivativeStep);

    loaded.pointOfInterest = readDouble(settings, "analysis/pointOfInterest", defaults.pointOfInterest);

    loaded.integralLower = readDouble(settings, "integral/lower", defaults.integralLower);
    loaded.integralUpper = readDouble(settings, "integral/upper", defaults.integralUpper);
    loaded.subdivisions = readCount(settings, "integral/subdivisions", defaults.subdivisions);
    loaded.maxRiemannRectangles = readCount(settings, "integral/maxRectangles", defaults.maxRiemannRectangles);

    if (settings.contains("integral/method"))
    {
        QString name = settings.value("integral/method").toString();
        if (!IntegralEstimator::methodFromName(name, loaded.integrationMethod))
        {
            qWarning() << "Ignoring unknown integration method" << name;
            loaded.integrationMethod = defaults.integrationMethod;
        }
    }

    loaded.limitTarget = readDouble(settings, "limit/target", defaults.limitTarget);
    loaded.limitEpsilon = readPositive(settings, "limit/epsilon", defaults.limitEpsilon);

    return loaded;
}

void CalculusSettings::save(QSettings& settings) const
{
    settings.setValue("plot/xMin", xMin);
    settings.setValue("plot/xMax", xMax);
    settings.setValue("plot/steps", plotSteps);

    settings.setValue("derivative/steps", derivativeSteps);
    settings.setValue("derivative/step", derivativeStep);

    settings.setValue("analysis/pointOfInterest", pointOfInterest);

    settings.setValue("integral/lower", integralLower);
    settings.setValue("integral/upper", integralUpper);
    settings.setValue("integral/subdivisions", subdivisions);
    settings.setValue("integral/maxRectangles", maxRiemannRectangles);
    settings.setValue("integral/method", IntegralEstimator::methodName(integrationMethod));

    settings.setValue("limit/target", limitTarget);
    settings.setValue("limit/epsilon", limitEpsilon);
}

int CalculusSettings::riemannRectangleCount() const
{
    return qMin(subdivisions, maxRiemannRectangles);
}
