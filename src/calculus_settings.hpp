#ifndef CALCULUS_SETTINGS_HPP
#define CALCULUS_SETTINGS_HPP

#include "integral_estimator.hpp"

class QSettings;

/**
 * @brief The CalculusSettings struct holds default analysis parameters
 *
 * Stored in QSettings under the groups plot/, derivative/, analysis/,
 * integral/ and limit/. Values that are missing, unparsable or out of range
 * keep their built-in defaults.
 */
struct CalculusSettings
{
    // Plot range and resolution
    double xMin = -10.0;
    double xMax = 10.0;
    int plotSteps = 1000;

    // Derivative curve
    int derivativeSteps = 500;
    double derivativeStep = 1e-4;

    double pointOfInterest = 2.0;

    // Definite integral
    double integralLower = 0.0;
    double integralUpper = 4.0;
    int subdivisions = 50;
    int maxRiemannRectangles = 100;
    IntegralEstimator::Method integrationMethod = IntegralEstimator::SIMPSON;

    // Limit
    double limitTarget = 0.0;
    double limitEpsilon = 1e-3;

    /**
     * @brief Read settings, falling back to defaults for bad values
     * @param settings Source store (e.g., an INI file)
     * @return The loaded settings
     */
    static CalculusSettings load(QSettings& settings);

    /**
     * @brief Write all settings to the store
     */
    void save(QSettings& settings) const;

    /**
     * @brief Number of Riemann rectangles to draw for the current subdivisions
     */
    int riemannRectangleCount() const;
};

#endif // CALCULUS_SETTINGS_HPP
