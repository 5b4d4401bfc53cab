#include "function_trace_computer.hpp"
#include "math_expression_parser.hpp"
#include "point_sampler.hpp"
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QDebug>

FunctionTraceComputer::FunctionTraceComputer()
    : currentXMin(0.0),
      currentXMax(0.0),
      currentStepCount(0),
      currentDerivativeStep(DerivativeEstimator::DEFAULT_STEP),
      cancelRequested(0)
{
}

FunctionTraceComputer::~FunctionTraceComputer()
{
}

/**
 * @brief Set up computation parameters (call from main thread before starting worker thread)
 */
void FunctionTraceComputer::compute(const QString& expression,
                                    double xMin,
                                    double xMax,
                                    int stepCount,
                                    FunctionTracePointer functionTrace,
                                    FunctionTracePointer derivativeTrace,
                                    double derivativeStep)
{
    QMutexLocker locker(&computeMutex);

    currentExpression = expression;
    currentXMin = xMin;
    currentXMax = xMax;
    currentStepCount = stepCount;
    currentFunctionTrace = functionTrace;
    currentDerivativeTrace = derivativeTrace;
    currentDerivativeStep = derivativeStep;
    cancelRequested.storeRelaxed(0);
}

/**
 * @brief Execute the trace computation (runs in background thread)
 *
 * Algorithm:
 * 1. Parse and validate the formula once
 * 2. Check the range and output traces
 * 3. For each of the stepCount + 1 sample positions:
 *    - Evaluate f(x); keep it if finite
 *    - If a derivative trace was given, estimate f'(x); keep it if available
 * 4. Emit progress updates every 10%
 *
 * The parsed formula is immutable, so the loop never re-lexes the text.
 */
void FunctionTraceComputer::startComputation()
{
    QElapsedTimer timer;
    timer.start();

    emit computationStarted();

    QString expression;
    double xMin = 0.0;
    double xMax = 0.0;
    int stepCount = 0;
    double derivativeStep = 0.0;
    FunctionTracePointer functionTrace;
    FunctionTracePointer derivativeTrace;
    {
        QMutexLocker locker(&computeMutex);
        expression = currentExpression;
        xMin = currentXMin;
        xMax = currentXMax;
        stepCount = currentStepCount;
        derivativeStep = currentDerivativeStep;
        functionTrace = currentFunctionTrace;
        derivativeTrace = currentDerivativeTrace;
    }

    if (!functionTrace)
    {
        emit computationFailed("No output trace provided");
        return;
    }

    // Parse the formula
    MathExpressionParser parser;
    if (!parser.parse(expression))
    {
        emit computationFailed(QString("Failed to parse expression: %1").arg(parser.getError()));
        return;
    }

    if (!(xMin < xMax))
    {
        emit computationFailed(QString("Invalid range: %1 to %2").arg(xMin).arg(xMax));
        return;
    }

    if (stepCount <= 0)
    {
        emit computationFailed(QString("Invalid step count: %1").arg(stepCount));
        return;
    }

    // Clear existing data in output traces
    functionTrace->clearData();
    if (derivativeTrace)
    {
        derivativeTrace->clearData();
    }

    // Main computation loop: evaluate the formula at each sample position
    int lastProgress = -1;
    int validPoints = 0;
    int skippedPoints = 0;
    const qint64 totalPoints = qint64(stepCount) + 1;

    for (qint64 i = 0; i < totalPoints; ++i)
    {
        // Check for cancellation request from user
        if (cancelRequested.loadRelaxed())
        {
            emit computationFailed("Computation cancelled");
            return;
        }

        const double x = PointSampler::samplePosition(xMin, xMax, stepCount, i);

        double y = 0.0;
        if (parser.evaluate(x, y) && std::isfinite(y))
        {
            functionTrace->addData(x, y);
            validPoints++;
        }
        else
        {
            skippedPoints++;
        }

        if (derivativeTrace)
        {
            CalculationResult slope = DerivativeEstimator::derivative(parser, x, derivativeStep);
            if (!slope.hasError())
            {
                derivativeTrace->addData(x, slope.value);
            }
        }

        // Report progress periodically (every 10%)
        int progress = progressPercent(i, totalPoints);
        if (progress != lastProgress && progress % 10 == 0)
        {
            emit progressUpdated(progress);
            lastProgress = progress;
        }
    }

    if (validPoints == 0)
    {
        emit computationFailed(QString("Expression produced no valid results (%1 points skipped) - check for division by zero or invalid operations").arg(skippedPoints));
        return;
    }

    qDebug() << "Function trace computation complete:";
    qDebug() << "  - Time elapsed:" << timer.elapsed() << "ms";
    qDebug() << "  - Valid points:" << validPoints;
    qDebug() << "  - Skipped points:" << skippedPoints;
    if (derivativeTrace)
    {
        qDebug() << "  - Derivative points:" << derivativeTrace->size();
    }

    emit progressUpdated(100);
    emit computationComplete();
}

int FunctionTraceComputer::progressPercent(qint64 index, qint64 totalPoints)
{
    if (totalPoints <= 0)
    {
        return 100;
    }

    return int(index * 100 / totalPoints);
}

void FunctionTraceComputer::cancelComputation()
{
    cancelRequested.storeRelaxed(1);
}
