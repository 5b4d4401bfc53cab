#ifndef FUNCTION_TRACE_COMPUTER_HPP
#define FUNCTION_TRACE_COMPUTER_HPP

#include <QObject>
#include <QMutex>
#include <QAtomicInt>
#include "function_trace.hpp"
#include "derivative_estimator.hpp"

/**
 * @brief The FunctionTraceComputer class samples a formula in the background
 *
 * Intended to be moved to a worker QThread. For each of stepCount + 1
 * evenly spaced x values it:
 * 1. Evaluates the formula and appends finite results to the function trace
 * 2. Optionally estimates f'(x) and appends it to the derivative trace
 *
 * Points that fail to evaluate are skipped, leaving gaps in the traces.
 */
class FunctionTraceComputer : public QObject
{
    Q_OBJECT

public:
    FunctionTraceComputer();
    virtual ~FunctionTraceComputer();

    /**
     * @brief Set up a computation (call before startComputation())
     * @param expression Formula to sample
     * @param xMin Start of the range (inclusive)
     * @param xMax End of the range (inclusive)
     * @param stepCount Number of intervals between xMin and xMax
     * @param functionTrace Trace to populate with f(x)
     * @param derivativeTrace Optional trace to populate with f'(x)
     * @param derivativeStep Forward-difference step for the derivative
     */
    void compute(const QString& expression,
                 double xMin,
                 double xMax,
                 int stepCount,
                 FunctionTracePointer functionTrace,
                 FunctionTracePointer derivativeTrace = FunctionTracePointer(),
                 double derivativeStep = DerivativeEstimator::DEFAULT_STEP);

    /**
     * @brief Whole percentage of points done before index, in 64-bit arithmetic
     */
    static int progressPercent(qint64 index, qint64 totalPoints);

signals:
    /**
     * @brief Emitted when computation starts
     */
    void computationStarted();

    /**
     * @brief Emitted periodically during computation to report progress
     * @param progress Progress percentage (0-100)
     */
    void progressUpdated(int progress);

    /**
     * @brief Emitted when computation completes successfully
     */
    void computationComplete();

    /**
     * @brief Emitted when computation fails
     * @param error Error message
     */
    void computationFailed(QString error);

public slots:
    /**
     * @brief Start the computation (call this from the worker thread)
     */
    void startComputation();

    /**
     * @brief Cancel ongoing computation
     */
    void cancelComputation();

private:
    QString currentExpression;
    double currentXMin;
    double currentXMax;
    int currentStepCount;
    double currentDerivativeStep;
    FunctionTracePointer currentFunctionTrace;
    FunctionTracePointer currentDerivativeTrace;

    QMutex computeMutex;
    QAtomicInt cancelRequested;
};

#endif // FUNCTION_TRACE_COMPUTER_HPP
