#ifndef FUNCTION_TRACE_HPP
#define FUNCTION_TRACE_HPP

#include "calculus_types.hpp"
#include <QMutex>
#include <QSharedPointer>
#include <QString>

/**
 * @brief The FunctionTrace class holds a sampled curve for one formula
 *
 * A trace is either the function itself or its numerical derivative. It
 * stores:
 * - A display label
 * - The formula the samples were computed from
 * - The computed sample points, in increasing x order
 *
 * Sample access is guarded so a trace can be filled by a worker thread
 * while the owner reads it.
 */
class FunctionTrace
{
public:
    enum Kind
    {
        FUNCTION_TRACE,
        DERIVATIVE_TRACE
    };

    /**
     * @brief Create an empty trace
     * @param label Name for this trace (e.g., "f(x)")
     * @param expression Formula the trace is computed from (e.g., "sin(x)")
     * @param kind Whether the samples are f(x) or f'(x)
     */
    FunctionTrace(QString label, QString expression, Kind kind = FUNCTION_TRACE);

    virtual ~FunctionTrace();

    QString getLabel() const { return label; }
    QString getExpression() const { return expression; }
    Kind getKind() const { return kind; }

    /**
     * @brief Append a computed point
     */
    void addData(double x, double y);

    /**
     * @brief Remove all points
     */
    void clearData();

    /**
     * @brief Snapshot of the current points
     */
    SampleList getSamples() const;

    int size() const;
    bool hasData() const { return size() > 0; }

private:
    QString label;
    QString expression;
    Kind kind;

    mutable QMutex dataMutex;
    SampleList samples;
};

typedef QSharedPointer<FunctionTrace> FunctionTracePointer;

#endif // FUNCTION_TRACE_HPP
