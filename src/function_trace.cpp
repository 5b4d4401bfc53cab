#include "function_trace.hpp"
#include <QMutexLocker>

FunctionTrace::FunctionTrace(QString label, QString expression, Kind kind)
    : label(label),
      expression(expression),
      kind(kind)
{
}

FunctionTrace::~FunctionTrace()
{
}

void FunctionTrace::addData(double x, double y)
{
    QMutexLocker locker(&dataMutex);

    Sample sample;
    sample.x = x;
    sample.y = y;
    samples.append(sample);
}

void FunctionTrace::clearData()
{
    QMutexLocker locker(&dataMutex);
    samples.clear();
}

SampleList FunctionTrace::getSamples() const
{
    QMutexLocker locker(&dataMutex);
    return samples;
}

int FunctionTrace::size() const
{
    QMutexLocker locker(&dataMutex);
    return samples.size();
}
