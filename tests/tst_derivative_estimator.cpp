#include <QtTest>

#include "derivative_estimator.hpp"

class TestDerivativeEstimator : public QObject
{
    Q_OBJECT

private slots:
    void estimatesSlope_data();
    void estimatesSlope();
    void forwardDifferenceUsesStep();
    void reportsUnavailableDerivative_data();
    void reportsUnavailableDerivative();
    void samplesDerivativeCurve();
    void derivativeCurveSkipsUnavailablePoints();
    void derivativeCurveWithReversedBounds();
};

void TestDerivativeEstimator::estimatesSlope_data()
{
    QTest::addColumn<QString>("formula");
    QTest::addColumn<double>("x");
    QTest::addColumn<double>("expected");

    QTest::newRow("parabola") << "x^2" << 2.0 << 4.0;
    QTest::newRow("sine at zero") << "sin(x)" << 0.0 << 1.0;
    QTest::newRow("exponential") << "exp(x)" << 1.0 << M_E;
    QTest::newRow("line") << "3*x - 7" << -5.0 << 3.0;
    QTest::newRow("cubic") << "x^3 - 3*x^2 + 2*x" << 0.0 << 2.0;
}

void TestDerivativeEstimator::estimatesSlope()
{
    QFETCH(QString, formula);
    QFETCH(double, x);
    QFETCH(double, expected);

    CalculationResult result = DerivativeEstimator::derivative(formula, x);
    QVERIFY2(!result.hasError(), qPrintable(result.error));
    QVERIFY(std::fabs(result.value - expected) < 1e-3);
}

void TestDerivativeEstimator::forwardDifferenceUsesStep()
{
    // (f(2 + h) - f(2)) / h = 4 + h for x^2
    CalculationResult coarse = DerivativeEstimator::derivative("x^2", 2.0, 0.5);
    QVERIFY(!coarse.hasError());
    QVERIFY(std::fabs(coarse.value - 4.5) < 1e-12);
}

void TestDerivativeEstimator::reportsUnavailableDerivative_data()
{
    QTest::addColumn<QString>("formula");
    QTest::addColumn<double>("x");
    QTest::addColumn<double>("h");

    QTest::newRow("outside domain") << "sqrt(x)" << -1.0 << DerivativeEstimator::DEFAULT_STEP;
    QTest::newRow("pole") << "1/x" << 0.0 << DerivativeEstimator::DEFAULT_STEP;
    QTest::newRow("zero step") << "x^2" << 1.0 << 0.0;
    QTest::newRow("parse failure") << "x^" << 1.0 << DerivativeEstimator::DEFAULT_STEP;
}

void TestDerivativeEstimator::reportsUnavailableDerivative()
{
    QFETCH(QString, formula);
    QFETCH(double, x);
    QFETCH(double, h);

    CalculationResult result = DerivativeEstimator::derivative(formula, x, h);
    QVERIFY(result.hasError());
    QCOMPARE(result.error, QString("derivative unavailable"));
    QVERIFY(result.value == 0.0);
}

void TestDerivativeEstimator::samplesDerivativeCurve()
{
    SampleList points = DerivativeEstimator::derivativePoints("x^2", 0.0, 2.0, 2);

    QCOMPARE(points.size(), 3);
    for (const Sample& point : points)
    {
        QVERIFY(std::fabs(point.y - 2.0 * point.x) < 1e-3);
    }
    QVERIFY(points[2].x == 2.0);
}

void TestDerivativeEstimator::derivativeCurveSkipsUnavailablePoints()
{
    MathExpressionParser parser;
    QVERIFY(parser.parse("sqrt(x)"));

    SampleList points = DerivativeEstimator::derivativePoints(parser, -1.0, 1.0, 2);

    QCOMPARE(points.size(), 2);
    QVERIFY(points[0].x == 0.0);
    QVERIFY(points[1].x == 1.0);
    QVERIFY(std::fabs(points[1].y - 0.5) < 1e-3);
}

void TestDerivativeEstimator::derivativeCurveWithReversedBounds()
{
    SampleList points = DerivativeEstimator::derivativePoints("x^2", 2.0, 0.0, 2);

    QCOMPARE(points.size(), 3);
    QVERIFY(points[0].x == 0.0);
    QVERIFY(points[1].x == 1.0);
    QVERIFY(points[2].x == 2.0);
}

QTEST_APPLESS_MAIN(TestDerivativeEstimator)
#include "tst_derivative_estimator.moc"
