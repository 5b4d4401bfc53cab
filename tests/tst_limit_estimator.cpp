#include <QtTest>

#include "limit_estimator.hpp"

class TestLimitEstimator : public QObject
{
    Q_OBJECT

private slots:
    void removableDiscontinuity();
    void jumpHasNoLimit();
    void oneSidedFromTheRight();
    void undefinedOnBothSides();
    void invalidFormula();
    void keepsSmallestWorkingStep();
    void epsilonDecidesAgreement();
    void continuousFunction();
};

void TestLimitEstimator::removableDiscontinuity()
{
    LimitResult result = LimitEstimator::limit("sin(x)/x", 0.0);

    QVERIFY(result.hasLeftLimit);
    QVERIFY(result.hasRightLimit);
    QVERIFY(result.hasLimit);
    QVERIFY(result.exists);
    QVERIFY(std::fabs(result.limit - 1.0) < 1e-6);
}

void TestLimitEstimator::jumpHasNoLimit()
{
    LimitResult result = LimitEstimator::limit("abs(x)/x", 0.0);

    QVERIFY(result.hasLeftLimit);
    QVERIFY(result.hasRightLimit);
    QVERIFY(result.leftLimit == -1.0);
    QVERIFY(result.rightLimit == 1.0);
    QVERIFY(!result.hasLimit);
    QVERIFY(!result.exists);
}

void TestLimitEstimator::oneSidedFromTheRight()
{
    LimitResult result = LimitEstimator::limit("sqrt(x)", 0.0);

    QVERIFY(!result.hasLeftLimit);
    QVERIFY(result.hasRightLimit);
    QVERIFY(result.hasLimit);
    QVERIFY(!result.exists);
    QVERIFY(std::fabs(result.limit - 0.01) < 1e-12);
    QVERIFY(result.limit == result.rightLimit);
}

void TestLimitEstimator::undefinedOnBothSides()
{
    LimitResult result = LimitEstimator::limit("ln(x)", -1.0);

    QVERIFY(!result.hasLeftLimit);
    QVERIFY(!result.hasRightLimit);
    QVERIFY(!result.hasLimit);
    QVERIFY(!result.exists);
}

void TestLimitEstimator::invalidFormula()
{
    LimitResult result = LimitEstimator::limit("2x", 0.0);

    QVERIFY(!result.hasLeftLimit);
    QVERIFY(!result.hasRightLimit);
    QVERIFY(!result.hasLimit);
    QVERIFY(!result.exists);
}

void TestLimitEstimator::keepsSmallestWorkingStep()
{
    // Defined at 0.1, 0.01 and 0.001 to the right, but not at 0.0001
    LimitResult result = LimitEstimator::limit("sqrt(x - 0.0005)", 0.0);

    QVERIFY(!result.hasLeftLimit);
    QVERIFY(result.hasRightLimit);
    QVERIFY(std::fabs(result.rightLimit - std::sqrt(0.0005)) < 1e-9);
}

void TestLimitEstimator::epsilonDecidesAgreement()
{
    // x^2 at 3 differs by 0.0012 between 2.9999 and 3.0001
    LimitResult strict = LimitEstimator::limit("x^2", 3.0);
    QVERIFY(strict.hasLeftLimit);
    QVERIFY(strict.hasRightLimit);
    QVERIFY(!strict.hasLimit);
    QVERIFY(!strict.exists);

    LimitResult loose = LimitEstimator::limit("x^2", 3.0, 0.01);
    QVERIFY(loose.exists);
    QVERIFY(std::fabs(loose.limit - 9.0) < 1e-6);
}

void TestLimitEstimator::continuousFunction()
{
    MathExpressionParser parser;
    QVERIFY(parser.parse("x^2"));

    LimitResult result = LimitEstimator::limit(parser, 1.0);
    QVERIFY(result.exists);
    QVERIFY(std::fabs(result.limit - 1.0) < 1e-6);
    QVERIFY(result.leftLimit < result.limit);
    QVERIFY(result.rightLimit > result.limit);
}

QTEST_APPLESS_MAIN(TestLimitEstimator)
#include "tst_limit_estimator.moc"
