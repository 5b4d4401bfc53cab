#include <QtTest>
#include <QSettings>
#include <QTemporaryDir>

#include "calculus_settings.hpp"

class TestCalculusSettings : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir directory;

    QString settingsPath(const QString& name) const
    {
        return directory.filePath(name + ".ini");
    }

private slots:
    void initTestCase();
    void emptyFileGivesDefaults();
    void savedSettingsLoadBack();
    void invalidValuesFallBack();
    void invertedPlotRangeFallsBack();
    void riemannRectangleCountIsCapped();
};

void TestCalculusSettings::initTestCase()
{
    QVERIFY(directory.isValid());
}

void TestCalculusSettings::emptyFileGivesDefaults()
{
    QSettings store(settingsPath("empty"), QSettings::IniFormat);
    CalculusSettings settings = CalculusSettings::load(store);

    QCOMPARE(settings.xMin, -10.0);
    QCOMPARE(settings.xMax, 10.0);
    QCOMPARE(settings.plotSteps, 1000);
    QCOMPARE(settings.derivativeSteps, 500);
    QCOMPARE(settings.derivativeStep, 1e-4);
    QCOMPARE(settings.pointOfInterest, 2.0);
    QVERIFY(settings.integralLower == 0.0);
    QCOMPARE(settings.integralUpper, 4.0);
    QCOMPARE(settings.subdivisions, 50);
    QCOMPARE(settings.maxRiemannRectangles, 100);
    QCOMPARE(settings.integrationMethod, IntegralEstimator::SIMPSON);
    QVERIFY(settings.limitTarget == 0.0);
    QCOMPARE(settings.limitEpsilon, 1e-3);
}

void TestCalculusSettings::savedSettingsLoadBack()
{
    CalculusSettings saved;
    saved.xMin = -2.5;
    saved.xMax = 7.0;
    saved.plotSteps = 250;
    saved.derivativeSteps = 80;
    saved.derivativeStep = 1e-6;
    saved.pointOfInterest = -1.5;
    saved.integralLower = 1.0;
    saved.integralUpper = 3.0;
    saved.subdivisions = 20;
    saved.maxRiemannRectangles = 10;
    saved.integrationMethod = IntegralEstimator::TRAPEZOIDAL;
    saved.limitTarget = 0.5;
    saved.limitEpsilon = 0.01;

    {
        QSettings store(settingsPath("roundtrip"), QSettings::IniFormat);
        saved.save(store);
        store.sync();
        QCOMPARE(store.status(), QSettings::NoError);
    }

    QSettings store(settingsPath("roundtrip"), QSettings::IniFormat);
    CalculusSettings loaded = CalculusSettings::load(store);

    QCOMPARE(loaded.xMin, saved.xMin);
    QCOMPARE(loaded.xMax, saved.xMax);
    QCOMPARE(loaded.plotSteps, saved.plotSteps);
    QCOMPARE(loaded.derivativeSteps, saved.derivativeSteps);
    QCOMPARE(loaded.derivativeStep, saved.derivativeStep);
    QCOMPARE(loaded.pointOfInterest, saved.pointOfInterest);
    QCOMPARE(loaded.integralLower, saved.integralLower);
    QCOMPARE(loaded.integralUpper, saved.integralUpper);
    QCOMPARE(loaded.subdivisions, saved.subdivisions);
    QCOMPARE(loaded.maxRiemannRectangles, saved.maxRiemannRectangles);
    QCOMPARE(loaded.integrationMethod, saved.integrationMethod);
    QCOMPARE(loaded.limitTarget, saved.limitTarget);
    QCOMPARE(loaded.limitEpsilon, saved.limitEpsilon);
}

void TestCalculusSettings::invalidValuesFallBack()
{
    {
        QSettings store(settingsPath("invalid"), QSettings::IniFormat);
        store.setValue("plot/steps", "-3");
        store.setValue("derivative/step", "0");
        store.setValue("integral/subdivisions", "many");
        store.setValue("integral/method", "bogus");
        store.setValue("integral/upper", "6");
        store.setValue("limit/epsilon", "abc");
        store.sync();
    }

    QSettings store(settingsPath("invalid"), QSettings::IniFormat);
    CalculusSettings settings = CalculusSettings::load(store);

    QCOMPARE(settings.plotSteps, 1000);
    QCOMPARE(settings.derivativeStep, 1e-4);
    QCOMPARE(settings.subdivisions, 50);
    QCOMPARE(settings.integrationMethod, IntegralEstimator::SIMPSON);
    QCOMPARE(settings.integralUpper, 6.0);
    QCOMPARE(settings.limitEpsilon, 1e-3);
}

void TestCalculusSettings::invertedPlotRangeFallsBack()
{
    {
        QSettings store(settingsPath("inverted"), QSettings::IniFormat);
        store.setValue("plot/xMin", 5.0);
        store.setValue("plot/xMax", 1.0);
        store.sync();
    }

    QSettings store(settingsPath("inverted"), QSettings::IniFormat);
    CalculusSettings settings = CalculusSettings::load(store);

    QCOMPARE(settings.xMin, -10.0);
    QCOMPARE(settings.xMax, 10.0);
}

void TestCalculusSettings::riemannRectangleCountIsCapped()
{
    CalculusSettings settings;
    QCOMPARE(settings.riemannRectangleCount(), 50);

    settings.subdivisions = 500;
    QCOMPARE(settings.riemannRectangleCount(), 100);
}

QTEST_APPLESS_MAIN(TestCalculusSettings)
#include "tst_calculus_settings.moc"
