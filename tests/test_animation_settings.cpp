#include <catch2/catch.hpp>

#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

#include "core/config/animation_settings.h"
#include "test_helpers.h"

TEST_CASE("Missing keys give the default settings", "[settings]")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    QSettings store(dir.filePath("empty.ini"), QSettings::IniFormat);
    const AnimationSettings settings = AnimationSettings::load(store);

    REQUIRE(settings.insertDuration == 1000);
    REQUIRE(settings.searchDuration == 2000);
    REQUIRE(settings.deleteDuration == 1000);
    REQUIRE(settings.traverseDuration == 1500);
    REQUIRE(settings.mergeStepDuration == 2000);
    REQUIRE(settings.speed == Approx(1.0));
    REQUIRE(settings.tickInterval == 50);
    REQUIRE(settings.avlPhaseBreaks == QVector<double>({0.35, 0.75, 0.85, 1.0}));
    REQUIRE(settings.huffmanPhaseBreaks == QVector<double>({0.25, 0.5, 0.75, 1.0}));
}

TEST_CASE("Saved settings load back", "[settings]")
{
    QTemporaryDir dir;
    const QString path = dir.filePath("animation.ini");

    AnimationSettings saved;
    saved.insertDuration = 700;
    saved.mergeStepDuration = 2500;
    saved.speed = 1.5;
    saved.tickInterval = 16;
    saved.avlPhaseBreaks = {0.3, 0.6, 0.8, 1.0};

    {
        QSettings store(path, QSettings::IniFormat);
        saved.save(store);
    }

    QSettings store(path, QSettings::IniFormat);
    const AnimationSettings loaded = AnimationSettings::load(store);

    REQUIRE(loaded.insertDuration == 700);
    REQUIRE(loaded.mergeStepDuration == 2500);
    REQUIRE(loaded.speed == Approx(1.5));
    REQUIRE(loaded.tickInterval == 16);
    REQUIRE(loaded.avlPhaseBreaks.size() == 4);
    REQUIRE(loaded.avlPhaseBreaks.at(0) == Approx(0.3));
    REQUIRE(loaded.avlPhaseBreaks.at(2) == Approx(0.8));
}

TEST_CASE("Invalid values fall back to defaults", "[settings]")
{
    QTemporaryDir dir;
    const QString path = dir.filePath("broken.ini");

    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write("[Animation]\n"
               "InsertDuration=-5\n"
               "SearchDuration=fast\n"
               "DeleteDuration=300\n"
               "Speed=0\n"
               "AvlPhaseBreaks=\"0.5,0.4,0.9,1.0\"\n"
               "HuffmanPhaseBreaks=\"0.1,0.2,0.3,0.9\"\n");
    file.close();

    QSettings store(path, QSettings::IniFormat);
    const AnimationSettings settings = AnimationSettings::load(store);

    REQUIRE(settings.insertDuration == 1000);
    REQUIRE(settings.searchDuration == 2000);
    REQUIRE(settings.deleteDuration == 300);
    REQUIRE(settings.speed == Approx(1.0));
    REQUIRE(settings.avlPhaseBreaks == QVector<double>({0.35, 0.75, 0.85, 1.0}));
    REQUIRE(settings.huffmanPhaseBreaks == QVector<double>({0.25, 0.5, 0.75, 1.0}));
}

TEST_CASE("Phase break strings accept commas and spaces", "[settings]")
{
    QVector<double> breaks;

    REQUIRE(AnimationSettings::parseBreaks("0.25, 0.5,0.75 1", &breaks));
    REQUIRE(breaks.size() == 4);
    REQUIRE(breaks.last() == Approx(1.0));

    REQUIRE_FALSE(AnimationSettings::parseBreaks("0.25,abc", &breaks));
    REQUIRE_FALSE(AnimationSettings::parseBreaks("", &breaks));
    REQUIRE(AnimationSettings::breaksToString({0.5, 1.0}) == "0.5 1");
}

TEST_CASE("Each request kind has its own duration", "[settings]")
{
    AnimationSettings settings;
    settings.deleteDuration = 123;

    REQUIRE(settings.durationFor(OperationRequest::Insert) == 1000);
    REQUIRE(settings.durationFor(OperationRequest::Search) == 2000);
    REQUIRE(settings.durationFor(OperationRequest::Remove) == 123);
    REQUIRE(settings.durationFor(OperationRequest::Traverse) == 1500);
    REQUIRE(settings.durationFor(OperationRequest::MergeStep) == 2000);
}
