#include "animation_settings.h"

#include <QDebug>
#include <QRegularExpression>
#include <QStringList>

#include "../animation/animated_structure.h"

namespace {

int readDuration(QSettings& settings, const QString& key, int fallback)
{
    if (!settings.contains(key)) return fallback;

    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qWarning() << "Invalid" << key << "=" << settings.value(key).toString()
                   << "- using" << fallback;
        return fallback;
    }
    return value;
}

QVector<double> readBreaks(QSettings& settings, const QString& key, const QVector<double>& fallback)
{
    if (!settings.contains(key)) return fallback;

    // QSettings в INI-формате сам разбивает строку по запятым
    const QString text = settings.value(key).toStringList().join(',');

    QVector<double> breaks;
    if (!AnimationSettings::parseBreaks(text, &breaks)
        || !AnimatedStructure::validPhaseBreaks(breaks, fallback.size())) {
        qWarning() << "Invalid" << key << "=" << text << "- using defaults";
        return fallback;
    }
    return breaks;
}

} // namespace

int AnimationSettings::durationFor(OperationRequest::Kind kind) const
{
    switch (kind) {
    case OperationRequest::Insert:
        return insertDuration;
    case OperationRequest::Search:
        return searchDuration;
    case OperationRequest::Remove:
        return deleteDuration;
    case OperationRequest::Traverse:
        return traverseDuration;
    case OperationRequest::MergeStep:
        return mergeStepDuration;
    }
    return insertDuration;
}

AnimationSettings AnimationSettings::load(QSettings& settings)
{
    const AnimationSettings defaults;
    AnimationSettings result;

    settings.beginGroup("Animation");

    result.insertDuration = readDuration(settings, "InsertDuration", defaults.insertDuration);
    result.searchDuration = readDuration(settings, "SearchDuration", defaults.searchDuration);
    result.deleteDuration = readDuration(settings, "DeleteDuration", defaults.deleteDuration);
    result.traverseDuration = readDuration(settings, "TraverseDuration", defaults.traverseDuration);
    result.mergeStepDuration = readDuration(settings, "MergeStepDuration", defaults.mergeStepDuration);
    result.tickInterval = readDuration(settings, "TickInterval", defaults.tickInterval);

    if (settings.contains("Speed")) {
        bool ok = false;
        const double speed = settings.value("Speed").toDouble(&ok);
        if (ok && speed > 0.0) {
            result.speed = speed;
        } else {
            qWarning() << "Invalid Animation/Speed =" << settings.value("Speed").toString()
                       << "- using" << defaults.speed;
        }
    }

    result.avlPhaseBreaks = readBreaks(settings, "AvlPhaseBreaks", defaults.avlPhaseBreaks);
    result.huffmanPhaseBreaks = readBreaks(settings, "HuffmanPhaseBreaks", defaults.huffmanPhaseBreaks);

    settings.endGroup();
    return result;
}

void AnimationSettings::save(QSettings& settings) const
{
    settings.beginGroup("Animation");
    settings.setValue("InsertDuration", insertDuration);
    settings.setValue("SearchDuration", searchDuration);
    settings.setValue("DeleteDuration", deleteDuration);
    settings.setValue("TraverseDuration", traverseDuration);
    settings.setValue("MergeStepDuration", mergeStepDuration);
    settings.setValue("Speed", speed);
    settings.setValue("TickInterval", tickInterval);
    settings.setValue("AvlPhaseBreaks", breaksToString(avlPhaseBreaks));
    settings.setValue("HuffmanPhaseBreaks", breaksToString(huffmanPhaseBreaks));
    settings.endGroup();
}

QString AnimationSettings::breaksToString(const QVector<double>& breaks)
{
    QStringList parts;
    for (double value : breaks) {
        parts.append(QString::number(value));
    }
    return parts.join(' ');
}

bool AnimationSettings::parseBreaks(const QString& text, QVector<double>* breaks)
{
    const QStringList parts = text.split(QRegularExpression("[,\\s]+"), Qt::SkipEmptyParts);
    if (parts.isEmpty()) return false;

    QVector<double> values;
    for (const QString& part : parts) {
        bool ok = false;
        const double value = part.toDouble(&ok);
        if (!ok) return false;
        values.append(value);
    }

    *breaks = values;
    return true;
}
