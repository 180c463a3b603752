// core/config/animation_settings.h
#ifndef ANIMATION_SETTINGS_H
#define ANIMATION_SETTINGS_H

#include <QSettings>
#include <QString>
#include <QVector>

#include "../animation/operation_request.h"

// Параметры анимации. Хранятся в QSettings под группой "Animation":
//   Animation/InsertDuration, SearchDuration, DeleteDuration,
//   TraverseDuration, MergeStepDuration (мс), Speed, TickInterval (мс),
//   AvlPhaseBreaks, HuffmanPhaseBreaks ("0.35,0.75,0.85,1.0").
// Некорректные значения заменяются значениями по умолчанию.
struct AnimationSettings
{
    int insertDuration = 1000;
    int searchDuration = 2000;
    int deleteDuration = 1000;
    int traverseDuration = 1500;
    int mergeStepDuration = 2000;

    double speed = 1.0;
    int tickInterval = 50;

    QVector<double> avlPhaseBreaks = {0.35, 0.75, 0.85, 1.0};
    QVector<double> huffmanPhaseBreaks = {0.25, 0.5, 0.75, 1.0};

    int durationFor(OperationRequest::Kind kind) const;

    static AnimationSettings load(QSettings& settings);
    void save(QSettings& settings) const;

    static QString breaksToString(const QVector<double>& breaks);
    static bool parseBreaks(const QString& text, QVector<double>* breaks);
};

#endif // ANIMATION_SETTINGS_H
