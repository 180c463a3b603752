// core/animation/animation_clock.h
#ifndef ANIMATION_CLOCK_H
#define ANIMATION_CLOCK_H

#include <QtGlobal>

// Часы одной анимации. Время передается снаружи (мс), поэтому прогресс -
// чистая функция (now - start - paused) * speed / duration, ограниченная [0, 1].
class AnimationClock
{
public:
    AnimationClock() = default;

    // startMs может быть дробным: следующая операция пакета стартует
    // в момент фактического завершения предыдущей
    void start(qint64 durationMs, double startMs);
    void reset();

    double progress(qint64 nowMs) const;

    void pause(qint64 nowMs);
    void resume(qint64 nowMs);

    // Меняет скорость, не меняя уже набранный прогресс
    void setSpeed(double multiplier, qint64 nowMs);

    // Момент, когда прогресс достигает 1.0 (для запущенных часов не на паузе)
    double finishTime() const;

    bool isStarted() const { return m_started; }
    bool isPaused() const { return m_paused; }
    double speed() const { return m_speed; }
    qint64 duration() const { return m_duration; }

private:
    double rawProgress(qint64 nowMs) const;

    bool m_started = false;
    bool m_paused = false;
    double m_speed = 1.0;
    qint64 m_duration = 0;

    // Начало хранится как double: после смены скорости оно сдвигается дробно
    double m_start = 0.0;
    qint64 m_pausedTotal = 0;
    qint64 m_pausedAt = 0;
};

#endif // ANIMATION_CLOCK_H
