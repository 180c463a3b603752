#include "animation_clock.h"

#include <algorithm>

void AnimationClock::start(qint64 durationMs, double startMs)
{
    m_started = true;
    m_paused = false;
    m_duration = std::max<qint64>(durationMs, 1);
    m_start = startMs;
    m_pausedTotal = 0;
    m_pausedAt = 0;
}

void AnimationClock::reset()
{
    m_started = false;
    m_paused = false;
    m_duration = 0;
    m_start = 0.0;
    m_pausedTotal = 0;
    m_pausedAt = 0;
}

double AnimationClock::progress(qint64 nowMs) const
{
    if (!m_started) return 0.0;

    // На паузе время стоит в момент pause()
    const qint64 effectiveNow = m_paused ? m_pausedAt : nowMs;
    return std::min(1.0, std::max(0.0, rawProgress(effectiveNow)));
}

double AnimationClock::rawProgress(qint64 nowMs) const
{
    const double elapsed = static_cast<double>(nowMs) - m_start - static_cast<double>(m_pausedTotal);
    return elapsed * m_speed / static_cast<double>(m_duration);
}

double AnimationClock::finishTime() const
{
    return m_start + static_cast<double>(m_pausedTotal) + static_cast<double>(m_duration) / m_speed;
}

void AnimationClock::pause(qint64 nowMs)
{
    if (!m_started || m_paused) return;

    m_paused = true;
    m_pausedAt = nowMs;
}

void AnimationClock::resume(qint64 nowMs)
{
    if (!m_started || !m_paused) return;

    m_pausedTotal += std::max<qint64>(0, nowMs - m_pausedAt);
    m_paused = false;
}

void AnimationClock::setSpeed(double multiplier, qint64 nowMs)
{
    if (multiplier <= 0.0) return;

    if (!m_started) {
        m_speed = multiplier;
        return;
    }

    const qint64 effectiveNow = m_paused ? m_pausedAt : nowMs;
    const double current = progress(nowMs);

    // Новое начало выбирается так, чтобы прогресс в effectiveNow не изменился
    m_speed = multiplier;
    m_start = static_cast<double>(effectiveNow) - static_cast<double>(m_pausedTotal)
              - current * static_cast<double>(m_duration) / m_speed;
}
