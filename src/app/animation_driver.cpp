#include "animation_driver.h"

#include <QDebug>

AnimationDriver::AnimationDriver(QObject* parent)
    : QObject(parent)
{
    m_timer.setInterval(50);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &AnimationDriver::onTick);
}

void AnimationDriver::addController(AnimationController* controller)
{
    if (controller && !m_controllers.contains(controller)) {
        m_controllers.append(controller);
    }
}

void AnimationDriver::setTickInterval(int intervalMs)
{
    m_timer.setInterval(qMax(1, intervalMs));
}

void AnimationDriver::start()
{
    qDebug() << "Animation driver started, tick" << m_timer.interval() << "ms,"
             << m_controllers.size() << "controllers";
    m_clock.start();
    m_timer.start();
}

void AnimationDriver::stop()
{
    m_timer.stop();
}

void AnimationDriver::onTick()
{
    const qint64 timestamp = m_clock.elapsed();
    bool busy = false;

    for (AnimationController* controller : m_controllers) {
        controller->advance(timestamp);
        busy = busy || controller->isBusy();
    }

    if (!busy) {
        qDebug() << "Animation driver finished at" << timestamp << "ms";
        m_timer.stop();
        emit finished();
    }
}
