// app/animation_driver.h
#ifndef ANIMATION_DRIVER_H
#define ANIMATION_DRIVER_H

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>
#include <QVector>

#include "../core/animation/animation_controller.h"

// Таймер, который с постоянным шагом передает текущее время всем
// подключенным контроллерам. Завершается, когда все очереди опустели.
class AnimationDriver : public QObject
{
    Q_OBJECT

public:
    explicit AnimationDriver(QObject* parent = nullptr);

    void addController(AnimationController* controller);
    void setTickInterval(int intervalMs);

    void start();
    void stop();
    bool isActive() const { return m_timer.isActive(); }

    qint64 now() const { return m_clock.isValid() ? m_clock.elapsed() : 0; }

signals:
    void finished();

private slots:
    void onTick();

private:
    QTimer m_timer;
    QElapsedTimer m_clock;
    QVector<AnimationController*> m_controllers;
};

#endif // ANIMATION_DRIVER_H
