#include "animation_controller.h"

#include <QDebug>

AnimationController::AnimationController(AnimatedStructure* structure, QObject* parent)
    : QObject(parent)
    , m_structure(structure)
{
    if (structure) {
        connect(structure, &AnimatedStructure::operationCancelled,
                this, &AnimationController::onStructureCancelled);
    }

    m_speed = m_settings.speed;
    m_clock.setSpeed(m_speed, 0);
}

AnimationController::~AnimationController()
{
}

void AnimationController::setSettings(const AnimationSettings& settings)
{
    m_settings = settings;
    setSpeed(settings.speed);
}

bool AnimationController::enqueue(const OperationRequest& request)
{
    return enqueueBatch({request});
}

bool AnimationController::enqueueBatch(const QVector<OperationRequest>& requests)
{
    if (!m_structure) {
        return reportError("no structure attached");
    }

    for (const OperationRequest& request : requests) {
        QString error;
        if (!m_structure->validateRequest(request, &error)) {
            return reportError(QString("%1 rejected: %2").arg(request.describe(), error));
        }
    }

    for (const OperationRequest& request : requests) {
        m_queue.enqueue(request);
    }

    if (!requests.isEmpty()) {
        m_draining = true;
        qDebug() << m_structure->structureName() << "queued" << requests.size()
                 << "requests, total" << m_queue.size();
    }
    return true;
}

bool AnimationController::start(qint64 durationMs, qint64 nowMs)
{
    if (!m_structure) {
        return reportError("no structure attached");
    }

    if (m_structure->isIdle()) {
        return reportError(QString("%1 has no pending operation to animate")
                               .arg(m_structure->structureName()));
    }

    if (m_running) {
        return reportError("an animation is already running");
    }

    m_lastNow = nowMs;
    m_clock.start(durationMs, nowMs);
    m_running = true;
    m_progress = 0.0;
    return true;
}

double AnimationController::advance(qint64 nowMs)
{
    m_lastNow = nowMs;

    if (!m_structure || m_paused) {
        return m_progress;
    }

    for (;;) {
        if (!m_running) {
            if (m_queue.isEmpty()) {
                m_hasCarry = false;
                if (m_draining) {
                    m_draining = false;
                    emit queueDrained();
                }
                return m_progress;
            }

            issueNext(nowMs);
            continue;
        }

        m_progress = m_clock.progress(nowMs);
        m_structure->setProgress(m_progress);
        emit progressChanged(m_progress);

        if (!m_structure->isIdle()) {
            return m_progress;
        }

        // Время между завершением и этим тиком переходит к следующей операции
        m_carryStart = qMin(m_clock.finishTime(), static_cast<double>(nowMs));
        m_hasCarry = true;

        stopClock();
        emit operationCommitted();
    }
}

void AnimationController::issueNext(qint64 nowMs)
{
    const OperationRequest request = m_queue.dequeue();

    if (!m_structure->execute(request)) {
        // Очередь без этого запроса теряет смысл
        m_queue.clear();
        m_draining = false;
        m_hasCarry = false;
        reportError(QString("%1 failed: %2").arg(request.describe(), m_structure->errorString()));
        return;
    }

    emit requestIssued(request.describe());

    if (m_structure->isIdle()) {
        // Например, вставка существующего значения
        qDebug() << m_structure->structureName() << request.describe() << "completed without animation";
        emit operationCommitted();
        return;
    }

    const double startMs = m_hasCarry ? m_carryStart : static_cast<double>(nowMs);
    m_hasCarry = false;

    m_clock.start(m_settings.durationFor(request.kind), startMs);
    m_running = true;
    m_progress = 0.0;
}

void AnimationController::pause(qint64 nowMs)
{
    // Пауза действует и без текущей операции: очередь не продвигается до resume()
    m_lastNow = nowMs;
    m_paused = true;
    m_clock.pause(nowMs);
}

void AnimationController::resume(qint64 nowMs)
{
    m_lastNow = nowMs;
    m_paused = false;
    m_clock.resume(nowMs);
}

bool AnimationController::setSpeed(double multiplier, qint64 nowMs)
{
    if (multiplier <= 0.0) {
        return reportError(QString("speed must be positive, got %1").arg(multiplier));
    }

    m_speed = multiplier;
    m_clock.setSpeed(multiplier, nowMs);
    return true;
}

void AnimationController::cancel()
{
    m_queue.clear();
    m_draining = false;
    m_hasCarry = false;

    if (m_structure) {
        m_structure->cancel();
    }
    stopClock();
    m_progress = 0.0;
}

void AnimationController::onStructureCancelled()
{
    stopClock();
    m_progress = 0.0;
}

void AnimationController::stopClock()
{
    m_running = false;
    m_clock.reset();
}

bool AnimationController::reportError(const QString& error)
{
    m_errorString = error;
    qWarning() << "AnimationController:" << error;
    emit errorOccurred(error);
    return false;
}
