// core/animation/animation_controller.h
#ifndef ANIMATION_CONTROLLER_H
#define ANIMATION_CONTROLLER_H

#include <QObject>
#include <QPointer>
#include <QQueue>

#include "animated_structure.h"
#include "animation_clock.h"
#include "operation_request.h"
#include "../config/animation_settings.h"

// Контроллер одной структуры: часы, скорость, пауза и очередь запросов.
// Следующий запрос из очереди выдается только после того, как структура
// вернулась в состояние Idle.
class AnimationController : public QObject
{
    Q_OBJECT

public:
    explicit AnimationController(AnimatedStructure* structure, QObject* parent = nullptr);
    ~AnimationController() override;

    AnimatedStructure* structure() const { return m_structure; }

    void setSettings(const AnimationSettings& settings);
    const AnimationSettings& settings() const { return m_settings; }

    // Запрос проверяется сразу; некорректный в очередь не попадает
    bool enqueue(const OperationRequest& request);
    // Все или ничего: при ошибке в любом запросе очередь не меняется
    bool enqueueBatch(const QVector<OperationRequest>& requests);
    int queuedCount() const { return m_queue.size(); }

    // Запуск часов для операции, уже запрошенной напрямую у структуры
    bool start(qint64 durationMs, qint64 nowMs);

    // Продвигает анимацию к моменту nowMs и возвращает текущий прогресс
    double advance(qint64 nowMs);

    void pause(qint64 nowMs);
    void resume(qint64 nowMs);
    bool setSpeed(double multiplier, qint64 nowMs);
    bool setSpeed(double multiplier) { return setSpeed(multiplier, m_lastNow); }

    // Сбрасывает текущую операцию и всю очередь
    void cancel();

    bool isRunning() const { return m_running; }
    bool isPaused() const { return m_paused; }
    bool isBusy() const { return m_running || !m_queue.isEmpty(); }
    double progress() const { return m_progress; }
    double speed() const { return m_speed; }

    QString errorString() const { return m_errorString; }

signals:
    void progressChanged(double progress);
    void requestIssued(const QString& description);
    void operationCommitted();
    void queueDrained();
    void errorOccurred(const QString& error);

private slots:
    void onStructureCancelled();

private:
    void issueNext(qint64 nowMs);
    void stopClock();
    bool reportError(const QString& error);

    QPointer<AnimatedStructure> m_structure;
    AnimationClock m_clock;
    AnimationSettings m_settings;
    QQueue<OperationRequest> m_queue;

    bool m_running = false;
    bool m_paused = false;
    bool m_draining = false;

    // Момент завершения последней операции; от него стартует следующая из очереди
    bool m_hasCarry = false;
    double m_carryStart = 0.0;

    double m_progress = 0.0;
    double m_speed = 1.0;
    qint64 m_lastNow = 0;
    QString m_errorString;

    Q_DISABLE_COPY(AnimationController)
};

#endif // ANIMATION_CONTROLLER_H
