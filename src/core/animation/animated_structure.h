// core/animation/animated_structure.h
#ifndef ANIMATED_STRUCTURE_H
#define ANIMATED_STRUCTURE_H

#include <QObject>
#include <QString>
#include <QVector>

#include "operation_request.h"

// Базовый класс структуры с отложенной мутацией.
// Запрос операции только заполняет отложенное состояние, реальное изменение
// структуры выполняется ровно один раз - когда прогресс достигает 1.0.
class AnimatedStructure : public QObject
{
    Q_OBJECT

public:
    explicit AnimatedStructure(QObject* parent = nullptr);
    ~AnimatedStructure() override;

    virtual QString structureName() const = 0;

    // Неактивная структура отклоняет любые запросы
    void setActive(bool active);
    bool isActive() const { return m_active; }

    virtual bool isIdle() const = 0;

    double progress() const { return m_progress; }

    // Прогресс ограничивается [0, 1]; при 1.0 выполняется коммит
    void setProgress(double progress);

    // Сброс отложенной операции без отката - дерево еще не менялось
    void cancel();

    virtual bool validateRequest(const OperationRequest& request, QString* error) const = 0;
    bool execute(const OperationRequest& request);

    QString errorString() const { return m_errorString; }

    // Границы фаз: строго возрастают, лежат в (0, 1], последняя равна 1.0
    static bool validPhaseBreaks(const QVector<double>& breaks, int count);

signals:
    void activeChanged(bool active);
    void progressChanged(double progress);
    void operationStarted(const QString& description);
    void operationFinished(const QString& description);
    void operationCancelled();
    void structureChanged();
    void errorOccurred(const QString& error);

protected:
    virtual bool executeRequest(const OperationRequest& request) = 0;
    virtual void updatePending(double progress) = 0;
    virtual void commitPending() = 0;
    virtual void discardPending() = 0;

    // Проверка предусловий запроса: структура активна и свободна
    bool checkReady(const QString& operation);
    bool reportError(const QString& error);
    void resetProgress() { m_progress = 0.0; }

private:
    bool m_active = false;
    double m_progress = 0.0;
    QString m_errorString;

    Q_DISABLE_COPY(AnimatedStructure)
};

#endif // ANIMATED_STRUCTURE_H
