#include "animated_structure.h"

#include <QDebug>
#include <QtGlobal>

AnimatedStructure::AnimatedStructure(QObject* parent)
    : QObject(parent)
{
}

AnimatedStructure::~AnimatedStructure()
{
}

void AnimatedStructure::setActive(bool active)
{
    if (m_active != active) {
        m_active = active;
        emit activeChanged(m_active);
    }
}

void AnimatedStructure::setProgress(double progress)
{
    if (isIdle()) return;

    m_progress = qBound(0.0, progress, 1.0);
    updatePending(m_progress);
    emit progressChanged(m_progress);

    if (m_progress >= 1.0) {
        commitPending();
    }
}

void AnimatedStructure::cancel()
{
    if (isIdle()) return;

    qDebug() << structureName() << "operation cancelled at progress" << m_progress;

    discardPending();
    m_progress = 0.0;
    emit operationCancelled();
}

bool AnimatedStructure::execute(const OperationRequest& request)
{
    QString error;
    if (!validateRequest(request, &error)) {
        return reportError(error);
    }

    return executeRequest(request);
}

bool AnimatedStructure::validPhaseBreaks(const QVector<double>& breaks, int count)
{
    if (breaks.size() != count || count == 0) {
        return false;
    }

    double previous = 0.0;
    for (double value : breaks) {
        if (value <= previous || value > 1.0) {
            return false;
        }
        previous = value;
    }

    return qFuzzyCompare(breaks.last(), 1.0);
}

bool AnimatedStructure::checkReady(const QString& operation)
{
    if (!m_active) {
        return reportError(QString("%1: %2 is not active").arg(operation, structureName()));
    }

    if (!isIdle()) {
        return reportError(QString("%1: another operation is still pending on %2")
                               .arg(operation, structureName()));
    }

    return true;
}

bool AnimatedStructure::reportError(const QString& error)
{
    m_errorString = error;
    qWarning() << structureName() << "error:" << error;
    emit errorOccurred(m_errorString);
    return false;
}
