// core/animation/operation_request.h
#ifndef OPERATION_REQUEST_H
#define OPERATION_REQUEST_H

#include <QString>
#include <QVariant>
#include <QVector>

#include "pending_operation.h"

// Запрос операции для очереди пакетного выполнения
struct OperationRequest
{
    enum Kind {
        Insert,
        Search,
        Remove,
        Traverse,
        MergeStep
    };

    Kind kind = Insert;
    QVariant argument;
    TraversalOrder order = TraversalOrder::InOrder;

    static OperationRequest insert(const QVariant& value);
    static OperationRequest search(const QVariant& value);
    static OperationRequest remove(const QVariant& value);
    static OperationRequest traverse(TraversalOrder order);
    static OperationRequest mergeStep();

    static QVector<OperationRequest> insertBatch(const QVector<int>& values);

    // Приводит аргумент к целому значению узла. Строки "42" допускаются,
    // "4.5", "abc" и пустые значения - нет.
    bool valueArgument(int* value, QString* error = nullptr) const;

    QString describe() const;
    static QString kindName(Kind kind);
};

#endif // OPERATION_REQUEST_H
