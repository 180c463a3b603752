#include "operation_request.h"

OperationRequest OperationRequest::insert(const QVariant& value)
{
    OperationRequest request;
    request.kind = Insert;
    request.argument = value;
    return request;
}

OperationRequest OperationRequest::search(const QVariant& value)
{
    OperationRequest request;
    request.kind = Search;
    request.argument = value;
    return request;
}

OperationRequest OperationRequest::remove(const QVariant& value)
{
    OperationRequest request;
    request.kind = Remove;
    request.argument = value;
    return request;
}

OperationRequest OperationRequest::traverse(TraversalOrder order)
{
    OperationRequest request;
    request.kind = Traverse;
    request.order = order;
    return request;
}

OperationRequest OperationRequest::mergeStep()
{
    OperationRequest request;
    request.kind = MergeStep;
    return request;
}

QVector<OperationRequest> OperationRequest::insertBatch(const QVector<int>& values)
{
    QVector<OperationRequest> requests;
    requests.reserve(values.size());

    for (int value : values) {
        requests.append(insert(value));
    }

    return requests;
}

bool OperationRequest::valueArgument(int* value, QString* error) const
{
    if (!argument.isValid() || argument.isNull()) {
        if (error) *error = QString("%1: value is missing").arg(kindName(kind));
        return false;
    }

    bool ok = false;
    int parsed = 0;

    if (argument.canConvert<QString>()) {
        parsed = argument.toString().trimmed().toInt(&ok);
    }

    if (!ok) {
        if (error) {
            *error = QString("%1: '%2' is not an integer value")
                         .arg(kindName(kind), argument.toString());
        }
        return false;
    }

    *value = parsed;
    return true;
}

QString OperationRequest::describe() const
{
    switch (kind) {
    case Traverse:
        return QString("%1(%2)").arg(kindName(kind), traversalOrderName(order));
    case MergeStep:
        return kindName(kind);
    default:
        return QString("%1(%2)").arg(kindName(kind), argument.toString());
    }
}

QString OperationRequest::kindName(Kind kind)
{
    switch (kind) {
    case Insert:
        return "insert";
    case Search:
        return "search";
    case Remove:
        return "delete";
    case Traverse:
        return "traverse";
    case MergeStep:
        return "merge_step";
    }
    return QString();
}
