#include "pending_operation.h"

#include <QStringList>

QString traversalOrderName(TraversalOrder order)
{
    switch (order) {
    case TraversalOrder::PreOrder:
        return "preorder";
    case TraversalOrder::InOrder:
        return "inorder";
    case TraversalOrder::PostOrder:
        return "postorder";
    case TraversalOrder::LevelOrder:
        return "levelorder";
    }
    return QString();
}

bool parseTraversalOrder(const QString& name, TraversalOrder* order)
{
    const QString key = name.trimmed().toLower();

    if (key == "pre" || key == "preorder") {
        *order = TraversalOrder::PreOrder;
    } else if (key == "in" || key == "inorder") {
        *order = TraversalOrder::InOrder;
    } else if (key == "post" || key == "postorder") {
        *order = TraversalOrder::PostOrder;
    } else if (key == "level" || key == "levelorder") {
        *order = TraversalOrder::LevelOrder;
    } else {
        return false;
    }

    return true;
}

QString comparisonName(ComparisonResult result)
{
    switch (result) {
    case ComparisonResult::None:
        return "none";
    case ComparisonResult::Less:
        return "less";
    case ComparisonResult::Greater:
        return "greater";
    case ComparisonResult::Equal:
        return "equal";
    }
    return QString();
}

QString deleteCaseName(DeleteCase deleteCase)
{
    switch (deleteCase) {
    case DeleteCase::NotFound:
        return "not_found";
    case DeleteCase::NoChildren:
        return "no_children";
    case DeleteCase::OneChild:
        return "one_child";
    case DeleteCase::TwoChildren:
        return "two_children";
    }
    return QString();
}

QString insertPhaseName(InsertPhase phase)
{
    switch (phase) {
    case InsertPhase::Descent:
        return "descent";
    case InsertPhase::BalanceCheck:
        return "balance_check";
    case InsertPhase::RotationDisclosure:
        return "rotation_disclosure";
    case InsertPhase::RotationExecution:
        return "rotation_execution";
    }
    return QString();
}

bool PendingOperation::hasCursor() const
{
    if (kind == Traversing) {
        return cursor >= 0 && cursor < sequence.size();
    }
    return cursor >= 0 && cursor < path.size();
}

int PendingOperation::cursorValue() const
{
    if (!hasCursor()) return 0;

    return kind == Traversing ? sequence.at(cursor) : path.at(cursor);
}

QVector<int> PendingOperation::visited() const
{
    if (kind != Traversing || cursor < 0) {
        return QVector<int>();
    }
    return sequence.mid(0, cursor + 1);
}

QString PendingOperation::kindName(Kind kind)
{
    switch (kind) {
    case Idle:
        return "Idle";
    case CreatingRoot:
        return "CreatingRoot";
    case Inserting:
        return "Inserting";
    case Searching:
        return "Searching";
    case SearchFound:
        return "SearchFound";
    case SearchNotFound:
        return "SearchNotFound";
    case Deleting:
        return "Deleting";
    case Traversing:
        return "Traversing";
    }
    return QString();
}

QString PendingOperation::describe() const
{
    QStringList parts;
    parts << kindName(kind);

    switch (kind) {
    case Idle:
        break;
    case CreatingRoot:
        parts << QString("value=%1").arg(value);
        break;
    case Inserting:
        parts << QString("value=%1").arg(value)
              << QString("parent=%1").arg(parentKey)
              << (side == ChildSide::Left ? "side=left" : "side=right")
              << QString("phase=%1").arg(insertPhaseName(phase));
        if (phase == InsertPhase::BalanceCheck && hasCheckNode) {
            parts << QString("check=%1 bf=%2").arg(checkNode).arg(checkBalance);
        }
        break;
    case Searching:
        parts << QString("target=%1").arg(value);
        break;
    case SearchFound:
    case SearchNotFound:
        parts << QString("target=%1").arg(value);
        if (hasTerminalKey) {
            parts << QString("key=%1").arg(terminalKey);
        }
        break;
    case Deleting:
        parts << QString("target=%1").arg(value)
              << QString("case=%1").arg(deleteCaseName(deleteCase));
        if (hasReplacement) {
            parts << QString("replacement=%1").arg(replacement);
        }
        break;
    case Traversing:
        parts << QString("order=%1").arg(traversalOrderName(order))
              << QString("visited=%1/%2").arg(visited().size()).arg(sequence.size());
        break;
    }

    if (kind != Traversing && hasCursor()) {
        parts << QString("cursor=%1 (%2)").arg(cursorValue()).arg(comparisonName(comparison));
    }

    return parts.join(' ');
}
