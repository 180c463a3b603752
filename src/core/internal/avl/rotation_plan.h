// core/internal/avl/rotation_plan.h
#ifndef ROTATION_PLAN_H
#define ROTATION_PLAN_H

#include <QString>

enum class RotationKind
{
    LL,
    RR,
    LR,
    RL
};

// План балансировки для одной вставки.
// pivotKey - несбалансированный узел, в котором выполняется поворот,
// childKey - его более высокий ребенок, grandchildKey - внутренний внук (LR/RL).
struct RotationPlan
{
    RotationKind kind = RotationKind::LL;
    int pivotKey = 0;
    int childKey = 0;
    bool hasGrandchild = false;
    int grandchildKey = 0;

    // Узел, который станет корнем поддерева после поворота
    int newRootKey() const { return hasGrandchild ? grandchildKey : childKey; }

    QString kindName() const
    {
        switch (kind) {
        case RotationKind::LL: return "LL";
        case RotationKind::RR: return "RR";
        case RotationKind::LR: return "LR";
        case RotationKind::RL: return "RL";
        }
        return QString();
    }

    bool operator==(const RotationPlan& other) const
    {
        return kind == other.kind
               && pivotKey == other.pivotKey
               && childKey == other.childKey
               && hasGrandchild == other.hasGrandchild
               && (!hasGrandchild || grandchildKey == other.grandchildKey);
    }
    bool operator!=(const RotationPlan& other) const { return !(*this == other); }
};

#endif // ROTATION_PLAN_H
