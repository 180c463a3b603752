// core/animation/pending_operation.h
#ifndef PENDING_OPERATION_H
#define PENDING_OPERATION_H

#include <QString>
#include <QVector>

enum class TraversalOrder
{
    PreOrder,
    InOrder,
    PostOrder,
    LevelOrder
};

enum class ComparisonResult
{
    None,
    Less,
    Greater,
    Equal
};

enum class ChildSide
{
    Left,
    Right
};

enum class DeleteCase
{
    NotFound,
    NoChildren,
    OneChild,
    TwoChildren
};

// Фазы вставки в AVL-дерево (для BST всегда Descent)
enum class InsertPhase
{
    Descent,
    BalanceCheck,
    RotationDisclosure,
    RotationExecution
};

QString traversalOrderName(TraversalOrder order);
bool parseTraversalOrder(const QString& name, TraversalOrder* order);

QString comparisonName(ComparisonResult result);
QString deleteCaseName(DeleteCase deleteCase);
QString insertPhaseName(InsertPhase phase);

// Отложенная операция над деревом. Пока kind != Idle, структура дерева
// не меняется - меняются только поля этой записи.
struct PendingOperation
{
    enum Kind {
        Idle,
        CreatingRoot,
        Inserting,
        Searching,
        SearchFound,
        SearchNotFound,
        Deleting,
        Traversing
    };

    Kind kind = Idle;

    // Значение, с которым была запрошена операция
    int value = 0;

    // Путь спуска от корня (значения узлов)
    QVector<int> path;

    // Индекс текущего узла в path (или в sequence для обхода), -1 - нет курсора
    int cursor = -1;
    ComparisonResult comparison = ComparisonResult::None;

    // Inserting
    int parentKey = 0;
    ChildSide side = ChildSide::Left;
    InsertPhase phase = InsertPhase::Descent;
    bool hasCheckNode = false;
    int checkNode = 0;
    int checkBalance = 0;

    // SearchFound: найденный узел, SearchNotFound: последний посещенный
    bool hasTerminalKey = false;
    int terminalKey = 0;

    // Deleting
    DeleteCase deleteCase = DeleteCase::NotFound;
    bool hasReplacement = false;
    int replacement = 0;

    // Traversing
    TraversalOrder order = TraversalOrder::InOrder;
    QVector<int> sequence;

    bool isIdle() const { return kind == Idle; }
    bool hasCursor() const;
    int cursorValue() const;

    // Уже посещенный префикс обхода (включая курсор)
    QVector<int> visited() const;

    QString describe() const;
    static QString kindName(Kind kind);
};

#endif // PENDING_OPERATION_H
