// core/internal/binary_tree/binary_tree.h
#ifndef BINARYTREE_H
#define BINARYTREE_H


#include <QObject>
#include <QVector>
#include <QJsonObject>
#include <QDebug>

#include "tree_node.h"
#include "../../animation/animated_structure.h"
#include "../../animation/pending_operation.h"


// Упорядоченное двоичное дерево с отложенной мутацией.
// Здесь общая часть BST и AVL: хранение узлов, поиск, обход,
// сериализация и хранение отложенной операции.
class BinaryTree : public AnimatedStructure
{
    Q_OBJECT

public:
    ~BinaryTree() override;

    // Для работы с визуализацией и алгоритмами
    TreeNode* root() const { return m_root; }
    bool isEmpty() const { return m_root == nullptr; }
    int size() const { return m_size; }
    int height() const { return heightRecursive(m_root); }

    TreeNode* find(int value) const;
    bool contains(int value) const { return find(value) != nullptr; }

    // Сбрасывает отложенную операцию и удаляет все узлы
    void clear();

    // Анимированный обход: дерево не меняется, коммит только сбрасывает состояние
    bool traverse(TraversalOrder order);

    // Последовательность значений в заданном порядке (без анимации)
    QVector<int> traversal(TraversalOrder order) const;
    QVector<int> inorderValues() const { return traversal(TraversalOrder::InOrder); }

    bool isIdle() const override { return m_pending.isIdle(); }

    const PendingOperation& pendingState() const { return m_pending; }

    // Финальное состояние последней завершенной операции (SearchFound и т.п.)
    const PendingOperation& lastCompleted() const { return m_lastCompleted; }

    bool sameShape(const BinaryTree& other) const;

    // Вложенная запись без полей анимации: {"root": {"value", "left", "right"[, "height"]}}
    QJsonObject toJson() const;
    bool fromJson(const QJsonObject& json);

    bool validateRequest(const OperationRequest& request, QString* error) const override;

signals:
    void committed(const PendingOperation& operation);

protected:
    explicit BinaryTree(QObject* parent = nullptr);

    bool executeRequest(const OperationRequest& request) override;
    void updatePending(double progress) override;
    void commitPending() override;
    void discardPending() override;

    // Высота хранится в узлах только у AVL-дерева
    virtual bool tracksHeight() const { return false; }
    virtual bool checkLoadedShape(const TreeNode* root, QString* error) const;

    void beginPending(const PendingOperation& operation, const QString& description);
    void finishPending(const QString& description);

    // Индекс курсора для прогресса в пределах [0, 1)
    static int cursorIndex(double localProgress, int count);
    static ComparisonResult compareValues(int target, int nodeValue);

    // Путь спуска от корня до узла со значением value или до последнего
    // узла перед пустой ссылкой
    QVector<int> descentPath(int value) const;

    TreeNode* m_root = nullptr;
    int m_size = 0;
    PendingOperation m_pending;
    PendingOperation m_lastCompleted;

private:
    static int heightRecursive(const TreeNode* node);
    void collect(const TreeNode* node, TraversalOrder order, QVector<int>& result) const;

    QJsonObject nodeToJson(const TreeNode* node) const;
    TreeNode* nodeFromJson(const QJsonObject& json, QString* error) const;
    static bool checkOrdering(const TreeNode* node, const int* low, const int* high);
    static bool checkHeights(const TreeNode* node);

    Q_DISABLE_COPY(BinaryTree)
};
#endif // BINARYTREE_H
