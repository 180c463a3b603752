// core/internal/avl/avl_tree.h
#ifndef AVL_TREE_H
#define AVL_TREE_H

#include <QVector>

#include "../bst/binary_search_tree.h"
#include "rotation_plan.h"

// AVL-дерево. Вставка разбита на четыре фазы:
// спуск, проверка баланса снизу вверх, показ типа поворота, выполнение поворота.
// План поворота вычисляется заранее на теневом дереве той же процедурой,
// что выполняет реальную вставку при коммите.
class AvlTree : public BinarySearchTree
{
    Q_OBJECT

public:
    explicit AvlTree(QObject* parent = nullptr);
    ~AvlTree() override;

    QString structureName() const override { return "AVL"; }

    // nullptr, если вставка не вызовет дисбаланса или вставки нет
    const RotationPlan* rotationPlan() const { return m_hasPlan ? &m_plan : nullptr; }

    // Первый поворот, фактически выполненный при последнем коммите
    const RotationPlan* lastRotation() const { return m_hasLastRotation ? &m_lastRotation : nullptr; }

    // Высота(левого) - высота(правого) по текущему (до коммита) дереву.
    // Для отсутствующего узла - 0.
    int balanceFactor(int key) const;

    bool isBalanced() const;

    // (p1, p2, p3, p4), по умолчанию (0.35, 0.75, 0.85, 1.0)
    bool setPhaseBreaks(const QVector<double>& breaks);
    QVector<double> phaseBreaks() const { return m_phaseBreaks; }

protected:
    void prepareInsert(PendingOperation& operation) override;
    void updatePending(double progress) override;
    void commitInsert(int value) override;
    void commitRemove(int value) override;
    void discardPending() override;

    bool tracksHeight() const override { return true; }
    bool checkLoadedShape(const TreeNode* root, QString* error) const override;

private:
    struct RotationRecord
    {
        bool rotated = false;
        RotationPlan plan;
    };

    static TreeNode* insertBalanced(TreeNode* node, int value, RotationRecord* record, bool* inserted);
    static TreeNode* removeBalanced(TreeNode* node, int value, RotationRecord* record, bool* removed);
    static TreeNode* rebalance(TreeNode* node, RotationRecord* record);
    static TreeNode* rotateLeft(TreeNode* node);
    static TreeNode* rotateRight(TreeNode* node);
    static bool balancedRecursive(const TreeNode* node);

    void updateBalanceCheck(double localProgress);
    void recordRotation(const RotationRecord& record);

    QVector<double> m_phaseBreaks;

    bool m_hasPlan = false;
    RotationPlan m_plan;

    bool m_hasLastRotation = false;
    RotationPlan m_lastRotation;

    Q_DISABLE_COPY(AvlTree)
};

#endif // AVL_TREE_H
