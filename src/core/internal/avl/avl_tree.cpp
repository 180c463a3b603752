#include "avl_tree.h"

#include <QDebug>
#include <cstdlib>

AvlTree::AvlTree(QObject* parent)
    : BinarySearchTree(parent)
    , m_phaseBreaks({0.35, 0.75, 0.85, 1.0})
{
}

AvlTree::~AvlTree()
{
}

int AvlTree::balanceFactor(int key) const
{
    return TreeNode::balanceOf(find(key));
}

bool AvlTree::isBalanced() const
{
    return balancedRecursive(m_root);
}

bool AvlTree::setPhaseBreaks(const QVector<double>& breaks)
{
    if (!validPhaseBreaks(breaks, 4)) {
        return reportError("phase breaks must be four increasing values ending at 1.0");
    }

    m_phaseBreaks = breaks;
    return true;
}

// === Теневое дерево ===

void AvlTree::prepareInsert(PendingOperation& operation)
{
    operation.phase = InsertPhase::Descent;

    // Та же процедура вставки, но на копии дерева
    TreeNode* shadow = TreeNode::cloneSubtree(m_root);
    RotationRecord record;
    bool inserted = false;

    shadow = insertBalanced(shadow, operation.value, &record, &inserted);
    TreeNode::deleteSubtree(shadow);

    m_hasPlan = record.rotated;
    m_plan = record.plan;

    if (m_hasPlan) {
        qDebug() << structureName() << "rotation plan:" << m_plan.kindName()
                 << "pivot" << m_plan.pivotKey << "new root" << m_plan.newRootKey();
    }
}

void AvlTree::updatePending(double progress)
{
    if (m_pending.kind != PendingOperation::Inserting) {
        BinarySearchTree::updatePending(progress);
        return;
    }

    const double p1 = m_phaseBreaks.at(0);
    const double p2 = m_phaseBreaks.at(1);
    const double p3 = m_phaseBreaks.at(2);

    if (progress < p1) {
        m_pending.phase = InsertPhase::Descent;
        m_pending.hasCheckNode = false;
        updateDescent(progress / p1);
    } else if (progress < p2) {
        m_pending.phase = InsertPhase::BalanceCheck;
        updateBalanceCheck((progress - p1) / (p2 - p1));
    } else if (progress < p3) {
        m_pending.phase = InsertPhase::RotationDisclosure;
        m_pending.hasCheckNode = false;
    } else {
        m_pending.phase = InsertPhase::RotationExecution;
        m_pending.hasCheckNode = false;
    }
}

void AvlTree::updateBalanceCheck(double localProgress)
{
    const QVector<int>& path = m_pending.path;

    // Проверка идет снизу вверх: сначала место нового узла, затем путь спуска
    const int step = cursorIndex(localProgress, path.size() + 1);

    m_pending.hasCheckNode = true;

    if (step == 0) {
        // Нового узла в дереве еще нет, его баланс - как у листа
        m_pending.cursor = -1;
        m_pending.comparison = ComparisonResult::None;
        m_pending.checkNode = m_pending.value;
        m_pending.checkBalance = 0;
        return;
    }

    // Баланс узлов пути считается по дереву до вставки
    m_pending.cursor = path.size() - step;
    m_pending.comparison = compareValues(m_pending.value, path.at(m_pending.cursor));
    m_pending.checkNode = path.at(m_pending.cursor);
    m_pending.checkBalance = balanceFactor(m_pending.checkNode);
}

void AvlTree::commitInsert(int value)
{
    RotationRecord record;
    bool inserted = false;

    m_root = insertBalanced(m_root, value, &record, &inserted);
    if (inserted) {
        m_size++;
    }

    if (record.rotated != m_hasPlan || (record.rotated && record.plan != m_plan)) {
        qWarning() << structureName() << "rotation at commit differs from the plan for" << value;
    }

    recordRotation(record);
    m_hasPlan = false;
}

void AvlTree::commitRemove(int value)
{
    RotationRecord record;
    bool removed = false;

    m_root = removeBalanced(m_root, value, &record, &removed);
    if (removed) {
        m_size--;
    }

    recordRotation(record);
}

void AvlTree::recordRotation(const RotationRecord& record)
{
    m_hasLastRotation = record.rotated;
    m_lastRotation = record.plan;

    if (record.rotated) {
        qDebug() << structureName() << "rotation" << record.plan.kindName()
                 << "at" << record.plan.pivotKey;
    }
}

void AvlTree::discardPending()
{
    BinarySearchTree::discardPending();
    m_hasPlan = false;
}

bool AvlTree::checkLoadedShape(const TreeNode* root, QString* error) const
{
    if (!BinarySearchTree::checkLoadedShape(root, error)) {
        return false;
    }

    if (!balancedRecursive(root)) {
        *error = "tree is not AVL-balanced";
        return false;
    }

    return true;
}

// === Вставка, удаление и повороты ===

TreeNode* AvlTree::insertBalanced(TreeNode* node, int value, RotationRecord* record, bool* inserted)
{
    if (!node) {
        *inserted = true;
        return new TreeNode(value);
    }

    if (value < node->value()) {
        node->setLeft(insertBalanced(node->left(), value, record, inserted));
    } else if (value > node->value()) {
        node->setRight(insertBalanced(node->right(), value, record, inserted));
    } else {
        return node;
    }

    return rebalance(node, record);
}

TreeNode* AvlTree::removeBalanced(TreeNode* node, int value, RotationRecord* record, bool* removed)
{
    if (!node) {
        return nullptr;
    }

    if (value < node->value()) {
        node->setLeft(removeBalanced(node->left(), value, record, removed));
    } else if (value > node->value()) {
        node->setRight(removeBalanced(node->right(), value, record, removed));
    } else {
        if (!node->hasLeft() || !node->hasRight()) {
            TreeNode* child = node->hasLeft() ? node->left() : node->right();
            delete node;
            *removed = true;
            return child;
        }

        TreeNode* minNode = findMin(node->right());
        copyValue(node, minNode);
        node->setRight(removeBalanced(node->right(), minNode->value(), record, removed));
    }

    return rebalance(node, record);
}

TreeNode* AvlTree::rebalance(TreeNode* node, RotationRecord* record)
{
    TreeNode::updateHeight(node);
    const int balance = TreeNode::balanceOf(node);

    if (balance > 1) {
        TreeNode* child = node->left();
        RotationPlan plan;
        plan.pivotKey = node->value();
        plan.childKey = child->value();

        if (TreeNode::balanceOf(child) >= 0) {
            plan.kind = RotationKind::LL;
        } else {
            plan.kind = RotationKind::LR;
            plan.hasGrandchild = true;
            plan.grandchildKey = child->right()->value();
            node->setLeft(rotateLeft(child));
        }

        if (!record->rotated) {
            record->rotated = true;
            record->plan = plan;
        }
        return rotateRight(node);
    }

    if (balance < -1) {
        TreeNode* child = node->right();
        RotationPlan plan;
        plan.pivotKey = node->value();
        plan.childKey = child->value();

        if (TreeNode::balanceOf(child) <= 0) {
            plan.kind = RotationKind::RR;
        } else {
            plan.kind = RotationKind::RL;
            plan.hasGrandchild = true;
            plan.grandchildKey = child->left()->value();
            node->setRight(rotateRight(child));
        }

        if (!record->rotated) {
            record->rotated = true;
            record->plan = plan;
        }
        return rotateLeft(node);
    }

    return node;
}

TreeNode* AvlTree::rotateLeft(TreeNode* node)
{
    TreeNode* pivot = node->right();

    node->setRight(pivot->left());
    pivot->setLeft(node);

    TreeNode::updateHeight(node);
    TreeNode::updateHeight(pivot);
    return pivot;
}

TreeNode* AvlTree::rotateRight(TreeNode* node)
{
    TreeNode* pivot = node->left();

    node->setLeft(pivot->right());
    pivot->setRight(node);

    TreeNode::updateHeight(node);
    TreeNode::updateHeight(pivot);
    return pivot;
}

bool AvlTree::balancedRecursive(const TreeNode* node)
{
    if (!node) return true;

    return std::abs(TreeNode::balanceOf(node)) <= 1
           && balancedRecursive(node->left())
           && balancedRecursive(node->right());
}
