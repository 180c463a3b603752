// core/internal/bst/binary_search_tree.h
#ifndef BINARY_SEARCH_TREE_H
#define BINARY_SEARCH_TREE_H

#include "../binary_tree/binary_tree.h"

class BinarySearchTree : public BinaryTree
{
    Q_OBJECT

public:
    explicit BinarySearchTree(QObject* parent = nullptr);
    ~BinarySearchTree() override;

    QString structureName() const override { return "BST"; }

    // Базовые операции. Каждая только готовит отложенное состояние,
    // дерево меняется при коммите (прогресс 1.0).
    // Вставка существующего значения - не ошибка: возвращается true,
    // отложенная операция не создается.
    bool insert(int value);
    bool search(int value);
    bool remove(int value);

    bool validateRequest(const OperationRequest& request, QString* error) const override;

protected:
    bool executeRequest(const OperationRequest& request) override;
    void updatePending(double progress) override;
    void commitPending() override;

    // Вызывается перед началом вставки в непустое дерево
    virtual void prepareInsert(PendingOperation& operation) { Q_UNUSED(operation); }

    // Реальные мутации, вызываются только из commitPending()
    virtual void commitInsert(int value);
    virtual void commitRemove(int value);

    // Курсор по пути спуска и результат сравнения с текущим узлом
    void updateDescent(double localProgress);

    void updateSearchTerminal();

    static TreeNode* findMin(TreeNode* node);
    static void copyValue(TreeNode* to, const TreeNode* from) { to->m_value = from->m_value; }

private:
    TreeNode* insertRecursive(TreeNode* node, int value);
    TreeNode* removeRecursive(TreeNode* node, int value);

    Q_DISABLE_COPY(BinarySearchTree)
};

#endif // BINARY_SEARCH_TREE_H
