// TreeNode.h (только узел)
#ifndef TREENODE_H
#define TREENODE_H

#include <QtGlobal>

// Узел дерева. Дочерними узлами владеет дерево (BinaryTree),
// узел сам ничего не удаляет.
class TreeNode
{
public:
    explicit TreeNode(int value);

    int value() const { return m_value; }
    TreeNode* left() const { return m_left; }
    TreeNode* right() const { return m_right; }

    // Высота поддерева, лист = 1 (поддерживается только AVL-деревом)
    int height() const { return m_height; }

    void setLeft(TreeNode* left) { m_left = left; }
    void setRight(TreeNode* right) { m_right = right; }
    void setHeight(int height) { m_height = height; }

    // Вспомогательные
    bool isLeaf() const { return !m_left && !m_right; }
    bool hasLeft() const { return m_left != nullptr; }
    bool hasRight() const { return m_right != nullptr; }
    int childCount() const { return (m_left ? 1 : 0) + (m_right ? 1 : 0); }

    static int heightOf(const TreeNode* node) { return node ? node->m_height : 0; }
    static int balanceOf(const TreeNode* node);

    // 1 + max(высота левого, высота правого)
    static void updateHeight(TreeNode* node);

    static TreeNode* cloneSubtree(const TreeNode* node);
    static void deleteSubtree(TreeNode* node);
    static bool sameShape(const TreeNode* a, const TreeNode* b);
    static int countNodes(const TreeNode* node);

private:
    friend class BinarySearchTree;

    int m_value;
    int m_height = 1;
    TreeNode* m_left = nullptr;
    TreeNode* m_right = nullptr;

    Q_DISABLE_COPY(TreeNode)
};

#endif // TREENODE_H
