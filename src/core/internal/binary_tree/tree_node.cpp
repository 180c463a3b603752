#include "tree_node.h"

#include <algorithm>

TreeNode::TreeNode(int value)
    : m_value(value)
{}

int TreeNode::balanceOf(const TreeNode* node)
{
    if (!node) return 0;

    return heightOf(node->m_left) - heightOf(node->m_right);
}

void TreeNode::updateHeight(TreeNode* node)
{
    if (node)
    {
        node->m_height = 1 + std::max(heightOf(node->m_left), heightOf(node->m_right));
    }
}

TreeNode* TreeNode::cloneSubtree(const TreeNode* node)
{
    if (!node) return nullptr;

    TreeNode* copy = new TreeNode(node->m_value);
    copy->m_height = node->m_height;
    copy->m_left = cloneSubtree(node->m_left);
    copy->m_right = cloneSubtree(node->m_right);
    return copy;
}

void TreeNode::deleteSubtree(TreeNode* node)
{
    if (!node) return;

    deleteSubtree(node->m_left);
    deleteSubtree(node->m_right);
    delete node;
}

bool TreeNode::sameShape(const TreeNode* a, const TreeNode* b)
{
    if (!a || !b)
    {
        return a == b;
    }

    return a->m_value == b->m_value
           && a->m_height == b->m_height
           && sameShape(a->m_left, b->m_left)
           && sameShape(a->m_right, b->m_right);
}

int TreeNode::countNodes(const TreeNode* node)
{
    if (!node) return 0;

    return 1 + countNodes(node->m_left) + countNodes(node->m_right);
}
