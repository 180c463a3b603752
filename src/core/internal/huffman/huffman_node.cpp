#include "huffman_node.h"

#include <algorithm>

HuffmanNode::HuffmanNode(const QString& symbol, int frequency, int order)
    : m_symbol(symbol)
    , m_frequency(frequency)
    , m_order(order)
{}

HuffmanNode::HuffmanNode(HuffmanNode* left, HuffmanNode* right, int order)
    : m_frequency(left->frequency() + right->frequency())
    , m_order(order)
    , m_left(left)
    , m_right(right)
{}

FragmentInfo HuffmanNode::info() const
{
    FragmentInfo fragment;
    fragment.symbol = m_symbol;
    fragment.frequency = m_frequency;
    fragment.order = m_order;
    fragment.leaf = isLeaf();
    return fragment;
}

void HuffmanNode::deleteSubtree(HuffmanNode* node)
{
    if (!node) return;

    deleteSubtree(node->m_left);
    deleteSubtree(node->m_right);
    delete node;
}

bool HuffmanNode::sameShape(const HuffmanNode* a, const HuffmanNode* b)
{
    if (!a || !b)
    {
        return a == b;
    }

    return a->m_symbol == b->m_symbol
           && a->m_frequency == b->m_frequency
           && sameShape(a->m_left, b->m_left)
           && sameShape(a->m_right, b->m_right);
}

int HuffmanNode::depth(const HuffmanNode* node)
{
    if (!node) return 0;

    return 1 + std::max(depth(node->m_left), depth(node->m_right));
}
