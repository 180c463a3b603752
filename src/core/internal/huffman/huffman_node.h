// core/internal/huffman/huffman_node.h
#ifndef HUFFMAN_NODE_H
#define HUFFMAN_NODE_H

#include <QString>
#include <QtGlobal>

struct HuffmanSymbol
{
    QString symbol;
    int frequency = 0;
};

// Снимок фрагмента очереди для внешних потребителей (без указателей)
struct FragmentInfo
{
    QString symbol;     // пусто для внутренних узлов
    int frequency = 0;
    int order = 0;      // порядок появления в очереди, разрешает равенство частот
    bool leaf = true;

    bool operator==(const FragmentInfo& other) const
    {
        return symbol == other.symbol && frequency == other.frequency
               && order == other.order && leaf == other.leaf;
    }
};

class HuffmanNode
{
public:
    // Лист
    HuffmanNode(const QString& symbol, int frequency, int order);
    // Внутренний узел, частота = сумма частот детей
    HuffmanNode(HuffmanNode* left, HuffmanNode* right, int order);

    QString symbol() const { return m_symbol; }
    int frequency() const { return m_frequency; }
    int order() const { return m_order; }
    HuffmanNode* left() const { return m_left; }
    HuffmanNode* right() const { return m_right; }
    bool isLeaf() const { return !m_left && !m_right; }

    FragmentInfo info() const;

    static void deleteSubtree(HuffmanNode* node);
    static bool sameShape(const HuffmanNode* a, const HuffmanNode* b);
    static int depth(const HuffmanNode* node);

private:
    QString m_symbol;
    int m_frequency;
    int m_order;
    HuffmanNode* m_left = nullptr;
    HuffmanNode* m_right = nullptr;

    Q_DISABLE_COPY(HuffmanNode)
};

#endif // HUFFMAN_NODE_H
