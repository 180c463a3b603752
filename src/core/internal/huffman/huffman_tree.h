// core/internal/huffman/huffman_tree.h
#ifndef HUFFMAN_TREE_H
#define HUFFMAN_TREE_H

#include <QJsonObject>
#include <QMap>
#include <QVector>

#include "huffman_node.h"
#include "../../animation/animated_structure.h"

enum class MergePhase
{
    Select,
    Move,
    Merge,
    Return,
    Done
};

QString mergePhaseName(MergePhase phase);

struct MergePhaseState
{
    MergePhase phase = MergePhase::Done;
    QVector<FragmentInfo> queueBefore;
    QVector<FragmentInfo> queueAfter;
    QVector<FragmentInfo> currentPair;
    bool hasParentCandidate = false;
    FragmentInfo parentCandidate;
    int round = 0;
    int totalRounds = 0;
};

// Построение дерева Хаффмана по раундам. Каждый шаг слияния (mergeStep)
// анимируется фазами Select -> Move -> Merge -> Return; очередь меняется
// только при коммите фазы Return.
class HuffmanTree : public AnimatedStructure
{
    Q_OBJECT

public:
    explicit HuffmanTree(QObject* parent = nullptr);
    ~HuffmanTree() override;

    QString structureName() const override { return "Huffman"; }

    // Загружает листья в порядке частот (равные частоты - в порядке ввода)
    bool build(const QVector<HuffmanSymbol>& symbols);

    // Запрос одного раунда слияния
    bool mergeStep();

    // Выполнить все оставшиеся раунды без анимации
    bool buildImmediately();

    void clear();

    bool isIdle() const override { return !m_stepPending; }
    bool isBuilt() const { return m_built; }
    bool isDone() const { return !m_stepPending && m_queue.size() <= 1; }

    // Корень готового дерева; nullptr, пока построение не завершено
    HuffmanNode* root() const;

    MergePhase phase() const;
    MergePhaseState mergePhase() const;
    QVector<FragmentInfo> queue() const;
    int queueFrequencyTotal() const;
    int round() const { return m_round; }
    int totalRounds() const { return m_totalRounds; }
    QVector<HuffmanSymbol> symbols() const { return m_symbols; }

    // Коды листьев: левая ветвь - 0, правая - 1. Единственный лист получает "0".
    QMap<QString, QString> codeTable() const;
    bool encode(const QString& text, QString* bits);
    bool decode(const QString& bits, QString* text);

    // Границы фаз Select/Move/Merge/Return, по умолчанию (0.25, 0.5, 0.75, 1.0)
    bool setPhaseBreaks(const QVector<double>& breaks);
    QVector<double> phaseBreaks() const { return m_phaseBreaks; }

    bool sameShape(const HuffmanTree& other) const;

    QJsonObject toJson() const;
    bool fromJson(const QJsonObject& json);

    bool validateRequest(const OperationRequest& request, QString* error) const override;

signals:
    void roundCommitted(int round);

protected:
    bool executeRequest(const OperationRequest& request) override;
    void updatePending(double progress) override;
    void commitPending() override;
    void discardPending() override;

private:
    static bool validateSymbols(const QVector<HuffmanSymbol>& symbols, QString* error);
    void loadSymbols(const QVector<HuffmanSymbol>& symbols);
    void releaseQueue();
    void commitRound();

    FragmentInfo parentCandidate() const;
    QVector<FragmentInfo> predictedQueueAfter() const;

    // Индекс вставки: после всех фрагментов с частотой <= frequency
    static int spliceIndex(const QVector<FragmentInfo>& queue, int frequency);

    void generateCodes(const HuffmanNode* node, const QString& prefix,
                       QMap<QString, QString>& codes) const;
    QJsonObject nodeToJson(const HuffmanNode* node) const;

    QVector<HuffmanNode*> m_queue;
    QVector<HuffmanSymbol> m_symbols;
    QVector<double> m_phaseBreaks;

    bool m_built = false;
    bool m_stepPending = false;
    MergePhase m_phase = MergePhase::Done;
    int m_round = 0;
    int m_totalRounds = 0;
    int m_nextOrder = 0;

    Q_DISABLE_COPY(HuffmanTree)
};

#endif // HUFFMAN_TREE_H
