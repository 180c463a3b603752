#include "huffman_tree.h"

#include <QDebug>
#include <QJsonArray>
#include <QSet>
#include <algorithm>

QString mergePhaseName(MergePhase phase)
{
    switch (phase) {
    case MergePhase::Select:
        return "select";
    case MergePhase::Move:
        return "move";
    case MergePhase::Merge:
        return "merge";
    case MergePhase::Return:
        return "return";
    case MergePhase::Done:
        return "done";
    }
    return QString();
}

HuffmanTree::HuffmanTree(QObject* parent)
    : AnimatedStructure(parent)
    , m_phaseBreaks({0.25, 0.5, 0.75, 1.0})
{
}

HuffmanTree::~HuffmanTree()
{
    releaseQueue();
}

bool HuffmanTree::build(const QVector<HuffmanSymbol>& symbols)
{
    if (!checkReady("build")) return false;

    QString error;
    if (!validateSymbols(symbols, &error)) {
        return reportError(QString("build: %1").arg(error));
    }

    emit operationStarted(QString("Построение дерева Хаффмана (%1 символов)").arg(symbols.size()));
    loadSymbols(symbols);
    emit operationFinished("Очередь фрагментов готова");
    return true;
}

bool HuffmanTree::mergeStep()
{
    if (!checkReady("merge_step")) return false;

    if (!m_built) {
        return reportError("merge_step: no symbols loaded, call build() first");
    }

    if (m_queue.size() < 2) {
        return reportError("merge_step: tree is already complete");
    }

    m_stepPending = true;
    m_phase = MergePhase::Select;
    resetProgress();

    qDebug() << structureName() << "round" << m_round + 1 << "of" << m_totalRounds
             << "pair" << m_queue.at(0)->frequency() << m_queue.at(1)->frequency();
    emit operationStarted(QString("Раунд слияния %1").arg(m_round + 1));
    return true;
}

bool HuffmanTree::buildImmediately()
{
    if (!checkReady("build")) return false;

    if (!m_built) {
        return reportError("build: no symbols loaded, call build() first");
    }

    while (m_queue.size() >= 2) {
        commitRound();
    }

    emit operationFinished("Дерево Хаффмана построено");
    return true;
}

void HuffmanTree::clear()
{
    cancel();
    releaseQueue();

    m_symbols.clear();
    m_built = false;
    m_phase = MergePhase::Done;
    m_round = 0;
    m_totalRounds = 0;
    m_nextOrder = 0;
    emit structureChanged();
}

HuffmanNode* HuffmanTree::root() const
{
    if (!isDone() || m_queue.isEmpty()) {
        return nullptr;
    }
    return m_queue.first();
}

MergePhase HuffmanTree::phase() const
{
    if (m_stepPending) {
        return m_phase;
    }
    return m_queue.size() >= 2 ? MergePhase::Select : MergePhase::Done;
}

MergePhaseState HuffmanTree::mergePhase() const
{
    MergePhaseState state;
    state.phase = phase();
    state.round = m_round;
    state.totalRounds = m_totalRounds;
    state.queueBefore = queue();

    if (m_queue.size() >= 2) {
        state.currentPair = state.queueBefore.mid(0, 2);
    }

    if (!m_stepPending) {
        state.queueAfter = state.queueBefore;
        return state;
    }

    state.queueAfter = predictedQueueAfter();
    if (m_phase == MergePhase::Merge || m_phase == MergePhase::Return) {
        state.hasParentCandidate = true;
        state.parentCandidate = parentCandidate();
    }

    return state;
}

QVector<FragmentInfo> HuffmanTree::queue() const
{
    QVector<FragmentInfo> fragments;
    fragments.reserve(m_queue.size());

    for (const HuffmanNode* node : m_queue) {
        fragments.append(node->info());
    }
    return fragments;
}

int HuffmanTree::queueFrequencyTotal() const
{
    int total = 0;
    for (const HuffmanNode* node : m_queue) {
        total += node->frequency();
    }
    return total;
}

bool HuffmanTree::setPhaseBreaks(const QVector<double>& breaks)
{
    if (!validPhaseBreaks(breaks, 4)) {
        return reportError("phase breaks must be four increasing values ending at 1.0");
    }

    m_phaseBreaks = breaks;
    return true;
}

bool HuffmanTree::sameShape(const HuffmanTree& other) const
{
    if (m_queue.size() != other.m_queue.size()) {
        return false;
    }

    for (int i = 0; i < m_queue.size(); ++i) {
        if (!HuffmanNode::sameShape(m_queue.at(i), other.m_queue.at(i))) {
            return false;
        }
    }
    return true;
}

// === Анимация раунда ===

bool HuffmanTree::validateRequest(const OperationRequest& request, QString* error) const
{
    if (request.kind == OperationRequest::MergeStep) {
        return true;
    }

    if (error) {
        *error = QString("%1 is not supported by %2")
                     .arg(OperationRequest::kindName(request.kind), structureName());
    }
    return false;
}

bool HuffmanTree::executeRequest(const OperationRequest& request)
{
    if (request.kind == OperationRequest::MergeStep) {
        return mergeStep();
    }

    return reportError(QString("%1 is not supported by %2")
                           .arg(OperationRequest::kindName(request.kind), structureName()));
}

void HuffmanTree::updatePending(double progress)
{
    MergePhase phase = MergePhase::Return;

    if (progress < m_phaseBreaks.at(0)) {
        phase = MergePhase::Select;
    } else if (progress < m_phaseBreaks.at(1)) {
        phase = MergePhase::Move;
    } else if (progress < m_phaseBreaks.at(2)) {
        phase = MergePhase::Merge;
    }

    if (phase != m_phase) {
        m_phase = phase;
        qDebug() << structureName() << "round" << m_round + 1 << "phase" << mergePhaseName(m_phase);
    }
}

void HuffmanTree::commitPending()
{
    commitRound();

    m_stepPending = false;
    emit roundCommitted(m_round);
    emit operationFinished(isDone() ? QString("Дерево Хаффмана построено")
                                    : QString("Раунд %1 завершен").arg(m_round));
}

void HuffmanTree::discardPending()
{
    m_stepPending = false;
    m_phase = MergePhase::Select;
}

void HuffmanTree::commitRound()
{
    HuffmanNode* first = m_queue.takeFirst();
    HuffmanNode* second = m_queue.takeFirst();
    HuffmanNode* parent = new HuffmanNode(first, second, m_nextOrder++);

    const int index = spliceIndex(queue(), parent->frequency());
    m_queue.insert(index, parent);
    m_round++;

    m_phase = m_queue.size() >= 2 ? MergePhase::Select : MergePhase::Done;
    emit structureChanged();
}

FragmentInfo HuffmanTree::parentCandidate() const
{
    FragmentInfo candidate;
    candidate.frequency = m_queue.at(0)->frequency() + m_queue.at(1)->frequency();
    candidate.order = m_nextOrder;
    candidate.leaf = false;
    return candidate;
}

QVector<FragmentInfo> HuffmanTree::predictedQueueAfter() const
{
    QVector<FragmentInfo> after = queue().mid(2);
    const FragmentInfo candidate = parentCandidate();

    after.insert(spliceIndex(after, candidate.frequency), candidate);
    return after;
}

int HuffmanTree::spliceIndex(const QVector<FragmentInfo>& queue, int frequency)
{
    int index = 0;
    while (index < queue.size() && queue.at(index).frequency <= frequency) {
        ++index;
    }
    return index;
}

// === Загрузка символов ===

bool HuffmanTree::validateSymbols(const QVector<HuffmanSymbol>& symbols, QString* error)
{
    QSet<QString> seen;

    for (const HuffmanSymbol& entry : symbols) {
        if (entry.symbol.isEmpty()) {
            *error = "symbol must not be empty";
            return false;
        }
        if (entry.frequency < 0) {
            *error = QString("frequency of '%1' must not be negative").arg(entry.symbol);
            return false;
        }
        if (seen.contains(entry.symbol)) {
            *error = QString("symbol '%1' is listed twice").arg(entry.symbol);
            return false;
        }
        seen.insert(entry.symbol);
    }

    return true;
}

void HuffmanTree::loadSymbols(const QVector<HuffmanSymbol>& symbols)
{
    releaseQueue();

    m_symbols = symbols;
    m_queue.reserve(symbols.size());

    for (int i = 0; i < symbols.size(); ++i) {
        m_queue.append(new HuffmanNode(symbols.at(i).symbol, symbols.at(i).frequency, i));
    }

    // Устойчивая сортировка: при равных частотах раньше идет введенный раньше
    std::stable_sort(m_queue.begin(), m_queue.end(),
                     [](const HuffmanNode* a, const HuffmanNode* b) {
                         return a->frequency() < b->frequency();
                     });

    m_built = true;
    m_round = 0;
    m_totalRounds = std::max(0, static_cast<int>(symbols.size()) - 1);
    m_nextOrder = symbols.size();
    m_phase = m_queue.size() >= 2 ? MergePhase::Select : MergePhase::Done;

    qDebug() << structureName() << "loaded" << symbols.size() << "symbols,"
             << m_totalRounds << "rounds to go";
    emit structureChanged();
}

void HuffmanTree::releaseQueue()
{
    for (HuffmanNode* node : m_queue) {
        HuffmanNode::deleteSubtree(node);
    }
    m_queue.clear();
}

// === Коды ===

QMap<QString, QString> HuffmanTree::codeTable() const
{
    QMap<QString, QString> codes;

    if (const HuffmanNode* top = root()) {
        generateCodes(top, QString(), codes);
    }
    return codes;
}

void HuffmanTree::generateCodes(const HuffmanNode* node, const QString& prefix,
                                QMap<QString, QString>& codes) const
{
    if (!node) return;

    if (node->isLeaf()) {
        codes.insert(node->symbol(), prefix.isEmpty() ? QString("0") : prefix);
        return;
    }

    generateCodes(node->left(), prefix + '0', codes);
    generateCodes(node->right(), prefix + '1', codes);
}

bool HuffmanTree::encode(const QString& text, QString* bits)
{
    if (!root()) {
        return reportError("encode: tree is not built yet");
    }

    const QMap<QString, QString> codes = codeTable();
    QString result;

    for (const QChar ch : text) {
        const auto it = codes.constFind(QString(ch));
        if (it == codes.constEnd()) {
            return reportError(QString("encode: symbol '%1' is not in the tree").arg(ch));
        }
        result += it.value();
    }

    *bits = result;
    return true;
}

bool HuffmanTree::decode(const QString& bits, QString* text)
{
    const HuffmanNode* top = root();
    if (!top) {
        return reportError("decode: tree is not built yet");
    }

    QString result;
    const HuffmanNode* current = top;

    for (const QChar bit : bits) {
        if (bit != '0' && bit != '1') {
            return reportError(QString("decode: unexpected character '%1'").arg(bit));
        }

        if (top->isLeaf()) {
            // Единственный символ кодируется "0"
            if (bit != '0') {
                return reportError("decode: bit string does not match the tree");
            }
            result += top->symbol();
            continue;
        }

        current = bit == '0' ? current->left() : current->right();
        if (current->isLeaf()) {
            result += current->symbol();
            current = top;
        }
    }

    if (current != top) {
        return reportError("decode: bit string ends in the middle of a code");
    }

    *text = result;
    return true;
}

// === Сериализация ===

QJsonObject HuffmanTree::toJson() const
{
    QJsonArray symbols;
    for (const HuffmanSymbol& entry : m_symbols) {
        QJsonObject item;
        item["symbol"] = entry.symbol;
        item["frequency"] = entry.frequency;
        symbols.append(item);
    }

    QJsonObject json;
    json["symbols"] = symbols;
    json["round"] = m_round;

    const HuffmanNode* top = root();
    json["root"] = top ? QJsonValue(nodeToJson(top)) : QJsonValue(QJsonValue::Null);
    return json;
}

QJsonObject HuffmanTree::nodeToJson(const HuffmanNode* node) const
{
    QJsonObject json;
    json["frequency"] = node->frequency();

    if (node->isLeaf()) {
        json["symbol"] = node->symbol();
    } else {
        json["left"] = nodeToJson(node->left());
        json["right"] = nodeToJson(node->right());
    }
    return json;
}

bool HuffmanTree::fromJson(const QJsonObject& json)
{
    const QJsonValue symbolsValue = json.value("symbols");
    if (!symbolsValue.isArray()) {
        return reportError("load: \"symbols\" must be an array");
    }

    QVector<HuffmanSymbol> symbols;
    for (const QJsonValue& value : symbolsValue.toArray()) {
        const QJsonObject item = value.toObject();
        if (!item.value("symbol").isString() || !item.value("frequency").isDouble()) {
            return reportError("load: each symbol needs \"symbol\" and integer \"frequency\"");
        }

        HuffmanSymbol entry;
        entry.symbol = item.value("symbol").toString();
        entry.frequency = item.value("frequency").toInt(-1);
        symbols.append(entry);
    }

    QString error;
    if (!validateSymbols(symbols, &error)) {
        return reportError(QString("load: %1").arg(error));
    }

    // Без "round" запись считается законченным деревом
    const int lastRound = std::max(0, static_cast<int>(symbols.size()) - 1);
    int rounds = lastRound;

    const QJsonValue roundValue = json.value("round");
    if (!roundValue.isUndefined()) {
        rounds = roundValue.toInt(-1);
        if (!roundValue.isDouble() || rounds < 0 || rounds > lastRound) {
            return reportError(QString("load: \"round\" must be an integer in [0, %1]").arg(lastRound));
        }
    }

    // Загрузка сбрасывает незавершенный раунд и повторяет сохраненные
    cancel();
    loadSymbols(symbols);

    for (int i = 0; i < rounds; ++i) {
        commitRound();
    }

    qDebug() << structureName() << "restored at round" << m_round << "of" << m_totalRounds;
    return true;
}
