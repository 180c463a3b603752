#include "binary_tree_generator.h"

#include <QSet>

#include <algorithm>
#include <functional>

BinaryTreeGenerator::BinaryTreeGenerator(QObject* parent)
    : QObject(parent)
    , m_random(QRandomGenerator::securelySeeded())
{
}

void BinaryTreeGenerator::setSeed(quint32 seed)
{
    m_random.seed(seed);
}

QVector<int> BinaryTreeGenerator::generateValues(BinaryTreeType type, int nodeCount)
{
    QVector<int> values;

    switch (type) {
    case Random:
        values = generateRandomValues(nodeCount);
        break;
    case LeftHeavy:
        values = generateLeftHeavyValues(nodeCount);
        break;
    case RightHeavy:
        values = generateRightHeavyValues(nodeCount);
        break;
    }

    emit valuesGenerated(values);
    return values;
}

QVector<int> BinaryTreeGenerator::generateRandomValues(int nodeCount)
{
    QVector<int> values = distinctValues(nodeCount);
    std::shuffle(values.begin(), values.end(), m_random);
    return values;
}

QVector<int> BinaryTreeGenerator::generateLeftHeavyValues(int nodeCount)
{
    auto values = distinctValues(nodeCount);
    std::sort(values.begin(), values.end(), std::greater<int>());
    return values;
}

QVector<int> BinaryTreeGenerator::generateRightHeavyValues(int nodeCount)
{
    auto values = distinctValues(nodeCount);
    std::sort(values.begin(), values.end());
    return values;
}

QVector<OperationRequest> BinaryTreeGenerator::generateInsertBatch(BinaryTreeType type, int nodeCount)
{
    return OperationRequest::insertBatch(generateValues(type, nodeCount));
}

bool BinaryTreeGenerator::parseType(const QString& name, BinaryTreeType* type)
{
    const QString key = name.trimmed().toLower();

    if (key == "random") {
        *type = Random;
    } else if (key == "left" || key == "descending") {
        *type = LeftHeavy;
    } else if (key == "right" || key == "ascending") {
        *type = RightHeavy;
    } else {
        return false;
    }
    return true;
}

QVector<int> BinaryTreeGenerator::distinctValues(int count)
{
    QVector<int> values;
    if (count <= 0) return values;

    values.reserve(count);

    QSet<int> used;
    while (values.size() < count)
    {
        int value = randomInt(count * 2);

        if (!used.contains(value))
        {
            used.insert(value);
            values.append(value);
        }
    }

    return values;
}

int BinaryTreeGenerator::randomInt(int max)
{
    return m_random.bounded(max + 1);
}
