// generators/binary_tree_generator.h
#ifndef BINARYTREEGENERATOR_H
#define BINARYTREEGENERATOR_H

#include <QObject>
#include <QRandomGenerator>
#include <QVector>

#include "../animation/operation_request.h"

enum BinaryTreeType
{
    Random,
    LeftHeavy,
    RightHeavy
};

// Генерация наборов различных значений для демонстрации вставки.
// LeftHeavy - по убыванию (в BST вырождается в левую цепочку),
// RightHeavy - по возрастанию.
class BinaryTreeGenerator : public QObject
{
    Q_OBJECT

public:
    explicit BinaryTreeGenerator(QObject* parent = nullptr);

    // Фиксированное зерно делает наборы воспроизводимыми
    void setSeed(quint32 seed);

    QVector<int> generateValues(BinaryTreeType type, int nodeCount);

    QVector<int> generateRandomValues(int nodeCount);
    QVector<int> generateLeftHeavyValues(int nodeCount);
    QVector<int> generateRightHeavyValues(int nodeCount);

    QVector<OperationRequest> generateInsertBatch(BinaryTreeType type, int nodeCount);

    static bool parseType(const QString& name, BinaryTreeType* type);

signals:
    void valuesGenerated(const QVector<int>& values);

private:
    QVector<int> distinctValues(int count);
    int randomInt(int max);

    QRandomGenerator m_random;
};


#endif // BINARYTREEGENERATOR_H
