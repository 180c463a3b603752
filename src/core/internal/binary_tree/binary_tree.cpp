// BinaryTree.cpp
#include "binary_tree.h"

#include <QDebug>
#include <QJsonValue>
#include <QQueue>
#include <algorithm>
#include <cmath>
#include <limits>

BinaryTree::BinaryTree(QObject* parent) : AnimatedStructure(parent)
{
}

BinaryTree::~BinaryTree()
{
    TreeNode::deleteSubtree(m_root);
    m_root = nullptr;
}

TreeNode* BinaryTree::find(int value) const
{
    TreeNode* current = m_root;

    while (current) {
        if (value == current->value()) {
            return current;
        } else if (value < current->value()) {
            current = current->left();
        } else {
            current = current->right();
        }
    }

    return nullptr;
}

void BinaryTree::clear()
{
    cancel();

    TreeNode::deleteSubtree(m_root);
    m_root = nullptr;
    m_size = 0;
    emit structureChanged();
}

bool BinaryTree::traverse(TraversalOrder order)
{
    if (!checkReady("traverse")) return false;

    PendingOperation operation;
    operation.kind = PendingOperation::Traversing;
    operation.order = order;
    operation.sequence = traversal(order);

    beginPending(operation, QString("Обход дерева (%1)").arg(traversalOrderName(order)));
    return true;
}

QVector<int> BinaryTree::traversal(TraversalOrder order) const
{
    QVector<int> result;
    result.reserve(m_size);

    if (order == TraversalOrder::LevelOrder) {
        QQueue<const TreeNode*> queue;
        if (m_root) queue.enqueue(m_root);

        while (!queue.isEmpty()) {
            const TreeNode* node = queue.dequeue();
            result.append(node->value());

            if (node->left()) queue.enqueue(node->left());
            if (node->right()) queue.enqueue(node->right());
        }
        return result;
    }

    collect(m_root, order, result);
    return result;
}

void BinaryTree::collect(const TreeNode* node, TraversalOrder order, QVector<int>& result) const
{
    if (!node) return;

    if (order == TraversalOrder::PreOrder) result.append(node->value());
    collect(node->left(), order, result);
    if (order == TraversalOrder::InOrder) result.append(node->value());
    collect(node->right(), order, result);
    if (order == TraversalOrder::PostOrder) result.append(node->value());
}

bool BinaryTree::sameShape(const BinaryTree& other) const
{
    return TreeNode::sameShape(m_root, other.m_root);
}

bool BinaryTree::validateRequest(const OperationRequest& request, QString* error) const
{
    if (request.kind == OperationRequest::Traverse) {
        return true;
    }

    if (error) {
        *error = QString("%1 is not supported by %2")
                     .arg(OperationRequest::kindName(request.kind), structureName());
    }
    return false;
}

bool BinaryTree::executeRequest(const OperationRequest& request)
{
    if (request.kind == OperationRequest::Traverse) {
        return traverse(request.order);
    }

    return reportError(QString("%1 is not supported by %2")
                           .arg(OperationRequest::kindName(request.kind), structureName()));
}

void BinaryTree::updatePending(double progress)
{
    if (m_pending.kind != PendingOperation::Traversing) return;

    m_pending.cursor = cursorIndex(progress, m_pending.sequence.size());
}

void BinaryTree::commitPending()
{
    if (m_pending.kind == PendingOperation::Traversing) {
        finishPending("Обход завершен");
    }
}

void BinaryTree::discardPending()
{
    m_pending = PendingOperation();
}

void BinaryTree::beginPending(const PendingOperation& operation, const QString& description)
{
    m_pending = operation;
    resetProgress();

    qDebug() << structureName() << "pending:" << m_pending.describe();
    emit operationStarted(description);
}

void BinaryTree::finishPending(const QString& description)
{
    m_lastCompleted = m_pending;
    m_pending = PendingOperation();

    qDebug() << structureName() << "committed:" << m_lastCompleted.describe();
    emit committed(m_lastCompleted);
    emit operationFinished(description);
}

int BinaryTree::cursorIndex(double localProgress, int count)
{
    if (count <= 0) return -1;

    const int index = static_cast<int>(std::floor(localProgress * count));
    return std::max(0, std::min(index, count - 1));
}

ComparisonResult BinaryTree::compareValues(int target, int nodeValue)
{
    if (target < nodeValue) return ComparisonResult::Less;
    if (target > nodeValue) return ComparisonResult::Greater;
    return ComparisonResult::Equal;
}

QVector<int> BinaryTree::descentPath(int value) const
{
    QVector<int> path;
    const TreeNode* current = m_root;

    while (current) {
        path.append(current->value());

        if (value == current->value()) {
            break;
        }
        current = value < current->value() ? current->left() : current->right();
    }

    return path;
}

int BinaryTree::heightRecursive(const TreeNode* node)
{
    if (!node) return 0;

    return 1 + std::max(heightRecursive(node->left()), heightRecursive(node->right()));
}

// === Сериализация ===

QJsonObject BinaryTree::toJson() const
{
    QJsonObject json;
    json["root"] = m_root ? QJsonValue(nodeToJson(m_root)) : QJsonValue(QJsonValue::Null);
    return json;
}

QJsonObject BinaryTree::nodeToJson(const TreeNode* node) const
{
    QJsonObject json;
    json["value"] = node->value();
    if (tracksHeight()) {
        json["height"] = node->height();
    }
    json["left"] = node->left() ? QJsonValue(nodeToJson(node->left())) : QJsonValue(QJsonValue::Null);
    json["right"] = node->right() ? QJsonValue(nodeToJson(node->right())) : QJsonValue(QJsonValue::Null);
    return json;
}

bool BinaryTree::fromJson(const QJsonObject& json)
{
    const QJsonValue rootValue = json.value("root");
    TreeNode* loaded = nullptr;
    QString error;

    if (!rootValue.isUndefined() && !rootValue.isNull()) {
        if (!rootValue.isObject()) {
            return reportError("load: \"root\" must be an object or null");
        }

        loaded = nodeFromJson(rootValue.toObject(), &error);
        if (!loaded) {
            return reportError(QString("load: %1").arg(error));
        }

        if (!checkLoadedShape(loaded, &error)) {
            TreeNode::deleteSubtree(loaded);
            return reportError(QString("load: %1").arg(error));
        }
    }

    // Загрузка всегда сбрасывает отложенную операцию
    cancel();

    TreeNode::deleteSubtree(m_root);
    m_root = loaded;
    m_size = TreeNode::countNodes(m_root);

    qDebug() << structureName() << "loaded" << m_size << "nodes";
    emit structureChanged();
    return true;
}

TreeNode* BinaryTree::nodeFromJson(const QJsonObject& json, QString* error) const
{
    const QJsonValue value = json.value("value");
    const double number = value.toDouble();

    if (!value.isDouble() || std::floor(number) != number
        || number < std::numeric_limits<int>::min()
        || number > std::numeric_limits<int>::max()) {
        *error = "node \"value\" must be an integer";
        return nullptr;
    }

    TreeNode* node = new TreeNode(static_cast<int>(number));

    if (tracksHeight()) {
        node->setHeight(json.value("height").toInt(1));
    }

    const QJsonValue left = json.value("left");
    const QJsonValue right = json.value("right");

    if ((!left.isUndefined() && !left.isNull() && !left.isObject())
        || (!right.isUndefined() && !right.isNull() && !right.isObject())) {
        *error = QString("children of node %1 must be objects or null").arg(node->value());
        delete node;
        return nullptr;
    }

    if (left.isObject()) {
        TreeNode* child = nodeFromJson(left.toObject(), error);
        if (!child) {
            delete node;
            return nullptr;
        }
        node->setLeft(child);
    }

    if (right.isObject()) {
        TreeNode* child = nodeFromJson(right.toObject(), error);
        if (!child) {
            TreeNode::deleteSubtree(node);
            return nullptr;
        }
        node->setRight(child);
    }

    return node;
}

bool BinaryTree::checkLoadedShape(const TreeNode* root, QString* error) const
{
    if (!checkOrdering(root, nullptr, nullptr)) {
        *error = "values violate the search tree ordering";
        return false;
    }

    if (tracksHeight() && !checkHeights(root)) {
        *error = "stored heights do not match the tree shape";
        return false;
    }

    return true;
}

bool BinaryTree::checkOrdering(const TreeNode* node, const int* low, const int* high)
{
    if (!node) return true;

    const int value = node->value();
    if ((low && value <= *low) || (high && value >= *high)) {
        return false;
    }

    return checkOrdering(node->left(), low, &value)
           && checkOrdering(node->right(), &value, high);
}

bool BinaryTree::checkHeights(const TreeNode* node)
{
    if (!node) return true;

    if (!checkHeights(node->left()) || !checkHeights(node->right())) {
        return false;
    }

    return node->height()
           == 1 + std::max(TreeNode::heightOf(node->left()), TreeNode::heightOf(node->right()));
}
