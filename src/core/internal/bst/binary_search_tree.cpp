#include "binary_search_tree.h"

#include <QDebug>

BinarySearchTree::BinarySearchTree(QObject* parent)
    : BinaryTree(parent)
{
}

BinarySearchTree::~BinarySearchTree()
{
}

bool BinarySearchTree::insert(int value)
{
    if (!checkReady("insert")) return false;

    PendingOperation operation;
    operation.value = value;

    if (m_root == nullptr) {
        operation.kind = PendingOperation::CreatingRoot;
        beginPending(operation, QString("Создание корня %1").arg(value));
        return true;
    }

    operation.path = descentPath(value);

    if (operation.path.last() == value) {
        // Дубликаты не допускаются - вставка ничего не делает
        qDebug() << structureName() << "insert: value" << value << "already present";
        emit operationFinished(QString("Значение %1 уже есть в дереве").arg(value));
        return true;
    }

    operation.kind = PendingOperation::Inserting;
    operation.parentKey = operation.path.last();
    operation.side = value < operation.parentKey ? ChildSide::Left : ChildSide::Right;
    prepareInsert(operation);

    beginPending(operation, QString("Вставка значения %1").arg(value));
    return true;
}

bool BinarySearchTree::search(int value)
{
    if (!checkReady("search")) return false;

    PendingOperation operation;
    operation.kind = PendingOperation::Searching;
    operation.value = value;
    operation.path = descentPath(value);

    beginPending(operation, QString("Поиск значения %1").arg(value));
    return true;
}

bool BinarySearchTree::remove(int value)
{
    if (!checkReady("delete")) return false;

    PendingOperation operation;
    operation.kind = PendingOperation::Deleting;
    operation.value = value;

    TreeNode* target = find(value);
    if (!target) {
        // Путь пустой, коммит ничего не меняет
        operation.deleteCase = DeleteCase::NotFound;
        beginPending(operation, QString("Удаление значения %1 (не найдено)").arg(value));
        return true;
    }

    operation.path = descentPath(value);

    switch (target->childCount()) {
    case 0:
        operation.deleteCase = DeleteCase::NoChildren;
        break;
    case 1:
        operation.deleteCase = DeleteCase::OneChild;
        break;
    default:
        // Преемник нужен уже сейчас - анимация показывает его до мутации
        operation.deleteCase = DeleteCase::TwoChildren;
        operation.hasReplacement = true;
        operation.replacement = findMin(target->right())->value();
        break;
    }

    beginPending(operation, QString("Удаление значения %1").arg(value));
    return true;
}

bool BinarySearchTree::validateRequest(const OperationRequest& request, QString* error) const
{
    int value = 0;

    switch (request.kind) {
    case OperationRequest::Insert:
    case OperationRequest::Search:
    case OperationRequest::Remove:
        return request.valueArgument(&value, error);
    default:
        return BinaryTree::validateRequest(request, error);
    }
}

bool BinarySearchTree::executeRequest(const OperationRequest& request)
{
    int value = 0;
    QString error;

    switch (request.kind) {
    case OperationRequest::Insert:
    case OperationRequest::Search:
    case OperationRequest::Remove:
        if (!request.valueArgument(&value, &error)) {
            return reportError(error);
        }
        break;
    default:
        return BinaryTree::executeRequest(request);
    }

    if (request.kind == OperationRequest::Insert) return insert(value);
    if (request.kind == OperationRequest::Search) return search(value);
    return remove(value);
}

void BinarySearchTree::updatePending(double progress)
{
    switch (m_pending.kind) {
    case PendingOperation::Inserting:
    case PendingOperation::Deleting:
        updateDescent(progress);
        break;
    case PendingOperation::Searching:
        if (progress >= 1.0) {
            updateSearchTerminal();
        } else {
            updateDescent(progress);
        }
        break;
    case PendingOperation::Traversing:
        BinaryTree::updatePending(progress);
        break;
    default:
        break;
    }
}

void BinarySearchTree::updateDescent(double localProgress)
{
    m_pending.cursor = cursorIndex(localProgress, m_pending.path.size());
    m_pending.comparison = m_pending.cursor >= 0
                               ? compareValues(m_pending.value, m_pending.path.at(m_pending.cursor))
                               : ComparisonResult::None;
}

void BinarySearchTree::updateSearchTerminal()
{
    const QVector<int>& path = m_pending.path;

    m_pending.cursor = path.size() - 1;
    m_pending.hasTerminalKey = !path.isEmpty();

    if (!path.isEmpty() && path.last() == m_pending.value) {
        m_pending.kind = PendingOperation::SearchFound;
        m_pending.terminalKey = m_pending.value;
        m_pending.comparison = ComparisonResult::Equal;
    } else {
        m_pending.kind = PendingOperation::SearchNotFound;
        m_pending.terminalKey = path.isEmpty() ? 0 : path.last();
        m_pending.comparison = path.isEmpty() ? ComparisonResult::None
                                              : compareValues(m_pending.value, path.last());
    }
}

void BinarySearchTree::commitPending()
{
    switch (m_pending.kind) {
    case PendingOperation::CreatingRoot:
    case PendingOperation::Inserting:
        commitInsert(m_pending.value);
        emit structureChanged();
        finishPending("Вставка завершена");
        break;
    case PendingOperation::SearchFound:
        finishPending("Значение найдено");
        break;
    case PendingOperation::Searching:
    case PendingOperation::SearchNotFound:
        finishPending("Значение не найдено");
        break;
    case PendingOperation::Deleting:
        if (m_pending.deleteCase == DeleteCase::NotFound) {
            finishPending("Значение не найдено");
            break;
        }
        commitRemove(m_pending.value);
        emit structureChanged();
        finishPending("Удаление завершено");
        break;
    default:
        BinaryTree::commitPending();
        break;
    }
}

void BinarySearchTree::commitInsert(int value)
{
    m_root = insertRecursive(m_root, value);
}

void BinarySearchTree::commitRemove(int value)
{
    m_root = removeRecursive(m_root, value);
}

TreeNode* BinarySearchTree::insertRecursive(TreeNode* node, int value)
{
    if (!node) {
        m_size++;
        return new TreeNode(value);
    }

    if (value < node->value()) {
        node->setLeft(insertRecursive(node->left(), value));
    } else if (value > node->value()) {
        node->setRight(insertRecursive(node->right(), value));
    }

    return node;
}

TreeNode* BinarySearchTree::removeRecursive(TreeNode* node, int value)
{
    if (!node) {
        return nullptr;
    }

    if (value < node->value()) {
        node->setLeft(removeRecursive(node->left(), value));
    } else if (value > node->value()) {
        node->setRight(removeRecursive(node->right(), value));
    } else {
        // Нашли узел для удаления
        if (!node->hasLeft() || !node->hasRight()) {
            TreeNode* child = node->hasLeft() ? node->left() : node->right();
            delete node;
            m_size--;
            return child;
        }

        // Два ребенка: копируем значение преемника и удаляем его из правого поддерева
        TreeNode* minNode = findMin(node->right());
        copyValue(node, minNode);
        node->setRight(removeRecursive(node->right(), minNode->value()));
    }

    return node;
}

TreeNode* BinarySearchTree::findMin(TreeNode* node)
{
    if (!node) return nullptr;

    while (node->left()) {
        node = node->left();
    }

    return node;
}
