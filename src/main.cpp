#include "app/animation_driver.h"
#include "core/animation/animation_controller.h"
#include "core/config/animation_settings.h"
#include "core/generators/binary_tree_generator.h"
#include "core/internal/avl/avl_tree.h"
#include "core/internal/bst/binary_search_tree.h"
#include "core/internal/huffman/huffman_tree.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QJsonDocument>
#include <QScopedPointer>
#include <QSettings>

namespace {

bool parseValues(const QString& text, QVector<int>* values)
{
    QVector<int> result;
    for (const QString& part : text.split(',', Qt::SkipEmptyParts)) {
        bool ok = false;
        const int value = part.trimmed().toInt(&ok);
        if (!ok) return false;
        result.append(value);
    }

    *values = result;
    return true;
}

void traceTree(BinaryTree* tree)
{
    QObject::connect(tree, &BinaryTree::committed, tree, [tree](const PendingOperation& operation) {
        qDebug().noquote() << tree->structureName() << "committed:" << operation.describe()
                           << "| in-order:" << tree->inorderValues();
    });
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("TreeAnimator");
    QCoreApplication::setApplicationName("tree_animator");

    QCommandLineParser parser;
    parser.setApplicationDescription("Animated BST, AVL and Huffman tree operations");
    parser.addHelpOption();

    QCommandLineOption speedOption("speed", "Playback speed multiplier.", "multiplier");
    QCommandLineOption valuesOption("values", "Comma separated values to insert.", "list",
                                    "50,30,70,20,40,60,80");
    QCommandLineOption generateOption("generate", "Generate N values (random|left|right).", "type");
    QCommandLineOption countOption("count", "Number of generated values.", "n", "10");
    QCommandLineOption settingsOption("settings", "INI file with Animation/* settings.", "file");
    parser.addOption(speedOption);
    parser.addOption(valuesOption);
    parser.addOption(generateOption);
    parser.addOption(countOption);
    parser.addOption(settingsOption);
    parser.process(app);

    QScopedPointer<QSettings> store(parser.isSet(settingsOption)
                                        ? new QSettings(parser.value(settingsOption), QSettings::IniFormat)
                                        : new QSettings());
    AnimationSettings settings = AnimationSettings::load(*store);

    if (parser.isSet(speedOption)) {
        bool ok = false;
        const double speed = parser.value(speedOption).toDouble(&ok);
        if (!ok || speed <= 0.0) {
            qWarning() << "Invalid --speed" << parser.value(speedOption);
            return 1;
        }
        settings.speed = speed;
    }

    QVector<int> values;
    if (parser.isSet(generateOption)) {
        BinaryTreeType type = Random;
        if (!BinaryTreeGenerator::parseType(parser.value(generateOption), &type)) {
            qWarning() << "Unknown generator type" << parser.value(generateOption);
            return 1;
        }
        BinaryTreeGenerator generator;
        values = generator.generateValues(type, parser.value(countOption).toInt());
    } else if (!parseValues(parser.value(valuesOption), &values)) {
        qWarning() << "Invalid --values" << parser.value(valuesOption);
        return 1;
    }

    BinarySearchTree bst;
    AvlTree avl;
    HuffmanTree huffman;

    if (!avl.setPhaseBreaks(settings.avlPhaseBreaks)
        || !huffman.setPhaseBreaks(settings.huffmanPhaseBreaks)) {
        return 1;
    }

    traceTree(&bst);
    traceTree(&avl);
    QObject::connect(&huffman, &HuffmanTree::roundCommitted, &huffman, [&huffman](int round) {
        qDebug() << "Huffman round" << round << "of" << huffman.totalRounds()
                 << "queue total" << huffman.queueFrequencyTotal();
    });

    bst.setActive(true);
    avl.setActive(true);
    huffman.setActive(true);

    AnimationController bstController(&bst);
    AnimationController avlController(&avl);
    AnimationController huffmanController(&huffman);

    for (AnimationController* controller : {&bstController, &avlController, &huffmanController}) {
        controller->setSettings(settings);
    }

    // BST: вставки, поиск отсутствующего значения, удаление и обход
    QVector<OperationRequest> bstBatch = OperationRequest::insertBatch(values);
    bstBatch << OperationRequest::search(90)
             << OperationRequest::remove(values.isEmpty() ? 0 : values.first())
             << OperationRequest::traverse(TraversalOrder::LevelOrder);

    // AVL: сначала LL-поворот на 30, 20, 10, затем те же значения
    QVector<OperationRequest> avlBatch = OperationRequest::insertBatch({30, 20, 10});
    avlBatch << OperationRequest::insertBatch(values);

    if (!bstController.enqueueBatch(bstBatch) || !avlController.enqueueBatch(avlBatch)) {
        return 1;
    }

    const QVector<HuffmanSymbol> symbols = {
        {"a", 5}, {"b", 9}, {"c", 12}, {"d", 13}, {"e", 16}, {"f", 45}
    };
    if (!huffman.build(symbols)) {
        return 1;
    }
    for (int i = 0; i < huffman.totalRounds(); ++i) {
        if (!huffmanController.enqueue(OperationRequest::mergeStep())) {
            return 1;
        }
    }

    AnimationDriver driver;
    driver.setTickInterval(settings.tickInterval);
    driver.addController(&bstController);
    driver.addController(&avlController);
    driver.addController(&huffmanController);

    QObject::connect(&driver, &AnimationDriver::finished, &app, [&]() {
        qDebug().noquote() << "AVL:" << QJsonDocument(avl.toJson()).toJson(QJsonDocument::Compact);

        const QMap<QString, QString> codes = huffman.codeTable();
        for (auto it = codes.constBegin(); it != codes.constEnd(); ++it) {
            qDebug().noquote() << "Huffman" << it.key() << "=" << it.value();
        }
        app.quit();
    });

    driver.start();
    return app.exec();
}
