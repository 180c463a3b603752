#include <catch2/catch.hpp>

#include "core/animation/animation_controller.h"
#include "core/internal/huffman/huffman_tree.h"
#include "test_helpers.h"

TEST_CASE("Batch requests are issued one at a time", "[controller]")
{
    BinarySearchTree tree;
    tree.setActive(true);
    AnimationController controller(&tree);

    QVector<int> committedValues;
    int drained = 0;
    QObject::connect(&tree, &BinaryTree::committed,
                     [&](const PendingOperation& operation) { committedValues.append(operation.value); });
    QObject::connect(&controller, &AnimationController::queueDrained, [&]() { ++drained; });

    REQUIRE(controller.enqueueBatch(OperationRequest::insertBatch({50, 30, 70})));
    REQUIRE(controller.queuedCount() == 3);
    REQUIRE(tree.isIdle());

    controller.advance(0);
    REQUIRE(controller.isRunning());
    REQUIRE(controller.queuedCount() == 2);
    REQUIRE(tree.pendingState().kind == PendingOperation::CreatingRoot);

    REQUIRE(controller.advance(500) == Approx(0.5));
    REQUIRE(tree.isEmpty());

    controller.advance(1000);
    REQUIRE(committedValues == QVector<int>({50}));
    REQUIRE(tree.pendingState().value == 30);
    REQUIRE(controller.queuedCount() == 1);

    controller.advance(2000);
    controller.advance(3000);

    REQUIRE(committedValues == QVector<int>({50, 30, 70}));
    REQUIRE(tree.inorderValues() == QVector<int>({30, 50, 70}));
    REQUIRE_FALSE(controller.isBusy());
    REQUIRE(drained == 1);

    controller.advance(4000);
    REQUIRE(drained == 1);
}

TEST_CASE("Requests that finish without animation do not stall the queue", "[controller]")
{
    BinarySearchTree tree;
    tree.setActive(true);
    AnimationController controller(&tree);

    int completed = 0;
    QObject::connect(&controller, &AnimationController::operationCommitted, [&]() { ++completed; });

    controller.enqueueBatch(OperationRequest::insertBatch({5, 5, 6}));
    controller.advance(0);
    controller.advance(1000);

    REQUIRE(completed == 2);
    REQUIRE(tree.pendingState().value == 6);

    controller.advance(2000);
    REQUIRE(completed == 3);
    REQUIRE(tree.size() == 2);
}

TEST_CASE("Invalid batch is rejected as a whole", "[controller]")
{
    BinarySearchTree tree;
    tree.setActive(true);
    AnimationController controller(&tree);

    int errors = 0;
    QObject::connect(&controller, &AnimationController::errorOccurred, [&](const QString&) { ++errors; });

    QVector<OperationRequest> batch = OperationRequest::insertBatch({1, 2});
    batch.append(OperationRequest::insert(QString("x")));

    REQUIRE_FALSE(controller.enqueueBatch(batch));
    REQUIRE(controller.queuedCount() == 0);
    REQUIRE(errors == 1);

    REQUIRE_FALSE(controller.enqueue(OperationRequest::mergeStep()));
    REQUIRE_FALSE(controller.enqueue(OperationRequest::search(QVariant())));
    REQUIRE(controller.queuedCount() == 0);
}

TEST_CASE("Pause, resume and speed are applied to the running operation", "[controller]")
{
    BinarySearchTree tree;
    insertAll(tree, {50, 30, 70});
    AnimationController controller(&tree);

    controller.enqueue(OperationRequest::insert(60));
    controller.advance(0);
    REQUIRE(controller.advance(200) == Approx(0.2));

    SECTION("pause")
    {
        controller.pause(200);
        REQUIRE(controller.isPaused());
        REQUIRE(controller.advance(800) == Approx(0.2));
        REQUIRE(tree.progress() == Approx(0.2));

        controller.resume(800);
        REQUIRE(controller.advance(1000) == Approx(0.4));
        REQUIRE_FALSE(tree.contains(60));
    }

    SECTION("speed")
    {
        REQUIRE(controller.setSpeed(2.0));
        REQUIRE(controller.advance(300) == Approx(0.4));
        controller.advance(600);
        REQUIRE(tree.contains(60));
        REQUIRE_FALSE(controller.setSpeed(0.0));
        REQUIRE(controller.speed() == Approx(2.0));
    }
}

TEST_CASE("Durations come from the settings", "[controller]")
{
    BinarySearchTree tree;
    insertAll(tree, {50, 30, 70});
    AnimationController controller(&tree);

    AnimationSettings settings;
    settings.searchDuration = 400;
    settings.speed = 0.5;
    controller.setSettings(settings);

    controller.enqueue(OperationRequest::search(30));
    controller.advance(0);
    REQUIRE(controller.advance(400) == Approx(0.5));
    controller.advance(800);
    REQUIRE(tree.lastCompleted().kind == PendingOperation::SearchFound);
}

TEST_CASE("Cancel clears the current operation and the queue", "[controller]")
{
    BinarySearchTree tree;
    tree.setActive(true);
    AnimationController controller(&tree);

    controller.enqueueBatch(OperationRequest::insertBatch({1, 2, 3}));
    controller.advance(0);
    controller.advance(500);
    controller.cancel();

    REQUIRE(tree.isIdle());
    REQUIRE(tree.isEmpty());
    REQUIRE_FALSE(controller.isBusy());
    REQUIRE(controller.progress() == Approx(0.0));

    controller.advance(5000);
    REQUIRE(tree.isEmpty());
}

TEST_CASE("Direct requests can be animated with start", "[controller]")
{
    BinarySearchTree tree;
    insertAll(tree, {50});
    AnimationController controller(&tree);

    REQUIRE_FALSE(controller.start(400, 0));

    tree.insert(60);
    REQUIRE(controller.start(400, 0));
    REQUIRE_FALSE(controller.start(400, 0));
    REQUIRE(controller.advance(200) == Approx(0.5));
    controller.advance(400);

    REQUIRE(tree.contains(60));
    REQUIRE_FALSE(controller.isRunning());
}

TEST_CASE("A request failing at issue time drops the rest of the batch", "[controller]")
{
    BinarySearchTree tree;
    AnimationController controller(&tree);

    QString lastError;
    QObject::connect(&controller, &AnimationController::errorOccurred,
                     [&](const QString& error) { lastError = error; });

    REQUIRE(controller.enqueueBatch(OperationRequest::insertBatch({1, 2})));
    controller.advance(0);

    REQUIRE(lastError.contains("not active"));
    REQUIRE(controller.queuedCount() == 0);
    REQUIRE_FALSE(controller.isBusy());
}

TEST_CASE("Huffman merge steps are driven through the controller", "[controller]")
{
    HuffmanTree tree;
    tree.setActive(true);
    tree.build({{"a", 5}, {"b", 9}, {"c", 12}, {"d", 13}, {"e", 16}, {"f", 45}});

    AnimationController controller(&tree);
    for (int i = 0; i < tree.totalRounds(); ++i) {
        REQUIRE(controller.enqueue(OperationRequest::mergeStep()));
    }

    qint64 now = 0;
    controller.advance(now);
    while (controller.isBusy()) {
        now += 100;
        controller.advance(now);
        REQUIRE(now <= 20000);
    }

    REQUIRE(tree.isDone());
    REQUIRE(tree.round() == 5);
    REQUIRE(tree.codeTable().value("f") == "0");
}

TEST_CASE("Batch timing follows the real completion time, not the tick", "[controller]")
{
    BinarySearchTree tree;
    tree.setActive(true);
    AnimationController controller(&tree);

    QVector<qint64> commitTicks;
    qint64 now = 0;
    QObject::connect(&controller, &AnimationController::operationCommitted,
                     [&]() { commitTicks.append(now); });

    REQUIRE(controller.enqueueBatch(OperationRequest::insertBatch({50, 30, 70})));

    // Шаг 300 мс не делит длительность 1000 мс
    for (now = 0; now <= 4500 && controller.isBusy(); now += 300) {
        controller.advance(now);

        if (now == 1200) {
            // Вторая вставка идет с 1000 мс, а не с 1200
            REQUIRE(tree.pendingState().value == 30);
            REQUIRE(controller.progress() == Approx(0.2));
        }
    }

    REQUIRE(commitTicks == QVector<qint64>({1200, 2100, 3000}));
    REQUIRE(tree.inorderValues() == QVector<int>({30, 50, 70}));
}

TEST_CASE("Several short operations can finish within one tick", "[controller]")
{
    BinarySearchTree tree;
    tree.setActive(true);
    AnimationController controller(&tree);

    AnimationSettings settings;
    settings.insertDuration = 100;
    controller.setSettings(settings);

    controller.enqueueBatch(OperationRequest::insertBatch({2, 1, 3}));
    controller.advance(0);
    REQUIRE(controller.advance(250) == Approx(0.5));
    REQUIRE(tree.size() == 2);
    REQUIRE(tree.pendingState().value == 3);

    controller.advance(300);
    REQUIRE(tree.size() == 3);
    REQUIRE_FALSE(controller.isBusy());
}

TEST_CASE("Pause before the first tick holds the queue", "[controller]")
{
    BinarySearchTree tree;
    tree.setActive(true);
    AnimationController controller(&tree);

    controller.enqueueBatch(OperationRequest::insertBatch({1, 2}));
    controller.pause(0);
    REQUIRE(controller.isPaused());

    controller.advance(500);
    REQUIRE(tree.isIdle());
    REQUIRE(controller.queuedCount() == 2);
    REQUIRE_FALSE(controller.isRunning());

    controller.resume(500);
    REQUIRE_FALSE(controller.isPaused());
    controller.advance(500);
    REQUIRE(tree.pendingState().kind == PendingOperation::CreatingRoot);

    REQUIRE(controller.advance(1000) == Approx(0.5));
    controller.advance(1500);
    REQUIRE(tree.contains(1));
}

TEST_CASE("Pause between operations keeps the next one waiting", "[controller]")
{
    BinarySearchTree tree;
    tree.setActive(true);
    AnimationController controller(&tree);

    controller.enqueueBatch(OperationRequest::insertBatch({1, 2}));
    controller.advance(0);
    controller.advance(1000);
    REQUIRE(tree.pendingState().value == 2);

    controller.pause(1000);
    controller.advance(3000);
    REQUIRE_FALSE(tree.contains(2));
    REQUIRE(controller.progress() == Approx(0.0));

    controller.resume(3000);
    REQUIRE(controller.advance(3500) == Approx(0.5));
}
