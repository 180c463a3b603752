#include <catch2/catch.hpp>

#include <algorithm>

#include "core/internal/huffman/huffman_tree.h"
#include "test_helpers.h"

namespace
{

const QVector<HuffmanSymbol> kClassic = {
    {"a", 5}, {"b", 9}, {"c", 12}, {"d", 13}, {"e", 16}, {"f", 45}
};

QVector<int> frequencies(const QVector<FragmentInfo>& fragments)
{
    QVector<int> result;
    for (const FragmentInfo& fragment : fragments) {
        result.append(fragment.frequency);
    }
    return result;
}

void runAllSteps(HuffmanTree& tree)
{
    while (tree.queue().size() >= 2) {
        REQUIRE(tree.mergeStep());
        finish(tree);
    }
}

} // namespace

TEST_CASE("Classic symbol set produces the textbook codes", "[huffman]")
{
    HuffmanTree tree;
    tree.setActive(true);
    REQUIRE(tree.build(kClassic));
    REQUIRE(tree.totalRounds() == 5);

    runAllSteps(tree);

    REQUIRE(tree.isDone());
    REQUIRE(tree.round() == 5);
    REQUIRE(tree.root() != nullptr);
    REQUIRE(tree.root()->frequency() == 100);

    const QMap<QString, QString> codes = tree.codeTable();
    REQUIRE(codes.value("f") == "0");
    REQUIRE(codes.value("c") == "100");
    REQUIRE(codes.value("d") == "101");
    REQUIRE(codes.value("a") == "1100");
    REQUIRE(codes.value("b") == "1101");
    REQUIRE(codes.value("e") == "111");
}

TEST_CASE("Merge step follows Select, Move, Merge, Return", "[huffman]")
{
    HuffmanTree tree;
    tree.setActive(true);
    tree.build(kClassic);

    MergePhaseState idle = tree.mergePhase();
    REQUIRE(idle.phase == MergePhase::Select);
    REQUIRE(frequencies(idle.currentPair) == QVector<int>({5, 9}));
    REQUIRE(idle.queueAfter == idle.queueBefore);

    REQUIRE(tree.mergeStep());

    tree.setProgress(0.1);
    MergePhaseState state = tree.mergePhase();
    REQUIRE(state.phase == MergePhase::Select);
    REQUIRE(state.currentPair.at(0).symbol == "a");
    REQUIRE(state.currentPair.at(1).symbol == "b");
    REQUIRE_FALSE(state.hasParentCandidate);

    tree.setProgress(0.3);
    REQUIRE(tree.mergePhase().phase == MergePhase::Move);

    tree.setProgress(0.6);
    state = tree.mergePhase();
    REQUIRE(state.phase == MergePhase::Merge);
    REQUIRE(state.hasParentCandidate);
    REQUIRE(state.parentCandidate.frequency == 14);
    REQUIRE_FALSE(state.parentCandidate.leaf);
    REQUIRE(frequencies(state.queueBefore) == QVector<int>({5, 9, 12, 13, 16, 45}));
    REQUIRE(frequencies(state.queueAfter) == QVector<int>({12, 13, 14, 16, 45}));

    tree.setProgress(0.8);
    REQUIRE(tree.mergePhase().phase == MergePhase::Return);
    REQUIRE(tree.queue().size() == 6);

    tree.setProgress(1.0);
    REQUIRE(tree.isIdle());
    REQUIRE(tree.round() == 1);
    REQUIRE(frequencies(tree.queue()) == QVector<int>({12, 13, 14, 16, 45}));
}

TEST_CASE("Equal frequencies keep insertion order", "[huffman]")
{
    HuffmanTree tree;
    tree.setActive(true);

    SECTION("ties among leaves")
    {
        tree.build({{"x", 1}, {"y", 1}, {"z", 1}});
        runAllSteps(tree);

        const QMap<QString, QString> codes = tree.codeTable();
        REQUIRE(codes.value("z") == "0");
        REQUIRE(codes.value("x") == "10");
        REQUIRE(codes.value("y") == "11");
    }

    SECTION("parent goes after fragments of the same frequency")
    {
        tree.build({{"a", 1}, {"b", 1}, {"c", 2}});
        tree.mergeStep();
        finish(tree);

        const QVector<FragmentInfo> queue = tree.queue();
        REQUIRE(queue.size() == 2);
        REQUIRE(queue.at(0).symbol == "c");
        REQUIRE_FALSE(queue.at(1).leaf);
    }
}

TEST_CASE("Degenerate inputs finish immediately", "[huffman]")
{
    HuffmanTree tree;
    tree.setActive(true);

    SECTION("no symbols")
    {
        REQUIRE(tree.build({}));
        REQUIRE(tree.isDone());
        REQUIRE(tree.phase() == MergePhase::Done);
        REQUIRE(tree.root() == nullptr);
        REQUIRE(tree.codeTable().isEmpty());
        REQUIRE_FALSE(tree.mergeStep());
    }

    SECTION("single symbol gets code 0")
    {
        REQUIRE(tree.build({{"q", 7}}));
        REQUIRE(tree.isDone());
        REQUIRE(tree.codeTable().value("q") == "0");

        QString bits;
        REQUIRE(tree.encode("qq", &bits));
        REQUIRE(bits == "00");

        QString text;
        REQUIRE(tree.decode("000", &text));
        REQUIRE(text == "qqq");
        REQUIRE_FALSE(tree.decode("01", &text));
    }
}

TEST_CASE("Invalid symbol sets are rejected before loading", "[huffman]")
{
    HuffmanTree tree;
    tree.setActive(true);

    REQUIRE_FALSE(tree.build({{"a", 3}, {"b", -1}}));
    REQUIRE_FALSE(tree.build({{"a", 3}, {"a", 4}}));
    REQUIRE_FALSE(tree.build({{"", 3}}));
    REQUIRE_FALSE(tree.isBuilt());
    REQUIRE(tree.queue().isEmpty());
}

TEST_CASE("Merge step preconditions", "[huffman]")
{
    HuffmanTree tree;

    REQUIRE_FALSE(tree.build(kClassic));

    tree.setActive(true);
    REQUIRE_FALSE(tree.mergeStep());
    REQUIRE(tree.errorString().contains("build"));

    tree.build(kClassic);
    REQUIRE(tree.mergeStep());
    REQUIRE_FALSE(tree.mergeStep());
    REQUIRE_FALSE(tree.build(kClassic));

    tree.setProgress(0.6);
    tree.cancel();
    REQUIRE(tree.isIdle());
    REQUIRE(tree.queue().size() == 6);
    REQUIRE(tree.round() == 0);
}

TEST_CASE("Immediate build matches the animated build", "[huffman]")
{
    HuffmanTree animated;
    animated.setActive(true);
    animated.build(kClassic);
    runAllSteps(animated);

    HuffmanTree immediate;
    immediate.setActive(true);
    immediate.build(kClassic);
    REQUIRE(immediate.buildImmediately());

    REQUIRE(immediate.isDone());
    REQUIRE(immediate.sameShape(animated));
    REQUIRE(immediate.codeTable() == animated.codeTable());
}

TEST_CASE("Encode and decode use the code table", "[huffman]")
{
    HuffmanTree tree;
    tree.setActive(true);
    tree.build(kClassic);

    QString bits;
    REQUIRE_FALSE(tree.encode("abc", &bits));

    tree.buildImmediately();

    REQUIRE(tree.encode("fab", &bits));
    REQUIRE(bits == "011001101");

    QString text;
    REQUIRE(tree.decode(bits, &text));
    REQUIRE(text == "fab");

    REQUIRE_FALSE(tree.encode("fz", &bits));
    REQUIRE_FALSE(tree.decode("110", &text));
    REQUIRE_FALSE(tree.decode("01x", &text));
    REQUIRE(text == "fab");
}

TEST_CASE("Merge steps are accepted through execute only", "[huffman]")
{
    HuffmanTree tree;
    tree.setActive(true);
    tree.build(kClassic);

    QString error;
    REQUIRE(tree.validateRequest(OperationRequest::mergeStep(), &error));
    REQUIRE_FALSE(tree.validateRequest(OperationRequest::insert(4), &error));
    REQUIRE(error.contains("insert"));

    REQUIRE(tree.execute(OperationRequest::mergeStep()));
    REQUIRE_FALSE(tree.isIdle());
}

TEST_CASE("Each round keeps the total frequency and removes one fragment", "[huffman]")
{
    HuffmanTree tree;
    tree.setActive(true);
    tree.build(kClassic);

    const int total = tree.queueFrequencyTotal();
    REQUIRE(total == 100);

    while (tree.queue().size() >= 2) {
        const QVector<FragmentInfo> before = tree.queue();

        REQUIRE(tree.mergeStep());
        for (double progress : {0.1, 0.4, 0.6, 0.9}) {
            tree.setProgress(progress);
            REQUIRE(tree.queue() == before);
        }
        tree.setProgress(1.0);

        REQUIRE(tree.queue().size() == before.size() - 1);
        REQUIRE(tree.queueFrequencyTotal() == total);

        const QVector<int> after = frequencies(tree.queue());
        REQUIRE(std::is_sorted(after.begin(), after.end()));
    }

    REQUIRE(tree.round() == tree.totalRounds());
}
