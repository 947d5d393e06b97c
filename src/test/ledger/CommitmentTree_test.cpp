#include <libshieldpay/ledger/CommitmentTree.h>
#include <libshieldpay/ledger/MemoryView.h>

#include <xrpl/beast/unit_test.h>

namespace shieldpay {

class CommitmentTree_test : public beast::unit_test::suite
{
    void
    testAppendChecks()
    {
        testcase("append checks");

        uint256 const genesis{100};
        CommitmentTree tree(genesis, 20);
        BEAST_EXPECT(tree.currentRoot() == genesis);
        BEAST_EXPECT(tree.nextLeafIndex() == 0);
        BEAST_EXPECT(tree.capacity() == (1u << 20));

        BEAST_EXPECT(tree.checkAppend(genesis, 1, 1) == tesSUCCESS);
        BEAST_EXPECT(tree.checkAppend(genesis, 2, 2) == tesSUCCESS);

        BEAST_EXPECT(tree.checkAppend(uint256{5}, 1, 1) == terOLD_ROOT_MISMATCH);
        BEAST_EXPECT(tree.checkAppend(genesis, 0, 1) == terLEAF_INDEX_MISMATCH);
        BEAST_EXPECT(tree.checkAppend(genesis, 2, 1) == terLEAF_INDEX_MISMATCH);
        BEAST_EXPECT(tree.checkAppend(genesis, 1, 2) == terLEAF_INDEX_MISMATCH);

        tree.append(uint256{101}, 1);
        BEAST_EXPECT(tree.currentRoot() == uint256{101});
        BEAST_EXPECT(tree.nextLeafIndex() == 1);

        // The old root is no longer current.
        BEAST_EXPECT(tree.checkAppend(genesis, 3, 2) == terOLD_ROOT_MISMATCH);
        BEAST_EXPECT(tree.checkAppend(uint256{101}, 3, 2) == tesSUCCESS);

        tree.append(uint256{102}, 2);
        BEAST_EXPECT(tree.nextLeafIndex() == 3);
    }

    void
    testFullTree()
    {
        testcase("full tree");

        CommitmentTree tree(uint256{0}, 2);
        BEAST_EXPECT(tree.capacity() == 4);

        tree.append(uint256{1}, 2);
        BEAST_EXPECT(tree.checkAppend(uint256{1}, 3, 1) == tesSUCCESS);
        tree.append(uint256{2}, 1);
        BEAST_EXPECT(tree.checkAppend(uint256{2}, 5, 2) == tecTREE_FULL);
        BEAST_EXPECT(tree.checkAppend(uint256{2}, 4, 1) == tesSUCCESS);
        tree.append(uint256{3}, 1);
        BEAST_EXPECT(tree.checkAppend(uint256{3}, 5, 1) == tecTREE_FULL);

        try
        {
            tree.append(uint256{4}, 1);
            fail("append past capacity accepted");
        }
        catch (std::overflow_error const&)
        {
            pass();
        }
        BEAST_EXPECT(tree.currentRoot() == uint256{3});

        try
        {
            CommitmentTree bad(uint256{0}, 0);
            fail("zero depth accepted");
        }
        catch (std::invalid_argument const&)
        {
            pass();
        }
    }

    void
    testPersistence()
    {
        testcase("persistence");

        MemoryView view;
        BEAST_EXPECT(!readCommitmentTree(view));

        CommitmentTree tree(uint256{77}, 16);
        tree.append(uint256{78}, 2);
        writeCommitmentTree(view, tree);

        auto loaded = readCommitmentTree(view);
        if (!BEAST_EXPECT(loaded))
            return;
        BEAST_EXPECT(loaded->currentRoot() == uint256{78});
        BEAST_EXPECT(loaded->nextLeafIndex() == 2);
        BEAST_EXPECT(loaded->depth() == 16);

        loaded->append(uint256{79}, 1);
        writeCommitmentTree(view, *loaded);
        BEAST_EXPECT(readCommitmentTree(view)->nextLeafIndex() == 3);
        BEAST_EXPECT(view.read(keylet::commitmentTree())->version() == 2);
    }

public:
    void
    run() override
    {
        testAppendChecks();
        testFullTree();
        testPersistence();
    }
};

BEAST_DEFINE_TESTSUITE(CommitmentTree, ledger, shieldpay);

}  // namespace shieldpay
