#include <libshieldpay/ledger/MemoryView.h>
#include <libshieldpay/ledger/PoolBalance.h>

#include <xrpl/beast/unit_test.h>

#include <limits>
#include <stdexcept>

namespace shieldpay {

class PoolBalance_test : public beast::unit_test::suite
{
    static constexpr std::uint64_t maxAmount =
        std::numeric_limits<std::uint64_t>::max();

    void
    testTotals()
    {
        testcase("totals");

        PoolBalance pb;
        BEAST_EXPECT(pb.credit(300) == tesSUCCESS);
        BEAST_EXPECT(pb.credit(0) == tesSUCCESS);
        BEAST_EXPECT(pb.credit(450) == tesSUCCESS);
        BEAST_EXPECT(pb.debit(400) == tesSUCCESS);

        BEAST_EXPECT(pb.totalDeposited() == 750);
        BEAST_EXPECT(pb.totalWithdrawn() == 400);
        BEAST_EXPECT(pb.balance() == 350);

        // Draining exactly to zero is allowed.
        BEAST_EXPECT(pb.debit(350) == tesSUCCESS);
        BEAST_EXPECT(pb.balance() == 0);
        BEAST_EXPECT(pb.totalWithdrawn() == 750);
    }

    void
    testInsufficient()
    {
        testcase("insufficient funds");

        PoolBalance pb;
        BEAST_EXPECT(pb.debit(1) == tecINSUFFICIENT_FUNDS);

        BEAST_EXPECT(pb.credit(10) == tesSUCCESS);
        BEAST_EXPECT(pb.debit(11) == tecINSUFFICIENT_FUNDS);
        BEAST_EXPECT(pb.balance() == 10);
        BEAST_EXPECT(pb.totalWithdrawn() == 0);
    }

    void
    testOverflow()
    {
        testcase("overflow");

        PoolBalance pb;
        BEAST_EXPECT(pb.credit(maxAmount) == tesSUCCESS);
        BEAST_EXPECT(pb.credit(1) == tecARITHMETIC);
        BEAST_EXPECT(pb.balance() == maxAmount);
        BEAST_EXPECT(pb.totalDeposited() == maxAmount);

        // After a withdrawal the balance has room but the deposit total
        // does not.
        BEAST_EXPECT(pb.debit(5) == tesSUCCESS);
        BEAST_EXPECT(pb.credit(1) == tecARITHMETIC);
        BEAST_EXPECT(pb.balance() == maxAmount - 5);
        BEAST_EXPECT(pb.totalDeposited() == maxAmount);
    }

    void
    testPersistence()
    {
        testcase("persistence");

        MemoryView view;
        BEAST_EXPECT(!readPoolBalance(view));

        PoolBalance pb;
        BEAST_EXPECT(pb.credit(1000) == tesSUCCESS);
        BEAST_EXPECT(pb.debit(250) == tesSUCCESS);
        writePoolBalance(view, pb);

        auto loaded = readPoolBalance(view);
        if (!BEAST_EXPECT(loaded))
            return;
        BEAST_EXPECT(loaded->totalDeposited() == 1000);
        BEAST_EXPECT(loaded->totalWithdrawn() == 250);
        BEAST_EXPECT(loaded->balance() == 750);

        BEAST_EXPECT(loaded->debit(750) == tesSUCCESS);
        writePoolBalance(view, *loaded);
        BEAST_EXPECT(view.size() == 1);
        BEAST_EXPECT(readPoolBalance(view)->balance() == 0);
    }

    void
    testInconsistent()
    {
        testcase("inconsistent record");

        auto const decode = [](PoolBalance const& pb) {
            ripple::Serializer s;
            pb.serialize(s);
            ripple::SerialIter sit(s.slice());
            return PoolBalance::deserialize(sit);
        };

        try
        {
            decode(PoolBalance(100, 40, 70));
            fail("balance that does not match the totals accepted");
        }
        catch (std::runtime_error const&)
        {
            pass();
        }

        try
        {
            decode(PoolBalance(10, 20, 0));
            fail("more withdrawn than deposited accepted");
        }
        catch (std::runtime_error const&)
        {
            pass();
        }
    }

public:
    void
    run() override
    {
        testTotals();
        testInsufficient();
        testOverflow();
        testPersistence();
        testInconsistent();
    }
};

BEAST_DEFINE_TESTSUITE(PoolBalance, ledger, shieldpay);

}  // namespace shieldpay
