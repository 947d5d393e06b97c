#ifndef SHIELDPAY_TEST_ZKP_SIGNALCIRCUIT_H_INCLUDED
#define SHIELDPAY_TEST_ZKP_SIGNALCIRCUIT_H_INCLUDED

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

#include <string>
#include <vector>

namespace shieldpay {
namespace test {

/** Minimal circuit exposing `n` public signals.

    Every signal feeds one constraint, (sum of signals) * 1 = total, so
    each IC point of the resulting key is bound to its input and a proof
    only verifies for the exact signals it was made with.
*/
template <typename FieldT>
class SignalCircuit : public libsnark::gadget<FieldT>
{
public:
    SignalCircuit(
        libsnark::protoboard<FieldT>& pb,
        std::size_t n,
        std::string const& annotation_prefix)
        : libsnark::gadget<FieldT>(pb, annotation_prefix)
    {
        signals_.allocate(pb, n, annotation_prefix + "_signals");
        total_.allocate(pb, annotation_prefix + "_total");
        pb.set_input_sizes(n);
    }

    void
    generate_r1cs_constraints()
    {
        libsnark::linear_combination<FieldT> sum;
        for (auto const& s : signals_)
            sum = sum + s;

        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(sum, 1, total_), "total");
    }

    void
    generate_r1cs_witness(std::vector<FieldT> const& values)
    {
        FieldT total = FieldT::zero();
        for (std::size_t i = 0; i < signals_.size(); ++i)
        {
            this->pb.val(signals_[i]) = values[i];
            total += values[i];
        }
        this->pb.val(total_) = total;
    }

private:
    libsnark::pb_variable_array<FieldT> signals_;
    libsnark::pb_variable<FieldT> total_;
};

}  // namespace test
}  // namespace shieldpay

#endif
