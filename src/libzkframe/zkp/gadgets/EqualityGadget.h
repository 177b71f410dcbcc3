#ifndef ZKFRAME_ZKP_GADGETS_EQUALITYGADGET_H_INCLUDED
#define ZKFRAME_ZKP_GADGETS_EQUALITYGADGET_H_INCLUDED

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <string>

namespace zkframe {
namespace zkp {

/**
 * Equality-to-boolean gadget: result = 1 iff lhs == rhs.
 *
 * With d = lhs - rhs and an auxiliary inverse witness inv:
 *
 *   result * (1 - result) = 0
 *   d * inv               = 1 - result
 *   d * result            = 0
 *   result * inv          = 0
 *
 * If d != 0 the third row forces result = 0 and the second forces
 * inv = d^-1. If d == 0 the second row forces result = 1 and the last
 * forces inv = 0, so no entry is left free.
 */
template <typename FieldT>
class EqualityGadget : public libsnark::gadget<FieldT>
{
private:
    libsnark::pb_variable<FieldT> lhs;
    libsnark::pb_variable<FieldT> rhs;
    libsnark::pb_variable<FieldT> result;
    libsnark::pb_variable<FieldT> inverse;

public:
    EqualityGadget(
        libsnark::protoboard<FieldT>& pb,
        libsnark::pb_variable<FieldT> const& lhs,
        libsnark::pb_variable<FieldT> const& rhs,
        libsnark::pb_variable<FieldT> const& result,
        libsnark::pb_variable<FieldT> const& inverse,
        const std::string& annotation_prefix);

    void
    generate_r1cs_constraints();
    void
    generate_r1cs_witness();
};

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_GADGETS_EQUALITYGADGET_H_INCLUDED
