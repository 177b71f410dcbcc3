#ifndef ZKFRAME_ZKP_GADGETS_XORGADGET_H_INCLUDED
#define ZKFRAME_ZKP_GADGETS_XORGADGET_H_INCLUDED

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <string>

namespace zkframe {
namespace zkp {

/**
 * XOR of two bits in one rank-1 row:
 *
 *   (2 * lhs) * rhs = lhs + rhs - result
 *
 * The row only encodes XOR when both operands are boolean; booleanity is
 * enforced separately by the compiler, once per variable. With boolean
 * operands the result is boolean too.
 */
template <typename FieldT>
class XorGadget : public libsnark::gadget<FieldT>
{
private:
    libsnark::pb_variable<FieldT> lhs;
    libsnark::pb_variable<FieldT> rhs;
    libsnark::pb_variable<FieldT> result;

public:
    XorGadget(
        libsnark::protoboard<FieldT>& pb,
        libsnark::pb_variable<FieldT> const& lhs,
        libsnark::pb_variable<FieldT> const& rhs,
        libsnark::pb_variable<FieldT> const& result,
        const std::string& annotation_prefix);

    void
    generate_r1cs_constraints();
    void
    generate_r1cs_witness();
};

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_GADGETS_XORGADGET_H_INCLUDED
