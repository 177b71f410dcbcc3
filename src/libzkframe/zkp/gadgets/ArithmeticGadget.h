#ifndef ZKFRAME_ZKP_GADGETS_ARITHMETICGADGET_H_INCLUDED
#define ZKFRAME_ZKP_GADGETS_ARITHMETICGADGET_H_INCLUDED

#include <libzkframe/zkp/Circuit.h>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <string>

namespace zkframe {
namespace zkp {

/**
 * One-row gadget for add, sub and mul.
 *
 *   add: (lhs + rhs) * 1 = result
 *   sub: (lhs - rhs) * 1 = result
 *   mul:  lhs * rhs      = result
 *
 * The linear operations are expressed as degenerate rank-1 rows with the
 * constant 1 on the B side.
 */
template <typename FieldT>
class ArithmeticGadget : public libsnark::gadget<FieldT>
{
private:
    OpKind kind;
    libsnark::pb_variable<FieldT> lhs;
    libsnark::pb_variable<FieldT> rhs;
    libsnark::pb_variable<FieldT> result;

public:
    // Throws std::invalid_argument for operations other than add, sub, mul.
    ArithmeticGadget(
        libsnark::protoboard<FieldT>& pb,
        OpKind kind,
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

#endif  // ZKFRAME_ZKP_GADGETS_ARITHMETICGADGET_H_INCLUDED
