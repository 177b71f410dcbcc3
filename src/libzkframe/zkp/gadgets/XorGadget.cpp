#include "XorGadget.h"

#include <libzkframe/zkp/Field.h>

namespace zkframe {
namespace zkp {

template <typename FieldT>
XorGadget<FieldT>::XorGadget(
    libsnark::protoboard<FieldT>& pb,
    libsnark::pb_variable<FieldT> const& lhs,
    libsnark::pb_variable<FieldT> const& rhs,
    libsnark::pb_variable<FieldT> const& result,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
    , lhs(lhs)
    , rhs(rhs)
    , result(result)
{
}

template <typename FieldT>
void
XorGadget<FieldT>::generate_r1cs_constraints()
{
    libsnark::linear_combination<FieldT> twice_lhs;
    twice_lhs.add_term(lhs, 2);

    this->pb.add_r1cs_constraint(
        libsnark::r1cs_constraint<FieldT>(twice_lhs, rhs, lhs + rhs - result),
        this->annotation_prefix + "_xor");
}

template <typename FieldT>
void
XorGadget<FieldT>::generate_r1cs_witness()
{
    FieldT const x = this->pb.val(lhs);
    FieldT const y = this->pb.val(rhs);
    this->pb.val(result) = x + y - FieldT(2) * x * y;
}

// Explicit template instantiation
template class XorGadget<FieldT>;

}  // namespace zkp
}  // namespace zkframe
