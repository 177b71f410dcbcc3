#include "EqualityGadget.h"

#include <libzkframe/zkp/Field.h>

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>

namespace zkframe {
namespace zkp {

template <typename FieldT>
EqualityGadget<FieldT>::EqualityGadget(
    libsnark::protoboard<FieldT>& pb,
    libsnark::pb_variable<FieldT> const& lhs,
    libsnark::pb_variable<FieldT> const& rhs,
    libsnark::pb_variable<FieldT> const& result,
    libsnark::pb_variable<FieldT> const& inverse,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
    , lhs(lhs)
    , rhs(rhs)
    , result(result)
    , inverse(inverse)
{
}

template <typename FieldT>
void
EqualityGadget<FieldT>::generate_r1cs_constraints()
{
    libsnark::generate_boolean_r1cs_constraint<FieldT>(
        this->pb, result, this->annotation_prefix + "_result");

    libsnark::linear_combination<FieldT> const difference = lhs - rhs;
    libsnark::linear_combination<FieldT> const one_minus_result =
        libsnark::linear_combination<FieldT>(1) - result;

    this->pb.add_r1cs_constraint(
        libsnark::r1cs_constraint<FieldT>(difference, inverse, one_minus_result),
        this->annotation_prefix + "_inverse");

    this->pb.add_r1cs_constraint(
        libsnark::r1cs_constraint<FieldT>(difference, result, 0),
        this->annotation_prefix + "_zero_when_unequal");

    this->pb.add_r1cs_constraint(
        libsnark::r1cs_constraint<FieldT>(result, inverse, 0),
        this->annotation_prefix + "_inverse_zero_when_equal");
}

template <typename FieldT>
void
EqualityGadget<FieldT>::generate_r1cs_witness()
{
    FieldT const difference = this->pb.val(lhs) - this->pb.val(rhs);

    if (difference.is_zero())
    {
        this->pb.val(result) = FieldT::one();
        this->pb.val(inverse) = FieldT::zero();
    }
    else
    {
        this->pb.val(result) = FieldT::zero();
        this->pb.val(inverse) = difference.inverse();
    }
}

// Explicit template instantiation
template class EqualityGadget<FieldT>;

}  // namespace zkp
}  // namespace zkframe
