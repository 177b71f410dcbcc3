#include "ArithmeticGadget.h"

#include <libzkframe/zkp/Field.h>

#include <stdexcept>

namespace zkframe {
namespace zkp {

template <typename FieldT>
ArithmeticGadget<FieldT>::ArithmeticGadget(
    libsnark::protoboard<FieldT>& pb,
    OpKind kind,
    libsnark::pb_variable<FieldT> const& lhs,
    libsnark::pb_variable<FieldT> const& rhs,
    libsnark::pb_variable<FieldT> const& result,
    const std::string& annotation_prefix)
    : libsnark::gadget<FieldT>(pb, annotation_prefix)
    , kind(kind)
    , lhs(lhs)
    , rhs(rhs)
    , result(result)
{
    if (kind != OpKind::Add && kind != OpKind::Sub && kind != OpKind::Mul)
    {
        throw std::invalid_argument(
            std::string("not an arithmetic operation: ") + to_string(kind));
    }
}

template <typename FieldT>
void
ArithmeticGadget<FieldT>::generate_r1cs_constraints()
{
    switch (kind)
    {
        case OpKind::Add:
            this->pb.add_r1cs_constraint(
                libsnark::r1cs_constraint<FieldT>(lhs + rhs, 1, result),
                this->annotation_prefix + "_add");
            break;
        case OpKind::Sub:
            this->pb.add_r1cs_constraint(
                libsnark::r1cs_constraint<FieldT>(lhs - rhs, 1, result),
                this->annotation_prefix + "_sub");
            break;
        case OpKind::Mul:
            this->pb.add_r1cs_constraint(
                libsnark::r1cs_constraint<FieldT>(lhs, rhs, result),
                this->annotation_prefix + "_mul");
            break;
        case OpKind::Xor:
        case OpKind::Eq:
            // Rejected by the constructor.
            break;
    }
}

template <typename FieldT>
void
ArithmeticGadget<FieldT>::generate_r1cs_witness()
{
    FieldT const x = this->pb.val(lhs);
    FieldT const y = this->pb.val(rhs);

    switch (kind)
    {
        case OpKind::Add:
            this->pb.val(result) = x + y;
            break;
        case OpKind::Sub:
            this->pb.val(result) = x - y;
            break;
        case OpKind::Mul:
            this->pb.val(result) = x * y;
            break;
        case OpKind::Xor:
        case OpKind::Eq:
            // Rejected by the constructor.
            break;
    }
}

// Explicit template instantiation
template class ArithmeticGadget<FieldT>;

}  // namespace zkp
}  // namespace zkframe
