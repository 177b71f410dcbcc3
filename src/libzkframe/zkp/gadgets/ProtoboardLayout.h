#ifndef ZKFRAME_ZKP_GADGETS_PROTOBOARDLAYOUT_H_INCLUDED
#define ZKFRAME_ZKP_GADGETS_PROTOBOARDLAYOUT_H_INCLUDED

#include <libzkframe/zkp/Circuit.h>
#include <libzkframe/zkp/Field.h>

#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>
#include <vector>

namespace zkframe {
namespace zkp {

/**
 * Allocate one protoboard variable per circuit variable, in index order.
 *
 * Entry i of the result is the protoboard variable for circuit index i;
 * entry 0 is the protoboard's constant 1. No primary input size is set, so
 * protoboard columns coincide with circuit indices.
 *
 * @throws CompileError if the protoboard already holds variables.
 */
std::vector<libsnark::pb_variable<FieldT>>
allocateVariables(
    libsnark::protoboard<FieldT>& pb,
    VariableTable const& variables);

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_GADGETS_PROTOBOARDLAYOUT_H_INCLUDED
