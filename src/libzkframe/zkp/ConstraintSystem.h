#ifndef ZKFRAME_ZKP_CONSTRAINTSYSTEM_H_INCLUDED
#define ZKFRAME_ZKP_CONSTRAINTSYSTEM_H_INCLUDED

#include "Circuit.h"
#include "Field.h"
#include "Witness.h"

#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace zkframe {
namespace zkp {

// Source statement a constraint row was emitted for.
struct RowOrigin
{
    std::size_t line;
    std::string label;
};

// Non-zero entry of one of the A, B, C matrices.
struct MatrixEntry
{
    std::size_t row;
    std::size_t column;
    FieldT coefficient;
};

/**
 * Compiled rank-1 constraint system.
 *
 * Columns are the circuit's own allocation indices; column 0 is the constant
 * 1. Rows are kept in emission order, which the backend's setup depends on.
 * The underlying libsnark system therefore has no primary inputs: the public
 * columns are listed separately and reordered by the backend adapter.
 */
class ConstraintSystem
{
public:
    ConstraintSystem(
        libsnark::r1cs_constraint_system<FieldT> system,
        std::vector<VariableRef> publicIndices,
        std::vector<RowOrigin> origins);

    std::size_t
    numConstraints() const
    {
        return system_.num_constraints();
    }

    std::size_t
    numVariables() const
    {
        return system_.num_variables() + 1;
    }

    std::vector<VariableRef> const&
    publicIndices() const
    {
        return publicIndices_;
    }

    libsnark::r1cs_constraint_system<FieldT> const&
    r1cs() const
    {
        return system_;
    }

    RowOrigin const&
    origin(std::size_t row) const
    {
        return origins_.at(row);
    }

    // Throws std::invalid_argument if the witness has the wrong length.
    bool
    isSatisfied(Witness const& witness) const;

    std::optional<std::size_t>
    firstUnsatisfiedRow(Witness const& witness) const;

    // Values at the public indices, in public order.
    std::vector<FieldT>
    primaryInput(Witness const& witness) const;

    // One entry per non-zero (row, column) cell, rows in order, columns
    // ascending within a row.
    std::vector<MatrixEntry>
    matrixA() const;

    std::vector<MatrixEntry>
    matrixB() const;

    std::vector<MatrixEntry>
    matrixC() const;

private:
    template <typename Select>
    std::vector<MatrixEntry>
    collect(Select select) const;

    libsnark::r1cs_constraint_system<FieldT> system_;
    std::vector<VariableRef> publicIndices_;
    std::vector<RowOrigin> origins_;
};

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_CONSTRAINTSYSTEM_H_INCLUDED
