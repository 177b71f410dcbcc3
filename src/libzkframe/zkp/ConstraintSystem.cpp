#include "ConstraintSystem.h"

#include <map>
#include <stdexcept>

namespace zkframe {
namespace zkp {

ConstraintSystem::ConstraintSystem(
    libsnark::r1cs_constraint_system<FieldT> system,
    std::vector<VariableRef> publicIndices,
    std::vector<RowOrigin> origins)
    : system_(std::move(system))
    , publicIndices_(std::move(publicIndices))
    , origins_(std::move(origins))
{
    if (origins_.size() != system_.num_constraints())
        throw std::invalid_argument("every constraint row needs an origin");
    for (VariableRef index : publicIndices_)
    {
        if (index == oneIndex || index >= numVariables())
            throw std::invalid_argument("public index out of range");
    }
}

bool
ConstraintSystem::isSatisfied(Witness const& witness) const
{
    return !firstUnsatisfiedRow(witness).has_value();
}

std::optional<std::size_t>
ConstraintSystem::firstUnsatisfiedRow(Witness const& witness) const
{
    if (witness.size() != numVariables())
        throw std::invalid_argument(
            "witness has " + std::to_string(witness.size()) +
            " entries, constraint system has " +
            std::to_string(numVariables()) + " variables");

    auto const assignment = witness.assignment();
    for (std::size_t row = 0; row < system_.num_constraints(); ++row)
    {
        auto const& constraint = system_.constraints[row];
        FieldT const a = constraint.a.evaluate(assignment);
        FieldT const b = constraint.b.evaluate(assignment);
        FieldT const c = constraint.c.evaluate(assignment);
        if (a * b != c)
            return row;
    }
    return std::nullopt;
}

std::vector<FieldT>
ConstraintSystem::primaryInput(Witness const& witness) const
{
    std::vector<FieldT> primary;
    primary.reserve(publicIndices_.size());
    for (VariableRef index : publicIndices_)
        primary.push_back(witness.at(index));
    return primary;
}

template <typename Select>
std::vector<MatrixEntry>
ConstraintSystem::collect(Select select) const
{
    std::vector<MatrixEntry> entries;
    for (std::size_t row = 0; row < system_.num_constraints(); ++row)
    {
        // libsnark keeps repeated and cancelling terms; one cell per column.
        std::map<std::size_t, FieldT> cells;
        for (auto const& term : select(system_.constraints[row]).terms)
        {
            auto const it = cells.find(term.index);
            if (it == cells.end())
                cells.emplace(term.index, term.coeff);
            else
                it->second += term.coeff;
        }
        for (auto const& [column, coefficient] : cells)
        {
            if (!coefficient.is_zero())
                entries.push_back({row, column, coefficient});
        }
    }
    return entries;
}

std::vector<MatrixEntry>
ConstraintSystem::matrixA() const
{
    return collect([](libsnark::r1cs_constraint<FieldT> const& c)
                       -> libsnark::linear_combination<FieldT> const& {
        return c.a;
    });
}

std::vector<MatrixEntry>
ConstraintSystem::matrixB() const
{
    return collect([](libsnark::r1cs_constraint<FieldT> const& c)
                       -> libsnark::linear_combination<FieldT> const& {
        return c.b;
    });
}

std::vector<MatrixEntry>
ConstraintSystem::matrixC() const
{
    return collect([](libsnark::r1cs_constraint<FieldT> const& c)
                       -> libsnark::linear_combination<FieldT> const& {
        return c.c;
    });
}

}  // namespace zkp
}  // namespace zkframe
