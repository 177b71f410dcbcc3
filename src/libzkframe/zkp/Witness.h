#ifndef ZKFRAME_ZKP_WITNESS_H_INCLUDED
#define ZKFRAME_ZKP_WITNESS_H_INCLUDED

#include "Circuit.h"
#include "Field.h"

#include <cstddef>
#include <vector>

namespace zkframe {
namespace zkp {

/**
 * Dense assignment of every circuit variable, indexed like the constraint
 * system's columns. Entry 0 is always 1.
 */
class Witness
{
public:
    // Throws std::invalid_argument if values is empty or values[0] != 1.
    explicit Witness(std::vector<FieldT> values);

    std::size_t
    size() const
    {
        return values_.size();
    }

    FieldT const&
    operator[](VariableRef index) const
    {
        return values_[index];
    }

    FieldT const&
    at(VariableRef index) const
    {
        return values_.at(index);
    }

    std::vector<FieldT> const&
    values() const
    {
        return values_;
    }

    // Assignment without the leading constant, as libsnark evaluates it.
    std::vector<FieldT>
    assignment() const
    {
        return std::vector<FieldT>(values_.begin() + 1, values_.end());
    }

private:
    std::vector<FieldT> values_;
};

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_WITNESS_H_INCLUDED
