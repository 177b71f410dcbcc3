#include "ProtoboardLayout.h"

#include <libzkframe/zkp/Errors.h>

namespace zkframe {
namespace zkp {

std::vector<libsnark::pb_variable<FieldT>>
allocateVariables(
    libsnark::protoboard<FieldT>& pb,
    VariableTable const& variables)
{
    std::vector<libsnark::pb_variable<FieldT>> allocated(variables.size());

    for (auto const& variable : variables)
    {
        if (variable.index == oneIndex)
            continue;

        allocated[variable.index].allocate(pb, variable.name);
        if (allocated[variable.index].index != variable.index)
        {
            throw CompileError(
                "protoboard column for '" + variable.name +
                "' does not match its allocation index");
        }
    }

    return allocated;
}

}  // namespace zkp
}  // namespace zkframe
