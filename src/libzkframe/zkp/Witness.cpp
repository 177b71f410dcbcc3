#include "Witness.h"

#include <stdexcept>

namespace zkframe {
namespace zkp {

Witness::Witness(std::vector<FieldT> values) : values_(std::move(values))
{
    if (values_.empty() || values_[oneIndex] != FieldT::one())
        throw std::invalid_argument("witness entry 0 must be the constant 1");
}

}  // namespace zkp
}  // namespace zkframe
