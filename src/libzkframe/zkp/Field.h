#ifndef ZKFRAME_ZKP_FIELD_H_INCLUDED
#define ZKFRAME_ZKP_FIELD_H_INCLUDED

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <string>

namespace zkframe {
namespace zkp {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;

/**
 * Initialize the alt_bn128 curve parameters.
 *
 * Field arithmetic (including literal parsing) is only valid after this has
 * run. Calling it again is a no-op.
 */
void
initializeCurve();

/**
 * Parse a decimal integer literal (`-?[0-9]+`) into a field element.
 *
 * Negative literals map to the field negation of their magnitude.
 * @return false if the text is not a literal or its magnitude is not below
 *         the field modulus.
 */
bool
parseFieldLiteral(std::string const& text, FieldT& out);

// Canonical representative in decimal, for diagnostics.
std::string
toDecimalString(FieldT const& value);

bool
isBoolean(FieldT const& value);

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_FIELD_H_INCLUDED
