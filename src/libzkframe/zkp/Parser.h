#ifndef ZKFRAME_ZKP_PARSER_H_INCLUDED
#define ZKFRAME_ZKP_PARSER_H_INCLUDED

#include "Circuit.h"

#include <istream>
#include <string>

namespace zkframe {
namespace zkp {

/**
 * Parse circuit description text into a Circuit.
 *
 * Line-oriented grammar, whitespace separated, blank lines and `//` comment
 * lines ignored:
 *
 *     name   <identifier>
 *     input  <identifier> <integer>
 *     output <identifier> <integer>
 *     const  <identifier> <integer>
 *     add|sub|mul|xor|eq <operand> <operand> <result>
 *
 * Variables are allocated in the order they are declared or produced.
 * Operands must already exist when the operation is read. An output names
 * the result of an operation that may appear before or after it.
 *
 * @throws SyntaxError, DuplicateVariable, UndefinedVariable
 */
Circuit
parseCircuit(std::istream& in);

Circuit
parseCircuit(std::string const& text);

// Name given to the auxiliary inverse witness of an eq result.
std::string
inverseName(std::string const& resultName);

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_PARSER_H_INCLUDED
