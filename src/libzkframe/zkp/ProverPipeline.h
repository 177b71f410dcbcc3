#ifndef ZKFRAME_ZKP_PROVERPIPELINE_H_INCLUDED
#define ZKFRAME_ZKP_PROVERPIPELINE_H_INCLUDED

#include "Errors.h"
#include "ProverOptions.h"

#include <exception>
#include <ostream>

namespace zkframe {
namespace zkp {

// Process exit codes, one per failing stage.
enum ExitCode : int {
    exitSuccess = 0,
    exitUsage = 1,
    exitParse = 2,
    exitCompile = 3,
    exitWitness = 4,
    exitBackend = 5,
    exitUnverified = 6,
    exitInternal = 7
};

int
exitCodeFor(Stage stage);

/**
 * Report a failure to `err` and pick its exit code.
 *
 * Pipeline errors are reported as "<stage> stage failed: ..." with their
 * stage's code; anything else is an internal error (exitInternal).
 */
int
reportFailure(std::exception const& e, std::ostream& err);

/**
 * Read the circuit file, then parse, compile, set up (or load) keys,
 * evaluate the witness, prove and verify.
 *
 * The witness is checked against the constraint system before any proof is
 * attempted. Progress goes to `out` unless options.quiet; every failure is
 * reported to `err` with its stage.
 *
 * @return an ExitCode.
 */
int
runProver(ProverOptions const& options, std::ostream& out, std::ostream& err);

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_PROVERPIPELINE_H_INCLUDED
