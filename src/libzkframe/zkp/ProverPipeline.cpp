#include "ProverPipeline.h"
#include "ConstraintCompiler.h"
#include "Groth16Backend.h"
#include "Parser.h"
#include "WitnessEvaluator.h"

#include <libff/common/profiling.hpp>

#include <fstream>

namespace zkframe {
namespace zkp {

int
exitCodeFor(Stage stage)
{
    switch (stage)
    {
        case Stage::Parse:
            return exitParse;
        case Stage::Compile:
            return exitCompile;
        case Stage::Witness:
            return exitWitness;
        case Stage::Backend:
            return exitBackend;
    }
    return exitBackend;
}

int
reportFailure(std::exception const& e, std::ostream& err)
{
    if (auto const* error = dynamic_cast<Error const*>(&e))
    {
        err << to_string(error->stage()) << " stage failed: " << e.what()
            << std::endl;
        return exitCodeFor(error->stage());
    }

    err << "Internal error: " << e.what() << std::endl;
    return exitInternal;
}

int
runProver(ProverOptions const& options, std::ostream& out, std::ostream& err)
{
    libff::inhibit_profiling_info = options.quiet;
    libff::inhibit_profiling_counters = options.quiet;

    auto log = [&](std::string const& message) {
        if (!options.quiet)
            out << message << std::endl;
    };

    std::ifstream file(options.circuitPath);
    if (!file.good())
    {
        err << "Cannot read circuit file: " << options.circuitPath
            << std::endl;
        return exitUsage;
    }

    try
    {
        log("Parsing circuit from: " + options.circuitPath);
        Circuit const circuit = parseCircuit(file);
        log("Parsed circuit: " + circuit.name + " (" +
            std::to_string(circuit.inputs.size()) + " inputs, " +
            std::to_string(circuit.outputs.size()) + " outputs, " +
            std::to_string(circuit.operations.size()) + " operations)");

        log("Converting circuit to R1CS...");
        ConstraintSystem const system = compileConstraints(circuit);
        log("Circuit has " + std::to_string(system.numConstraints()) +
            " constraints, " + std::to_string(system.numVariables()) +
            " variables, " + std::to_string(system.publicIndices().size()) +
            " public inputs");

        Groth16Backend backend(system);
        if (options.keysPath)
        {
            if (!backend.loadKeys(*options.keysPath))
            {
                log("Generating Groth16 keys...");
                backend.setup();
                if (!backend.saveKeys(*options.keysPath))
                    return exitUsage;
            }
        }
        else
        {
            log("Generating Groth16 keys...");
            backend.setup();
        }

        log("Computing witness...");
        Witness const witness = evaluateWitness(circuit);
        if (auto const row = system.firstUnsatisfiedRow(witness))
        {
            RowOrigin const& origin = system.origin(*row);
            throw UnsatisfiedConstraint(
                "witness violates constraint row " + std::to_string(*row) +
                    " (" + origin.label + ")",
                origin.line);
        }
        log("Witness computed with " + std::to_string(witness.size()) +
            " assignments");

        log("Generating proof...");
        ProofData const proof = backend.prove(witness);

        if (options.proofPath)
        {
            std::ofstream proofFile(*options.proofPath, std::ios::binary);
            proofFile.write(
                reinterpret_cast<char const*>(proof.proof.data()),
                static_cast<std::streamsize>(proof.proof.size()));
            if (!proofFile)
            {
                err << "Cannot write proof to " << *options.proofPath
                    << std::endl;
                return exitUsage;
            }
            log("Proof written to " + *options.proofPath);
        }

        log("Verifying proof...");
        if (!backend.verify(proof))
        {
            err << "verify stage failed: proof failed verification"
                << std::endl;
            return exitUnverified;
        }

        log("Proof is VALID");
        return exitSuccess;
    }
    catch (std::exception const& e)
    {
        return reportFailure(e, err);
    }
}

}  // namespace zkp
}  // namespace zkframe
