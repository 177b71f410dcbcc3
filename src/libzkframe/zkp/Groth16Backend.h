#ifndef ZKFRAME_ZKP_GROTH16BACKEND_H_INCLUDED
#define ZKFRAME_ZKP_GROTH16BACKEND_H_INCLUDED

#include "ConstraintSystem.h"
#include "Field.h"
#include "Witness.h"

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <memory>
#include <string>
#include <vector>

namespace zkframe {
namespace zkp {

// Serialized proof plus the public inputs it was generated for.
struct ProofData
{
    std::vector<unsigned char> proof;
    std::vector<FieldT> publicInputs;

    bool
    empty() const
    {
        return proof.empty();
    }
};

/**
 * Groth16 prover/verifier over alt_bn128, driven by libsnark.
 *
 * libsnark expects the public inputs in columns 1..n. The adapter keeps the
 * constraint rows in order and permutes columns only:
 *   circuit index 0                 -> column 0
 *   i-th public index (public order) -> column 1 + i
 *   every other index (allocation order) -> the following columns
 *
 * Proving and verification keys are opaque to callers; they can be
 * persisted with saveKeys() and reloaded with loadKeys().
 */
class Groth16Backend
{
public:
    using Proof = libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>;
    using ProvingKey = libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>;
    using VerificationKey =
        libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;

    explicit Groth16Backend(ConstraintSystem const& system);

    // Run key generation. Throws BackendError on failure.
    void
    setup();

    bool
    hasKeys() const
    {
        return provingKey_ && verificationKey_;
    }

    // Throws BackendError if no keys are available or proving fails.
    ProofData
    prove(Witness const& witness) const;

    /**
     * Check a proof against its public inputs.
     * @return false if the proof does not verify.
     * @throws BackendError if no verification key is loaded or the proof
     *         bytes cannot be decoded.
     */
    bool
    verify(ProofData const& proofData) const;

    bool
    saveKeys(std::string const& basePath) const;

    // Returns false if the key files are missing or were generated for a
    // different constraint system.
    bool
    loadKeys(std::string const& basePath);

    libsnark::r1cs_constraint_system<FieldT> const&
    backendSystem() const
    {
        return system_;
    }

    std::size_t
    columnOf(VariableRef index) const
    {
        return columns_.at(index);
    }

    libsnark::r1cs_primary_input<FieldT>
    primaryInput(Witness const& witness) const;

    libsnark::r1cs_auxiliary_input<FieldT>
    auxiliaryInput(Witness const& witness) const;

    static std::vector<unsigned char>
    serializeProof(Proof const& proof);

    // Throws BackendError if the bytes do not decode to a proof.
    static Proof
    deserializeProof(std::vector<unsigned char> const& proofData);

private:
    libsnark::linear_combination<FieldT>
    remap(libsnark::linear_combination<FieldT> const& lc) const;

    void
    checkWitnessSize(Witness const& witness) const;

    std::vector<std::size_t> columns_;
    std::vector<VariableRef> public_;
    std::vector<VariableRef> auxiliary_;
    libsnark::r1cs_constraint_system<FieldT> system_;

    std::shared_ptr<ProvingKey> provingKey_;
    std::shared_ptr<VerificationKey> verificationKey_;
};

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_GROTH16BACKEND_H_INCLUDED
