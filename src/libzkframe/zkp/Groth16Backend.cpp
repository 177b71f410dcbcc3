#include "Groth16Backend.h"
#include "Errors.h"

#include <libff/common/profiling.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace zkframe {
namespace zkp {

Groth16Backend::Groth16Backend(ConstraintSystem const& system)
    : public_(system.publicIndices())
{
    initializeCurve();

    std::size_t const n = system.numVariables();
    columns_.assign(n, 0);
    std::vector<bool> isPublic(n, false);

    std::size_t next = 1;
    for (VariableRef index : public_)
    {
        if (isPublic.at(index))
            throw std::invalid_argument("public index listed twice");
        isPublic[index] = true;
        columns_[index] = next++;
    }
    for (VariableRef index = 1; index < n; ++index)
    {
        if (isPublic[index])
            continue;
        columns_[index] = next++;
        auxiliary_.push_back(index);
    }

    system_.primary_input_size = public_.size();
    system_.auxiliary_input_size = auxiliary_.size();
    for (auto const& constraint : system.r1cs().constraints)
    {
        system_.add_constraint(libsnark::r1cs_constraint<FieldT>(
            remap(constraint.a), remap(constraint.b), remap(constraint.c)));
    }
}

libsnark::linear_combination<FieldT>
Groth16Backend::remap(libsnark::linear_combination<FieldT> const& lc) const
{
    libsnark::linear_combination<FieldT> result;
    for (auto const& term : lc.terms)
    {
        result.add_term(
            libsnark::variable<FieldT>(columns_.at(term.index)), term.coeff);
    }
    return result;
}

void
Groth16Backend::setup()
{
    libff::enter_block("Groth16 key generation");
    try
    {
        auto keypair =
            libsnark::r1cs_gg_ppzksnark_generator<DefaultCurve>(system_);

        provingKey_ = std::make_shared<ProvingKey>(std::move(keypair.pk));
        verificationKey_ =
            std::make_shared<VerificationKey>(std::move(keypair.vk));
    }
    catch (std::exception const& e)
    {
        libff::leave_block("Groth16 key generation");
        throw BackendError(std::string("key generation failed: ") + e.what());
    }
    libff::leave_block("Groth16 key generation");
}

void
Groth16Backend::checkWitnessSize(Witness const& witness) const
{
    if (witness.size() != columns_.size())
    {
        throw BackendError(
            "witness has " + std::to_string(witness.size()) +
            " entries, expected " + std::to_string(columns_.size()));
    }
}

libsnark::r1cs_primary_input<FieldT>
Groth16Backend::primaryInput(Witness const& witness) const
{
    checkWitnessSize(witness);

    libsnark::r1cs_primary_input<FieldT> primary;
    primary.reserve(public_.size());
    for (VariableRef index : public_)
        primary.push_back(witness[index]);
    return primary;
}

libsnark::r1cs_auxiliary_input<FieldT>
Groth16Backend::auxiliaryInput(Witness const& witness) const
{
    checkWitnessSize(witness);

    libsnark::r1cs_auxiliary_input<FieldT> auxiliary;
    auxiliary.reserve(auxiliary_.size());
    for (VariableRef index : auxiliary_)
        auxiliary.push_back(witness[index]);
    return auxiliary;
}

ProofData
Groth16Backend::prove(Witness const& witness) const
{
    if (!provingKey_)
        throw BackendError("no proving key: run setup or load keys first");

    auto const primary = primaryInput(witness);
    auto const auxiliary = auxiliaryInput(witness);

    libff::enter_block("Groth16 proof generation");
    Proof proof;
    try
    {
        proof = libsnark::r1cs_gg_ppzksnark_prover<DefaultCurve>(
            *provingKey_, primary, auxiliary);
    }
    catch (std::exception const& e)
    {
        libff::leave_block("Groth16 proof generation");
        throw BackendError(std::string("proof generation failed: ") + e.what());
    }
    libff::leave_block("Groth16 proof generation");

    return ProofData{serializeProof(proof), primary};
}

bool
Groth16Backend::verify(ProofData const& proofData) const
{
    if (!verificationKey_)
        throw BackendError("no verification key: run setup or load keys first");

    if (proofData.empty())
    {
        std::cerr << "Error verifying proof: empty proof data" << std::endl;
        return false;
    }

    auto const proof = deserializeProof(proofData.proof);

    libff::enter_block("Groth16 verification");
    bool const verified =
        libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<DefaultCurve>(
            *verificationKey_, proofData.publicInputs, proof);
    libff::leave_block("Groth16 verification");

    return verified;
}

bool
Groth16Backend::saveKeys(std::string const& basePath) const
{
    if (!hasKeys())
    {
        std::cerr << "Error saving keys: no keys generated" << std::endl;
        return false;
    }

    std::ofstream pkFile(basePath + "_pk", std::ios::binary);
    pkFile << *provingKey_;
    std::ofstream vkFile(basePath + "_vk", std::ios::binary);
    vkFile << *verificationKey_;

    if (!pkFile || !vkFile)
    {
        std::cerr << "Error saving keys to " << basePath << std::endl;
        return false;
    }

    if (!libff::inhibit_profiling_info)
        std::cout << "Saved keys to " << basePath << "_pk/_vk" << std::endl;
    return true;
}

bool
Groth16Backend::loadKeys(std::string const& basePath)
{
    std::ifstream pkFile(basePath + "_pk", std::ios::binary);
    std::ifstream vkFile(basePath + "_vk", std::ios::binary);
    if (!pkFile.good() || !vkFile.good())
    {
        if (!libff::inhibit_profiling_info)
            std::cout << "No existing keys found at " << basePath << std::endl;
        return false;
    }

    auto provingKey = std::make_shared<ProvingKey>();
    auto verificationKey = std::make_shared<VerificationKey>();
    pkFile >> *provingKey;
    vkFile >> *verificationKey;
    if (pkFile.fail() || vkFile.fail())
    {
        std::cerr << "Error loading keys: malformed key files at " << basePath
                  << std::endl;
        return false;
    }

    // The generator stores its own copy of the system with A and B possibly
    // swapped; compare against the same normal form.
    auto expected = system_;
    expected.swap_AB_if_beneficial();
    if (!(provingKey->constraint_system == expected))
    {
        std::cerr << "Keys at " << basePath
                  << " were generated for a different constraint system ("
                  << provingKey->constraint_system.num_constraints()
                  << " constraints, circuit has " << system_.num_constraints()
                  << ")" << std::endl;
        return false;
    }

    provingKey_ = std::move(provingKey);
    verificationKey_ = std::move(verificationKey);

    if (!libff::inhibit_profiling_info)
        std::cout << "Loaded keys with " << system_.num_constraints()
                  << " constraints" << std::endl;
    return true;
}

std::vector<unsigned char>
Groth16Backend::serializeProof(Proof const& proof)
{
    std::ostringstream oss;
    oss << proof;

    std::string const str = oss.str();
    return std::vector<unsigned char>(str.begin(), str.end());
}

Groth16Backend::Proof
Groth16Backend::deserializeProof(std::vector<unsigned char> const& proofData)
{
    std::string const str(proofData.begin(), proofData.end());
    std::istringstream iss(str);

    Proof proof;
    iss >> proof;
    if (iss.fail())
        throw BackendError("proof bytes do not decode to a Groth16 proof");

    return proof;
}

}  // namespace zkp
}  // namespace zkframe
