#ifndef ZKFRAME_ZKP_PROVEROPTIONS_H_INCLUDED
#define ZKFRAME_ZKP_PROVEROPTIONS_H_INCLUDED

#include <optional>
#include <string>

namespace zkframe {
namespace zkp {

// Command line configuration of zkframe-prove.
struct ProverOptions
{
    std::string circuitPath;
    // Load keys from <keysPath>_pk/_vk, or generate and save them there.
    std::optional<std::string> keysPath;
    // Write the serialized proof here.
    std::optional<std::string> proofPath;
    bool quiet = false;
    bool showHelp = false;
};

/**
 * Parse `[--keys <basePath>] [--proof <file>] [--quiet] <circuit-file>`.
 *
 * @throws std::invalid_argument on unknown flags, missing flag values, or a
 *         missing or repeated circuit path (unless --help is given).
 */
ProverOptions
parseProverOptions(int argc, char const* const* argv);

std::string
proverUsage(std::string const& program);

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_PROVEROPTIONS_H_INCLUDED
