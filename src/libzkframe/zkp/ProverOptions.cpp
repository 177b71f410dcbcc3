#include "ProverOptions.h"

#include <stdexcept>

namespace zkframe {
namespace zkp {

ProverOptions
parseProverOptions(int argc, char const* const* argv)
{
    ProverOptions options;
    bool havePath = false;

    auto valueOf = [&](int& i, std::string const& flag) -> std::string {
        if (i + 1 >= argc)
            throw std::invalid_argument(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string const arg = argv[i];

        if (arg == "-h" || arg == "--help")
            options.showHelp = true;
        else if (arg == "--quiet")
            options.quiet = true;
        else if (arg == "--keys")
            options.keysPath = valueOf(i, arg);
        else if (arg == "--proof")
            options.proofPath = valueOf(i, arg);
        else if (arg.size() > 1 && arg[0] == '-')
            throw std::invalid_argument("unknown option " + arg);
        else if (havePath)
            throw std::invalid_argument("more than one circuit file given");
        else
        {
            options.circuitPath = arg;
            havePath = true;
        }
    }

    if (!havePath && !options.showHelp)
        throw std::invalid_argument("missing circuit file");

    return options;
}

std::string
proverUsage(std::string const& program)
{
    return "Usage: " + program +
        " [--keys <basePath>] [--proof <file>] [--quiet] <circuit-file>\n"
        "  --keys <basePath>  load keys from <basePath>_pk/_vk, or generate "
        "and save them\n"
        "  --proof <file>     write the serialized proof to <file>\n"
        "  --quiet            only report errors\n";
}

}  // namespace zkp
}  // namespace zkframe
