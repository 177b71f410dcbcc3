#include <libzkframe/zkp/ProverOptions.h>
#include <libzkframe/zkp/ProverPipeline.h>

#include <exception>
#include <iostream>

int
main(int argc, char* argv[])
{
    using namespace zkframe::zkp;

    ProverOptions options;
    try
    {
        options = parseProverOptions(argc, argv);
    }
    catch (std::invalid_argument const& e)
    {
        std::cerr << e.what() << "\n" << proverUsage(argv[0]);
        return exitUsage;
    }

    if (options.showHelp)
    {
        std::cout << proverUsage(argv[0]);
        return exitSuccess;
    }

    try
    {
        return runProver(options, std::cout, std::cerr);
    }
    catch (std::exception const& e)
    {
        return reportFailure(e, std::cerr);
    }
}
