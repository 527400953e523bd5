//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for hsreload.
//
//===----------------------------------------------------------------------===//

#include "tools/hsreload/cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    using namespace hotswap::tools;
    auto opts = parseArgs(ArgvView{argc, argv}.drop_front());
    if (!opts)
    {
        hotswap::support::printDiag(opts.error(), std::cerr);
        printUsage(std::cerr);
        return 1;
    }
    if (opts.value().help)
    {
        printUsage(std::cout);
        return 0;
    }
    return runReload(opts.value(), std::cout, std::cerr);
}
