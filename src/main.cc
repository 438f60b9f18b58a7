// SPDX-License-Identifier: MIT
#include "Visualizer.hh"

#include <filesystem>
#include <iostream>

int main()
{
    // make sure the executable is run from the correct path
    // (this way we can find all the resources in the data folder)
    if (!std::filesystem::exists("../data"))
    {
        std::cerr << "Working directory must be set to 'bin/'" << std::endl;
        return EXIT_FAILURE;
    }

    Visualizer app;

    // initialize and enter the main loop
    app.run();

    return EXIT_SUCCESS;
}
