#include "parallax_rt/app.hpp"
#include <cstdlib>
#include <print>

int main(int argc, char **argv) {
    parallax_rt::App app(argc, argv);

    try {
        app.Launch();
    } catch (std::exception &e) {
        std::println("Uncaught exception: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
