#include "pausaler/cli.hpp"

int main(int argc, char *argv[])
{
    return pausaler::cli::run_client(argc, argv);
}
