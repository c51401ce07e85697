#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return bigcomp::cli::run(argc, argv);
}
