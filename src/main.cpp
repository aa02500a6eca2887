#include "questlog/cli.hpp"

int main(int argc, char *argv[])
{
    return questlog::cli::run(argc, argv);
}
