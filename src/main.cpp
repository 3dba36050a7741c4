#include "chainlog/cli.hpp"

int main(int argc, char *argv[])
{
    return chainlog::cli::run(argc, argv);
}
