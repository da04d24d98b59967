#include "apimgr/cli.hpp"

int main(int argc, char *argv[])
{
    return apimgr::cli::run(argc, argv);
}
