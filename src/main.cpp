#include "restjson/cli.hpp"

int main(int argc, char *argv[])
{
    return restjson::cli::run(argc, argv);
}
