#include "core/cli.hpp"
#include "core/logging.hpp"

int main(int argc, char* argv[]) {
    init_logging("warn");
    return CLI::run(argc, argv);
}
