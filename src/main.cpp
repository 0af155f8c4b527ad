#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return cuke::cli::cuke_main(argc, argv);
}
