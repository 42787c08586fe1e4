#include "cli/cli.hpp"
#include "providers/vm_provider.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        xenopscli::CLI cli(&xenopscli::VMProvider::create_default);
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
}
