// graft_train: trains the sketch graph model from the command line.

#include <exception>
#include <iostream>

#include "../include/Graft.h"

int main(int argc, char** argv)
{
    try {
        const auto config = Graft::Config::parse_command_line(argc, argv, std::cout);
        if (!config) {
            return 0;
        }
        Graft::Driver::bootstrap(*config, [&](const std::optional<Graft::Distributed::DistributedContext>& context) {
            static_cast<void>(Graft::Driver::run(*config, context));
        });
    } catch (const std::exception& error) {
        std::cerr << Graft::Utils::Terminal::Prefix(false) << "error: " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
