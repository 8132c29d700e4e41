#include "main_command.hpp"
#include "progressbar/common/constants.hpp"

namespace progressbar {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::printHelp(std::ostream& out) const {
    out << "Number of jobs/iterations are required\n";
    out << "CLI Usage:\n";
    out << "    command | " << constants::system::APPLICATION_NAME << " [OPTIONS] <jobs>\n\n";
    out << "Options:\n";
    out << "  -c, --config PATH       Configuration file path\n";
    out << "  -i, --interval SECONDS  Minimum time between redraws\n";
    out << "      --no-summary        Do not print the execution time\n";
    out << "      --color MODE        auto, always or never\n";
    out << "      --report FORMAT     none, text or json (written to stderr)\n";
    out << "  -h, --help              Show this help message\n";
    out << "  -v, --version           Show version information\n\n";
    out << "Example:\n";
    out << "    find . -type f -exec echo \"{}\" /tmp/media/ \\; | "
        << constants::system::APPLICATION_NAME << " $(find . -type f | wc -l)\n";
}

}}
