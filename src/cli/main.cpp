#include <iostream>
#include <string>
#include <vector>
#include "commands.h"
#include "cli_common.h"
#include "config_paths.h"

using namespace gymface;

namespace {

// Pull "--tolerance T" out of args; false if the value is missing or malformed
bool extractTolerance(std::vector<std::string>& args, std::optional<double>& tolerance) {
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] != "--tolerance") continue;

        if (i + 1 >= args.size()) {
            std::cerr << "Error: --tolerance requires a value" << std::endl;
            return false;
        }
        tolerance = cli::parseTolerance(args[i + 1]);
        if (!tolerance) {
            return false;
        }
        args.erase(args.begin() + i, args.begin() + i + 2);
        return true;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // Global option
    std::string config_path;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --config requires a path" << std::endl;
                return 1;
            }
            config_path = args[i + 1];
            args.erase(args.begin() + i, args.begin() + i + 2);
            break;
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    std::string command = args[0];

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "version" || command == "--version" || command == "-v") {
        std::cout << "gymface version " << VERSION << std::endl;
        return 0;
    }

    if (command == "register" || command == "update") {
        if (args.size() < 3) {
            std::cerr << "Error: subject id and image path required" << std::endl;
            std::cerr << "Usage: gymface " << command << " <subject> <image>" << std::endl;
            return 1;
        }
        return cmd_register(config_path, args[1], args[2], command == "update");
    }

    if (command == "authenticate") {
        std::optional<double> tolerance;
        if (!extractTolerance(args, tolerance)) return 1;
        if (args.size() < 2) {
            std::cerr << "Error: image path required" << std::endl;
            std::cerr << "Usage: gymface authenticate <image> [--tolerance T]" << std::endl;
            return 1;
        }
        return cmd_authenticate(config_path, args[1], tolerance);
    }

    if (command == "delete") {
        if (args.size() < 2) {
            std::cerr << "Error: subject id required" << std::endl;
            return 1;
        }
        return cmd_delete(config_path, args[1]);
    }

    if (command == "compare") {
        std::optional<double> tolerance;
        if (!extractTolerance(args, tolerance)) return 1;
        if (args.size() < 3) {
            std::cerr << "Error: two image paths required" << std::endl;
            std::cerr << "Usage: gymface compare <image_a> <image_b> [--tolerance T]" << std::endl;
            return 1;
        }
        return cmd_compare(config_path, args[1], args[2], tolerance);
    }

    if (command == "list") {
        return cmd_list(config_path);
    }

    if (command == "detect" || command == "quality") {
        if (args.size() < 2) {
            std::cerr << "Error: image path required" << std::endl;
            return 1;
        }
        return command == "detect" ? cmd_detect(config_path, args[1]) : cmd_quality(config_path, args[1]);
    }

    if (command == "subject") {
        if (args.size() < 3) {
            std::cerr << "Error: subject subcommand required" << std::endl;
            std::cerr << "Usage: gymface subject add <id> <name>" << std::endl;
            std::cerr << "       gymface subject disable <id>" << std::endl;
            return 1;
        }

        const std::string& subcmd = args[1];
        if (subcmd == "add") {
            if (args.size() < 4) {
                std::cerr << "Error: display name required" << std::endl;
                return 1;
            }
            return cmd_subject_add(config_path, args[2], args[3]);
        }
        if (subcmd == "disable") {
            return cmd_subject_disable(config_path, args[2]);
        }

        std::cerr << "Unknown subject subcommand: " << subcmd << std::endl;
        return 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
