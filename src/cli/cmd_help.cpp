#include <iostream>
#include "commands.h"
#include "config_paths.h"

namespace gymface {

void print_usage() {
    std::cout << "gymface - Biometric face authentication for gym access" << std::endl;
    std::cout << "Version: " << VERSION << std::endl << std::endl;
    std::cout << "Usage: gymface [--config <path>] <command> [options]" << std::endl << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  register <subject> <image>                   Enroll the face in <image> for <subject>" << std::endl;
    std::cout << "  update <subject> <image>                     Replace the subject's face" << std::endl;
    std::cout << "  authenticate <image> [--tolerance T]         Identify the subject in <image>" << std::endl;
    std::cout << "  delete <subject>                             Deactivate the subject's face" << std::endl;
    std::cout << "  compare <image_a> <image_b> [--tolerance T]  Compare the faces of two images" << std::endl;
    std::cout << "  list                                         List subjects and active faces" << std::endl;
    std::cout << "  detect <image>                               Detect every face in <image>" << std::endl;
    std::cout << "  quality <image>                              Report capture quality of the face" << std::endl;
    std::cout << "  subject add <id> <name>                      Create or rename a subject" << std::endl;
    std::cout << "  subject disable <id>                         Mark a subject inactive" << std::endl;
    std::cout << "  version                                      Show version information" << std::endl;
    std::cout << "  help                                         Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Configuration: " << CONFIG_DIR << "/gymface.conf (override with --config)" << std::endl;
    std::cout << "Encryption key: [storage] encryption_key or GYMFACE_ENCRYPTION_KEY" << std::endl;
    std::cout << "Log file: GYMFACE_LOG_FILE (console when unset)" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  gymface subject add c-1042 \"Ana Lopez\"             # Create a subject" << std::endl;
    std::cout << "  gymface register c-1042 ana.jpg                    # Enroll the face" << std::endl;
    std::cout << "  gymface authenticate door-cam.jpg                  # Who is at the door?" << std::endl;
    std::cout << "  gymface authenticate door-cam.jpg --tolerance 0.4  # Stricter distance cutoff" << std::endl;
    std::cout << "  gymface compare a.jpg b.jpg                        # Same person?" << std::endl;
}

} // namespace gymface
