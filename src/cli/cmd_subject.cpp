#include "commands.h"
#include "cli_common.h"

namespace gymface {

using namespace gymface::cli;

int cmd_subject_add(const std::string& config_path, const std::string& subject_id,
                    const std::string& display_name) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    try {
        openSubjects(*settings)->upsert(subject_id, display_name);

        Json::Value out;
        out["success"] = true;
        out["subject_id"] = subject_id;
        out["display_name"] = display_name;
        printJson(out);
        return 0;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

int cmd_subject_disable(const std::string& config_path, const std::string& subject_id) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    try {
        openSubjects(*settings)->setActive(subject_id, false);

        Json::Value out;
        out["success"] = true;
        out["subject_id"] = subject_id;
        out["is_active"] = false;
        printJson(out);
        return 0;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

} // namespace gymface
