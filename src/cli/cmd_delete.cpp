#include "commands.h"
#include "cli_common.h"

namespace gymface {

using namespace gymface::cli;

int cmd_delete(const std::string& config_path, const std::string& subject_id) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    try {
        auto service = openService(*settings);
        DeletionResult result = service->deleteFace(subject_id);

        Json::Value out = resultJson(result);
        out["subject_id"] = subject_id;
        if (result.success) {
            out["message"] = result.message;
            out["deactivated"] = static_cast<Json::UInt64>(result.deactivated);
        }
        printJson(out);
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

} // namespace gymface
