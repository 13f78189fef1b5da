#include "commands.h"
#include "cli_common.h"

namespace gymface {

using namespace gymface::cli;

int cmd_register(const std::string& config_path, const std::string& subject_id,
                 const std::string& image_path, bool update) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    auto image = readImageBase64(image_path);
    if (!image) return 1;

    try {
        auto service = openService(*settings);
        RegistrationResult result = update
            ? service->updateFace(subject_id, *image)
            : service->registerFace(subject_id, *image);

        Json::Value out = resultJson(result);
        out["subject_id"] = subject_id;
        if (result.success) {
            out["record_id"] = result.record_id;
        }
        printJson(out);
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

} // namespace gymface
