#include "commands.h"
#include "cli_common.h"

namespace gymface {

using namespace gymface::cli;

int cmd_authenticate(const std::string& config_path, const std::string& image_path,
                     std::optional<double> tolerance) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    auto image = readImageBase64(image_path);
    if (!image) return 1;

    try {
        auto service = openService(*settings);
        AuthenticationResult result = service->authenticate(*image, tolerance);

        Json::Value out = resultJson(result);
        if (result.success) {
            out["subject_id"] = result.subject_id;
            if (result.subject) {
                Json::Value info;
                info["id"] = result.subject->id;
                info["display_name"] = result.subject->display_name;
                info["is_active"] = result.subject->is_active;
                out["subject_info"] = info;
            }
            out["similarity"] = result.similarity;
            out["distance"] = result.distance;
        }
        printJson(out);
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

} // namespace gymface
