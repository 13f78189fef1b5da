#include "commands.h"
#include "cli_common.h"

namespace gymface {

using namespace gymface::cli;

int cmd_compare(const std::string& config_path, const std::string& image_a,
                const std::string& image_b, std::optional<double> tolerance) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    auto first = readImageBase64(image_a);
    if (!first) return 1;
    auto second = readImageBase64(image_b);
    if (!second) return 1;

    try {
        auto service = openService(*settings);
        FaceComparisonResult result = service->compareTwo(*first, *second, tolerance);

        Json::Value out = resultJson(result);
        if (result.success) {
            out["match"] = result.match;
            out["similarity"] = result.similarity;
            out["distance"] = result.distance;
            out["confidence"] = result.confidence;
        }
        printJson(out);
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

} // namespace gymface
