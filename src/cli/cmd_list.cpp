#include "commands.h"
#include "cli_common.h"
#include <map>

namespace gymface {

using namespace gymface::cli;

int cmd_list(const std::string& config_path) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    try {
        auto store = openStore(*settings);
        auto subjects = openSubjects(*settings);

        std::map<std::string, BiometricRecord> active;
        for (auto& record : store->listActive()) {
            std::string key = record.subject_id;
            active.emplace(std::move(key), std::move(record));
        }

        Json::Value out;
        out["success"] = true;
        Json::Value list(Json::arrayValue);

        for (const auto& subject : subjects->list()) {
            Json::Value entry;
            entry["id"] = subject.id;
            entry["display_name"] = subject.display_name;
            entry["is_active"] = subject.is_active;

            auto it = active.find(subject.id);
            if (it != active.end()) {
                Json::Value face;
                face["record_id"] = it->second.id;
                face["created_at"] = it->second.created_at;
                face["metadata"] = it->second.metadata;
                entry["face"] = face;
                active.erase(it);
            } else {
                entry["face"] = Json::nullValue;
            }
            list.append(entry);
        }

        // Faces whose subject is missing from the directory
        Json::Value orphans(Json::arrayValue);
        for (const auto& kv : active) {
            Json::Value face;
            face["subject_id"] = kv.first;
            face["record_id"] = kv.second.id;
            face["created_at"] = kv.second.created_at;
            orphans.append(face);
        }

        out["subjects"] = list;
        out["unlinked_faces"] = orphans;
        printJson(out);
        return 0;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

} // namespace gymface
