#include "patch/PatchTypes.h"
#include "utils/UTF8Utils.h"

std::string toString(ChangeOperation op) {
    switch (op) {
        case ChangeOperation::Add: return "add";
        case ChangeOperation::Delete: return "delete";
        case ChangeOperation::Update: return "update";
    }
    return "unknown";
}

std::string ApplyPatchResult::summary() const {
    if (isError()) {
        return "";
    }
    std::string out = "Success. Updated the following files:\n";
    for (const auto& path : added) out += "A " + path + "\n";
    for (const auto& path : modified) out += "M " + path + "\n";
    for (const auto& path : deleted) out += "D " + path + "\n";
    return out;
}

nlohmann::json ApplyPatchResult::toJson() const {
    nlohmann::json changesJson = nlohmann::json::array();
    for (const auto& change : changes) {
        nlohmann::json item;
        item["path"] = UTF8Utils::sanitize(change.path);
        item["operation"] = toString(change.operation);
        item["old_content"] = UTF8Utils::sanitize(change.oldContent);
        item["new_content"] = UTF8Utils::sanitize(change.newContent);
        item["unified_diff"] = UTF8Utils::sanitize(change.unifiedDiff);
        if (!change.movePath.empty()) {
            item["move_path"] = UTF8Utils::sanitize(change.movePath);
        }
        changesJson.push_back(std::move(item));
    }

    auto sanitizeAll = [](const std::vector<std::string>& paths) {
        std::vector<std::string> out;
        out.reserve(paths.size());
        for (const auto& p : paths) out.push_back(UTF8Utils::sanitize(p));
        return out;
    };

    nlohmann::json result;
    result["tool_name"] = "apply_patch";
    result["success"] = !isError();
    if (isError()) {
        result["error"] = UTF8Utils::sanitize(error);
    }
    result["metadata"] = {
        {"added", sanitizeAll(added)},
        {"modified", sanitizeAll(modified)},
        {"deleted", sanitizeAll(deleted)},
        {"changes", changesJson}
    };
    return result;
}
