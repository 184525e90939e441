#include "ApplyPatchTool.h"
#include "patch/PatchApplier.h"
#include "patch/PatchParser.h"
#include "utils/Logger.h"
#include "utils/UTF8Utils.h"

ApplyPatchTool::ApplyPatchTool(const std::string& rootPath, IFileState& state, int diffContextLines)
    : rootPath(fs::absolute(fs::u8path(rootPath)).lexically_normal()),
      state(state),
      diffContextLines(diffContextLines) {}

std::string ApplyPatchTool::getDescription() const {
    return "Apply a multi-file patch. The input must start with '*** Begin Patch' and end with '*** End Patch'. "
           "Each file section starts with one header:\n"
           "  *** Add File: <path>      followed by the new file's lines, each prefixed with '+'\n"
           "  *** Delete File: <path>   nothing follows\n"
           "  *** Update File: <path>   optionally followed by '*** Move to: <new path>', then one or more chunks\n"
           "A chunk starts with '@@' or '@@ <a line near the change, e.g. a function signature>' "
           "(the first chunk of a file may omit it). Inside a chunk every line starts with ' ' (unchanged context), "
           "'-' (removed) or '+' (added). Show about 3 lines of context around each change; "
           "line numbers are never used. Add '*** End of File' after a chunk that must match the end of the file.\n"
           "Example:\n"
           "*** Begin Patch\n"
           "*** Update File: src/app.py\n"
           "@@ def greet():\n"
           "-    print(\"Hi\")\n"
           "+    print(\"Hello, world!\")\n"
           "*** End Patch\n"
           "Relative paths are resolved against " + rootPath.u8string() + ".";
}

nlohmann::json ApplyPatchTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"input", {
                {"type", "string"},
                {"description", "The entire contents of the apply_patch command"}
            }},
            {"dry_run", {
                {"type", "boolean"},
                {"description", "If true, only check that the patch parses and every chunk's context can be located; nothing is written (default: false)."}
            }}
        }},
        {"required", {"input"}}
    };
}

Patch ApplyPatchTool::parseAndResolve(const nlohmann::json& args) const {
    if (!args.contains("input") || !args["input"].is_string()) {
        throw PatchError(PatchError::Kind::InvalidInput, "input is required");
    }
    const std::string input = args["input"].get<std::string>();
    if (input.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw PatchError(PatchError::Kind::InvalidInput, "input is required");
    }

    Patch patch = parsePatch(input);
    resolvePatchPaths(patch, rootPath);
    return patch;
}

std::string ApplyPatchTool::validateInput(const nlohmann::json& args) const {
    try {
        Patch patch = parseAndResolve(args);
        PatchApplier(state, diffContextLines).validate(patch);
    } catch (const PatchError& e) {
        return e.what();
    }
    return "";
}

nlohmann::json ApplyPatchTool::execute(const nlohmann::json& args) {
    nlohmann::json result;

    Patch patch;
    try {
        patch = parseAndResolve(args);
    } catch (const PatchError& e) {
        Logger::getInstance().error(std::string("apply_patch: ") + e.what());
        result["success"] = false;
        result["error"] = UTF8Utils::sanitize(e.what());
        return result;
    }

    PatchApplier applier(state, diffContextLines);

    if (args.value("dry_run", false)) {
        std::vector<std::string> affected;
        for (const auto& hunk : patch.hunks) {
            affected.push_back(UTF8Utils::sanitize(hunk.path));
            if (!hunk.movePath.empty()) affected.push_back(UTF8Utils::sanitize(hunk.movePath));
        }
        result["dry_run"] = true;
        result["affected_files"] = affected;
        try {
            applier.dryRun(patch);
        } catch (const PatchError& e) {
            result["success"] = false;
            result["error"] = UTF8Utils::sanitize(e.what());
            return result;
        }
        result["success"] = true;
        result["content"] = nlohmann::json::array({
            nlohmann::json::object({{"type", "text"}, {"text", "Dry-run OK: " + std::to_string(patch.hunks.size()) + " hunk(s) would apply cleanly."}})
        });
        return result;
    }

    try {
        applier.validate(patch);
    } catch (const PatchError& e) {
        Logger::getInstance().error(std::string("apply_patch: ") + e.what());
        result["success"] = false;
        result["error"] = UTF8Utils::sanitize(e.what());
        return result;
    }

    ApplyPatchResult applied = applier.apply(patch);
    result = applied.toJson();
    if (!applied.isError()) {
        std::string text = applied.summary();
        if (!text.empty() && text.back() == '\n') text.pop_back();
        result["content"] = nlohmann::json::array({
            nlohmann::json::object({{"type", "text"}, {"text", UTF8Utils::sanitize(text)}})
        });
    }
    return result;
}
