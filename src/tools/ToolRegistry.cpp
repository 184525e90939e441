#include "ToolRegistry.h"
#include "utils/Logger.h"
#include "utils/UTF8Utils.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    const std::string name = tool->getName();
    auto [it, inserted] = tools.emplace(name, nullptr);
    if (!inserted) {
        Logger::getInstance().warn("Replacing tool: " + name);
    }
    it->second = std::move(tool);
}

ITool* ToolRegistry::findTool(const std::string& name) const {
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : it->second.get();
}

std::vector<std::string> ToolRegistry::toolNames() const {
    std::vector<std::string> names;
    names.reserve(tools.size());
    for (const auto& entry : tools) {
        names.push_back(entry.first);
    }
    return names;
}

nlohmann::json ToolRegistry::listToolSchemas() const {
    nlohmann::json schemas = nlohmann::json::array();
    for (const auto& [name, tool] : tools) {
        nlohmann::json function;
        function["name"] = name;
        function["description"] = tool->getDescription();
        function["parameters"] = tool->getSchema();

        nlohmann::json schema;
        schema["type"] = "function";
        schema["function"] = std::move(function);
        schemas.push_back(std::move(schema));
    }
    return schemas;
}

nlohmann::json ToolRegistry::failure(const std::string& name, const std::string& error) {
    nlohmann::json result;
    result["tool_name"] = UTF8Utils::sanitize(name);
    result["success"] = false;
    result["error"] = UTF8Utils::sanitize(error);
    return result;
}

nlohmann::json ToolRegistry::runTool(const std::string& name, const nlohmann::json& args) const {
    ITool* tool = findTool(name);
    if (!tool) {
        Logger::getInstance().error("Unknown tool: " + name);
        return failure(name, "failed to find tool: " + name);
    }

    try {
        const std::string rejected = tool->validateInput(args);
        if (!rejected.empty()) {
            Logger::getInstance().warn(name + " input rejected: " + rejected);
            return failure(name, rejected);
        }

        nlohmann::json result = tool->execute(args);
        if (!result.contains("tool_name")) {
            result["tool_name"] = name;
        }
        return result;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool " + name + " threw: " + e.what());
        return failure(name, std::string("Tool execution failed: ") + e.what());
    }
}
