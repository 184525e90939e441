#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief 工具宿主: 持有工具并按名字分发调用
 *
 * runTool 的顺序固定为 查找 -> validateInput -> execute, 校验不通过时 execute 不会被调用。
 * 任何一步失败都返回同一种结果对象:
 *   {"tool_name": "<name>", "success": false, "error": "<message>"}
 *
 * 工具在启动阶段注册; 之后 runTool 可以被多个线程同时调用。
 */
class ToolRegistry {
public:
    /// 同名工具会被替换; nullptr 被忽略
    void registerTool(std::unique_ptr<ITool> tool);

    /// 找不到返回 nullptr
    ITool* findTool(const std::string& name) const;

    /// 按名字排序
    std::vector<std::string> toolNames() const;

    /**
     * @brief 所有工具的函数声明
     * @return JSON 数组, 元素形如 {"type": "function", "function": {"name", "description", "parameters"}}
     */
    nlohmann::json listToolSchemas() const;

    nlohmann::json runTool(const std::string& name, const nlohmann::json& args) const;

private:
    std::map<std::string, std::unique_ptr<ITool>> tools;

    static nlohmann::json failure(const std::string& name, const std::string& error);
};
