#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 可由宿主按名字调用的工具
 *
 * 一次调用分两步: validateInput 只检查参数和前置条件, 不写任何东西;
 * 通过后宿主才调用 execute。
 */
class ITool {
public:
    virtual ~ITool() = default;

    /// 调用时使用的名字, 在一个 ToolRegistry 中唯一
    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    /// 参数的 JSON Schema ("type": "object")
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief 检查参数和前置条件
     * @return 空串表示可以执行; 否则为返回给调用方的错误信息
     */
    virtual std::string validateInput(const nlohmann::json& args) const {
        (void)args;
        return "";
    }

    /**
     * @brief 执行
     * @return 结果对象: 成功时带 "content" 数组 ({"type": "text", "text": ...}),
     *         失败时 "success" 为 false 并带 "error"
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
