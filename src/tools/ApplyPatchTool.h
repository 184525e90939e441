#pragma once
#include "ITool.h"
#include "patch/PatchTypes.h"
#include "state/FileState.h"
#include <filesystem>

namespace fs = std::filesystem;

/**
 * @brief 应用补丁工具
 *
 * 输入为 "*** Begin Patch" ... "*** End Patch" 格式的补丁文本:
 * - Add File: 新建文件
 * - Delete File: 删除文件
 * - Update File (+ 可选 Move to): 按上下文模糊定位后替换
 *
 * 相对路径以 rootPath 为基准。多个工具调用可并发执行, 同一文件的修改由
 * IFileState 的路径锁串行化。
 */
class ApplyPatchTool : public ITool {
public:
    ApplyPatchTool(const std::string& rootPath, IFileState& state, int diffContextLines = 3);

    std::string getName() const override { return "apply_patch"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string validateInput(const nlohmann::json& args) const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    fs::path rootPath;
    IFileState& state;
    int diffContextLines;

    // 读取 input 参数, 解析并把路径解析为绝对路径
    Patch parseAndResolve(const nlohmann::json& args) const;
};
