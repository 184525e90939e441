#pragma once
#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct Workspace {
        std::string root = ".";  // 补丁中相对路径的基准目录
    } workspace;

    struct PatchOptions {
        int diffContextLines = 3;  // 结果中 unified diff 的上下文行数
    } patch;

    struct Log {
        std::string file = "loom.log";  // 空串表示不写日志文件
        bool console = false;
        bool debug = false;             // 记录模糊匹配命中等调试信息
    } log;

    /**
     * @brief 从 JSON 文件加载配置, 缺省的键使用默认值
     * @throws std::runtime_error 文件无法打开或 JSON 无效
     */
    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.u8string() + ": " + e.what());
        }
        return fromJson(j, pathStr);
    }

    static Config fromJson(const nlohmann::json& j, const std::string& source = "<inline>") {
        if (!j.is_object()) {
            throw std::runtime_error("Config in " + source + " must be a JSON object");
        }

        Config cfg;
        try {
            if (j.contains("workspace")) {
                cfg.workspace.root = j.at("workspace").value("root", cfg.workspace.root);
            }
            if (j.contains("patch")) {
                cfg.patch.diffContextLines = j.at("patch").value("diff_context_lines", cfg.patch.diffContextLines);
            }
            if (j.contains("log")) {
                const auto& log = j.at("log");
                cfg.log.file = log.value("file", cfg.log.file);
                cfg.log.console = log.value("console", cfg.log.console);
                cfg.log.debug = log.value("debug", cfg.log.debug);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config in " + source + ": " + e.what());
        }

        if (cfg.patch.diffContextLines < 0) {
            throw std::runtime_error("Invalid config in " + source + ": patch.diff_context_lines must be >= 0");
        }
        return cfg;
    }
};
