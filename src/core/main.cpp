#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <memory>
#include <vector>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <iomanip>

#include "core/ConfigManager.h"
#include "state/FileState.h"
#include "tools/ApplyPatchTool.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {
    // ANSI Color Codes
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";

    struct CliOptions {
        std::string patchFile = "-";
        std::string configPath;
        std::string root;
        bool dryRun = false;
        bool json = false;
        bool help = false;
    };

    void printUsage() {
        std::cout << "Usage: loom [options] [patch-file]\n"
                  << "\n"
                  << "Apply a '*** Begin Patch' ... '*** End Patch' patch to the working tree.\n"
                  << "The patch is read from stdin when no file (or '-') is given.\n"
                  << "\n"
                  << "Options:\n"
                  << "  --config <path>  Load configuration from <path>\n"
                  << "  --root <dir>     Resolve relative patch paths against <dir>\n"
                  << "  --dry-run        Check the patch without writing anything\n"
                  << "  --json           Print the full JSON result\n"
                  << "  -h, --help       Show this help\n";
    }

    bool parseArgs(int argc, char* argv[], CliOptions& opts, std::string& error) {
        bool havePatchFile = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                opts.help = true;
            } else if (arg == "--dry-run") {
                opts.dryRun = true;
            } else if (arg == "--json") {
                opts.json = true;
            } else if (arg == "--config" || arg == "--root") {
                if (i + 1 >= argc) {
                    error = "missing value for " + arg;
                    return false;
                }
                (arg == "--config" ? opts.configPath : opts.root) = argv[++i];
            } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
                error = "unknown option: " + arg;
                return false;
            } else if (!havePatchFile) {
                opts.patchFile = arg;
                havePatchFile = true;
            } else {
                error = "only one patch file may be given";
                return false;
            }
        }
        return true;
    }

    // 与 CLI 约定: --config 优先, 否则依次查 cwd、.loom/、可执行文件目录, 都没有则用默认配置
    std::string findConfig(const std::string& explicitPath) {
        if (!explicitPath.empty()) return explicitPath;

        if (fs::exists(fs::u8path("config.json"))) return "config.json";
        fs::path local = fs::u8path(".loom") / "config.json";
        if (fs::exists(local)) return local.u8string();

        std::error_code ec;
        fs::path exeDir = fs::canonical("/proc/self/exe", ec).parent_path();
        if (!ec && fs::exists(exeDir / "config.json")) {
            return (exeDir / "config.json").u8string();
        }
        return "";
    }

    bool readPatchText(const std::string& patchFile, std::string& text, std::string& error) {
        if (patchFile == "-") {
            std::ostringstream ss;
            ss << std::cin.rdbuf();
            text = ss.str();
            return true;
        }
        std::ifstream in(fs::u8path(patchFile), std::ios::binary);
        if (!in.is_open()) {
            error = "Could not open patch file: " + patchFile;
            return false;
        }
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return true;
    }

    std::string formatTime(std::chrono::system_clock::time_point when) {
        auto t = std::chrono::system_clock::to_time_t(when);
        struct tm timeInfo;
        localtime_r(&t, &timeInfo);
        std::ostringstream ss;
        ss << std::put_time(&timeInfo, "%Y-%m-%dT%H:%M:%S");
        return ss.str();
    }
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    std::string argError;
    if (!parseArgs(argc, argv, opts, argError)) {
        std::cerr << RED << "✖ " << argError << RESET << std::endl;
        printUsage();
        return 2;
    }
    if (opts.help) {
        printUsage();
        return 0;
    }

    Config cfg;
    const std::string configPath = findConfig(opts.configPath);
    if (!configPath.empty()) {
        try {
            cfg = Config::load(configPath);
        } catch (const std::exception& e) {
            std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
            return 2;
        }
    }
    if (!opts.root.empty()) {
        cfg.workspace.root = opts.root;
    }

    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.log.file);
    logger.setConsoleEnabled(cfg.log.console);
    logger.setDebugEnabled(cfg.log.debug);
    if (!configPath.empty()) {
        logger.info("Loaded configuration from: " + configPath);
    }

    std::string patchText;
    std::string readError;
    if (!readPatchText(opts.patchFile, patchText, readError)) {
        std::cerr << RED << "✖ " << readError << RESET << std::endl;
        return 2;
    }

    BasicFileState state;
    ToolRegistry registry;
    registry.registerTool(std::make_unique<ApplyPatchTool>(cfg.workspace.root, state, cfg.patch.diffContextLines));

    nlohmann::json args;
    args["input"] = patchText;
    if (opts.dryRun) {
        args["dry_run"] = true;
    }

    nlohmann::json result = registry.runTool("apply_patch", args);
    const bool ok = result.value("success", false) && !result.contains("error");

    if (opts.json) {
        nlohmann::json lastAccess = nlohmann::json::object();
        for (const auto& [path, when] : state.fileLastAccess()) {
            lastAccess[path] = formatTime(when);
        }
        result["file_last_access"] = lastAccess;
        std::cout << result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } else if (ok) {
        for (const auto& item : result.value("content", nlohmann::json::array())) {
            std::cout << item.value("text", "") << std::endl;
        }
    }

    if (!ok) {
        std::cerr << RED << BOLD << "✖ " << result.value("error", std::string("apply_patch failed")) << RESET << std::endl;
        return 1;
    }
    if (!opts.json && opts.dryRun) {
        std::cerr << GREEN << "✔ nothing was written (dry run)" << RESET << std::endl;
    }
    return 0;
}
