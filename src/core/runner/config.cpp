#include <sys/types.h>
#include <unistd.h>
#include <iostream>
#include <cstring>
#include <string>
#include <yaml-cpp/yaml.h>

#include "sandbox_internal.h"

namespace runbox {
    // 定义全局变量实例
    GlobalConfig g_runner_config;

    namespace {

        // 进程启动时即带有默认值, 不依赖配置文件
        struct DefaultsInitializer {
            DefaultsInitializer() { ResetConfigDefaults(); }
        } g_defaults_initializer;

        void SetLanguage(LanguageProfile& lang,
                         const char* name,
                         const char* image,
                         const char* interpreter,
                         const char* source_file,
                         const char* host_interpreter)
        {
            CopyString(lang.name, sizeof(lang.name), name);
            CopyString(lang.image, sizeof(lang.image), image);
            CopyString(lang.interpreter, sizeof(lang.interpreter), interpreter);
            CopyString(lang.source_file, sizeof(lang.source_file), source_file);
            CopyString(lang.host_interpreter, sizeof(lang.host_interpreter), host_interpreter);
        }

        // 读取字符串列表到定长二维数组, 返回条目数
        int LoadPathList(const YAML::Node& node, char (*dst)[256], int max_count, const char* key)
        {
            if (!node.IsSequence()) {
                throw YAML::Exception(node.Mark(), std::string("'") + key + "' 必须是一个列表");
            }
            int count = 0;
            for (std::size_t i = 0; i < node.size(); ++i) {
                if (count >= max_count) {
                    std::cerr << "[配置] 警告: '" << key << "' 超过 " << max_count << " 项, 多余部分被忽略" << std::endl;
                    break;
                }
                CopyString(dst[count], 256, node[i].as<std::string>());
                count++;
            }
            return count;
        }

        template <typename T>
        void ReadIfPresent(const YAML::Node& node, const char* key, T& dst)
        {
            if (node[key]) dst = node[key].as<T>();
        }

        void ReadStringIfPresent(const YAML::Node& node, const char* key, char* dst, std::size_t size)
        {
            if (node[key]) CopyString(dst, size, node[key].as<std::string>());
        }

        bool CheckPositive(const char* key, long long value)
        {
            if (value > 0) return true;
            std::cerr << "[配置] 错误: '" << key << "' 必须为正数, 实际为 " << value << std::endl;
            return false;
        }

    } // anonymous namespace

    void CopyString(char* dst, std::size_t dst_size, const std::string& src)
    {
        if (dst_size == 0) return;
        std::strncpy(dst, src.c_str(), dst_size - 1);
        dst[dst_size - 1] = '\0';
    }

    void ResetConfigDefaults()
    {
        GlobalConfig& c = g_runner_config;
        std::memset(&c, 0, sizeof(c));

        CopyString(c.workspace_root, sizeof(c.workspace_root), "/tmp/runbox");
        CopyString(c.docker_bin, sizeof(c.docker_bin), "docker");
        CopyString(c.unzip_bin, sizeof(c.unzip_bin), "unzip");
        c.backend = RuntimeBackend::DOCKER;

        const char* dirs[] = {"/usr", "/lib", "/lib64", "/bin"};
        for (const char* d : dirs) {
            CopyString(c.mount_dirs[c.mount_count++], sizeof(c.mount_dirs[0]), d);
        }
        const char* files[] = {"/dev/null", "/dev/urandom"};
        for (const char* f : files) {
            CopyString(c.mount_files[c.mount_file_count++], sizeof(c.mount_files[0]), f);
        }

        SetLanguage(c.languages[0], "python", "python:3.11-slim", "python", "user_code.py", "/usr/bin/python3");
        SetLanguage(c.languages[1], "node", "node:20-slim", "node", "user_code.js", "/usr/bin/node");

        c.max_code_chars = 5000;
        c.timeout_ms = 10000;
        c.memory_limit_mb = 128;
        c.max_output_bytes = 1024 * 1024;
        c.max_archive_bytes = 10 * 1024 * 1024;

        c.pool_size = 5;
        c.max_batch_size = 20;
        c.create_timeout_ms = 30000;

        c.history_size = 100;
        c.history_code_chars = 2000;

        c.run_uid = 65534;  // nobody
        c.run_gid = 65534;
        c.pids_limit = 64;
        c.fallback_uid_base = 200000;

        c.server_port = 50051;
    }

    bool LoadConfig(const std::string& path) {
    try {
        std::cerr << "[配置] 正在读取: " << path << " ..." << std::endl;
        YAML::Node config = YAML::LoadFile(path);

        ResetConfigDefaults();
        GlobalConfig& c = g_runner_config;

        // Runner 配置 (限制与并发)
        if (YAML::Node runner = config["runner"]) {
            ReadIfPresent(runner, "pool_size", c.pool_size);
            ReadIfPresent(runner, "max_batch_size", c.max_batch_size);
            ReadIfPresent(runner, "max_code_chars", c.max_code_chars);
            ReadIfPresent(runner, "timeout_ms", c.timeout_ms);
            ReadIfPresent(runner, "memory_limit_mb", c.memory_limit_mb);
            ReadIfPresent(runner, "max_output_bytes", c.max_output_bytes);
            ReadIfPresent(runner, "max_archive_bytes", c.max_archive_bytes);
            ReadIfPresent(runner, "history_size", c.history_size);
            ReadIfPresent(runner, "history_code_chars", c.history_code_chars);
            ReadIfPresent(runner, "create_timeout_ms", c.create_timeout_ms);
        }

        // Runtime 配置 (隔离后端)
        if (YAML::Node runtime = config["runtime"]) {
            if (runtime["backend"]) {
                std::string backend = runtime["backend"].as<std::string>();
                if (backend == "docker") {
                    c.backend = RuntimeBackend::DOCKER;
                } else if (backend == "namespace") {
                    c.backend = RuntimeBackend::NAMESPACE;
                } else {
                    std::cerr << "[配置] 错误: 未知的 runtime.backend '" << backend
                              << "' (可选 docker / namespace)" << std::endl;
                    return false;
                }
            }
            ReadStringIfPresent(runtime, "docker_bin", c.docker_bin, sizeof(c.docker_bin));
            ReadStringIfPresent(runtime, "unzip_bin", c.unzip_bin, sizeof(c.unzip_bin));
        }

        // Path 配置
        if (YAML::Node pathNode = config["path"]) {
            ReadStringIfPresent(pathNode, "workspace_root", c.workspace_root, sizeof(c.workspace_root));
            if (pathNode["mount_dirs"]) {
                c.mount_count = LoadPathList(pathNode["mount_dirs"], c.mount_dirs, 16, "path.mount_dirs");
            }
            if (pathNode["mount_files"]) {
                c.mount_file_count = LoadPathList(pathNode["mount_files"], c.mount_files, 16, "path.mount_files");
            }
        }

        // 语言表 (只能覆盖已支持的语言)
        if (YAML::Node langs = config["languages"]) {
            for (int i = 0; i < LANGUAGE_COUNT; ++i) {
                LanguageProfile& lang = c.languages[i];
                YAML::Node node = langs[std::string(lang.name)];
                if (!node) continue;
                ReadStringIfPresent(node, "image", lang.image, sizeof(lang.image));
                ReadStringIfPresent(node, "interpreter", lang.interpreter, sizeof(lang.interpreter));
                ReadStringIfPresent(node, "source_file", lang.source_file, sizeof(lang.source_file));
                ReadStringIfPresent(node, "host_interpreter", lang.host_interpreter, sizeof(lang.host_interpreter));
            }
        }

        // Security 配置
        if (YAML::Node secNode = config["security"]) {
            if (secNode["run_as_uid"]) {
                c.run_uid = static_cast<uid_t>(secNode["run_as_uid"].as<unsigned long>());
            }
            if (secNode["run_as_gid"]) {
                c.run_gid = static_cast<gid_t>(secNode["run_as_gid"].as<unsigned long>());
            }
            ReadIfPresent(secNode, "pids_limit", c.pids_limit);
            if (secNode["fallback_uid_base"]) {
                c.fallback_uid_base = static_cast<uid_t>(secNode["fallback_uid_base"].as<unsigned long>());
            }
        }

        if (YAML::Node server = config["server"]) {
            ReadIfPresent(server, "port", c.server_port);
        }

        bool ok = CheckPositive("runner.pool_size", c.pool_size) &&
                  CheckPositive("runner.max_batch_size", c.max_batch_size) &&
                  CheckPositive("runner.max_code_chars", c.max_code_chars) &&
                  CheckPositive("runner.timeout_ms", c.timeout_ms) &&
                  CheckPositive("runner.memory_limit_mb", c.memory_limit_mb) &&
                  CheckPositive("runner.max_output_bytes", c.max_output_bytes) &&
                  CheckPositive("runner.max_archive_bytes", c.max_archive_bytes) &&
                  CheckPositive("runner.history_size", c.history_size) &&
                  CheckPositive("runner.create_timeout_ms", c.create_timeout_ms) &&
                  CheckPositive("security.pids_limit", c.pids_limit);
        if (!ok) return false;

        std::cerr << "[配置] 加载完成。WorkRoot: " << c.workspace_root
                  << ", Backend: " << (c.backend == RuntimeBackend::DOCKER ? "docker" : "namespace")
                  << ", PoolSize: " << c.pool_size << std::endl;
        return true;

    } catch (const YAML::Exception& ex) {
        std::cerr << "[配置] YAML 解析失败: " << ex.what() << std::endl;
        return false;
    } catch (const std::exception& ex) {
        std::cerr << "[配置] 加载异常: " << ex.what() << std::endl;
        return false;
    }
} // End LoadConfig
} // namespace runbox
