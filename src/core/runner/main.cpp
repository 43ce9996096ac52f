/**
 * @file main.cpp (runbox_engine)
 * @brief 沙箱执行引擎 (CLI)
 *
 * 约束:
 * 1. stdout 只输出单行 JSON (末尾 \n)
 * 2. debug/log 仅输出到 stderr
 */
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "runner.h"
#include "sandbox.h"
#include "sandbox_internal.h"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const char* const kDefaultConfigPath = "config/runbox.yaml";

struct CliOptions {
    std::string config_path;
    std::string language;
    std::string source_path;     // 为空时从 stdin 读取
    std::string archive_path;
    std::string entry_point;
    std::string batch_path;
    std::string submission_id;
    bool self_test = false;
};

json ResultToJSON(const runbox::RunResult& r) {
    json out;
    out["submission_id"] = r.submission_id;
    out["status"] = runbox::ClassificationName(r);
    out["termination"] = runbox::TerminationName(r.termination);
    out["output"] = r.output;
    out["error"] = r.error;
    out["exit_code"] = r.exit_code;
    out["output_truncated"] = r.output_truncated;
    out["time_used_ms"] = r.time_used_ms;
    return out;
}

json ErrorToJSON(const std::string& kind, const std::string& category, const std::string& message) {
    json out;
    out["schema_version"] = 1;
    out["error_kind"] = kind;
    out["error_category"] = category;
    out["error"] = message;
    return out;
}

json ErrorToJSON(runbox::ErrorKind kind, const std::string& message) {
    return ErrorToJSON(runbox::ErrorKindName(kind),
                       runbox::ErrorCategoryName(runbox::CategoryOf(kind)),
                       message);
}

void EmitJSONLine(const json& out) {
    // 用户输出可能含有非法 UTF-8, 替换而不是抛异常
    std::cout << out.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
}

bool ReadWholeFile(const std::string& path, std::string& content) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    content = buffer.str();
    return true;
}

// 批量文件: [{"code": "...", "language": "python"}, ...]
bool ParseBatchFile(const std::string& path, std::vector<runbox::RunRequest>& requests, std::string& err) {
    std::string text;
    if (!ReadWholeFile(path, text)) {
        err = "failed to open batch file: " + path;
        return false;
    }
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        err = "batch file is not valid JSON";
        return false;
    }
    if (doc.is_object() && doc.contains("tasks")) {
        doc = doc["tasks"];
    }
    if (!doc.is_array()) {
        err = "batch file must contain a JSON array of tasks";
        return false;
    }
    for (std::size_t i = 0; i < doc.size(); ++i) {
        const json& t = doc[i];
        if (!t.is_object() || !t.contains("code") || !t["code"].is_string()) {
            err = "Task " + std::to_string(i) + ": field 'code' must be a string";
            return false;
        }
        runbox::RunRequest req;
        req.code = t["code"].get<std::string>();
        if (t.contains("language") && t["language"].is_string()) {
            req.language = t["language"].get<std::string>();
        } else if (t.contains("lang") && t["lang"].is_string()) {
            req.language = t["lang"].get<std::string>();
        }
        if (t.contains("submission_id") && t["submission_id"].is_string()) {
            req.submission_id = t["submission_id"].get<std::string>();
        }
        requests.push_back(std::move(req));
    }
    return true;
}

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -C <path>         Config file path (default: " << kDefaultConfigPath << " if present)\n"
              << "  -l <language>     python | node (default: python)\n"
              << "  -f <path>         Source file to run (default: read stdin)\n"
              << "  -z <path>         Zip archive to run (requires -e)\n"
              << "  -e <entry>        Entry point inside the archive\n"
              << "  -b <path>         Batch file: JSON array of {code, language}\n"
              << "  -i <id>           Submission ID (default: generated)\n"
              << "  --self_test       Print one-line protocol JSON and exit\n";
}

}  // namespace

int main(int argc, char** argv) {
    // 写入已退出子进程的管道时返回 EPIPE, 而不是终止引擎
    std::signal(SIGPIPE, SIG_IGN);

    CliOptions opts;
    int opt;
    static struct option long_opts[] = {
        {"self_test", no_argument, nullptr, 1},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    while ((opt = getopt_long(argc, argv, "C:l:f:z:e:b:i:h", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'C': opts.config_path = optarg; break;
            case 'l': opts.language = optarg; break;
            case 'f': opts.source_path = optarg; break;
            case 'z': opts.archive_path = optarg; break;
            case 'e': opts.entry_point = optarg; break;
            case 'b': opts.batch_path = optarg; break;
            case 'i': opts.submission_id = optarg; break;
            case 1: opts.self_test = true; break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 1;
        }
    }

    if (opts.self_test) {
        runbox::RunResult sample;
        sample.submission_id = opts.submission_id.empty() ? "self-test" : opts.submission_id;
        sample.termination = runbox::Termination::COMPLETED;
        sample.exit_code = 0;
        sample.output = "ok\n";
        sample.time_used_ms = 1;
        json out = ResultToJSON(sample);
        out["schema_version"] = 1;
        EmitJSONLine(out);
        return 0;
    }

    std::string config_path = opts.config_path;
    if (config_path.empty() && fs::exists(kDefaultConfigPath)) {
        config_path = kDefaultConfigPath;
    }
    if (!config_path.empty() && !runbox::LoadConfig(config_path)) {
        EmitJSONLine(ErrorToJSON("ConfigError", "SystemError", "failed to load config: " + config_path));
        return 1;
    }

    try {
        runbox::Runner runner;

        // 批量模式
        if (!opts.batch_path.empty()) {
            std::vector<runbox::RunRequest> requests;
            std::string err;
            if (!ParseBatchFile(opts.batch_path, requests, err)) {
                EmitJSONLine(ErrorToJSON("InvalidRequest", "ValidationError", err));
                return 2;
            }
            runbox::BatchOutcome outcome = runner.RunBatch(requests);
            if (!outcome.ok) {
                EmitJSONLine(ErrorToJSON(outcome.error, outcome.error_message));
                return 2;
            }
            json out;
            out["schema_version"] = 1;
            out["results"] = json::array();
            for (const auto& r : outcome.results) {
                out["results"].push_back(ResultToJSON(r));
            }
            EmitJSONLine(out);
            return 0;
        }

        runbox::RunOutcome outcome;
        if (!opts.archive_path.empty()) {
            // archive 模式
            runbox::ArchiveRunRequest req;
            req.submission_id = opts.submission_id;
            req.language = opts.language;
            req.entry_point = opts.entry_point;
            if (!ReadWholeFile(opts.archive_path, req.archive_bytes)) {
                EmitJSONLine(ErrorToJSON("InvalidRequest", "ValidationError",
                                         "failed to open archive: " + opts.archive_path));
                return 2;
            }
            outcome = runner.RunArchive(req);
        } else {
            // 单文件模式
            runbox::RunRequest req;
            req.submission_id = opts.submission_id;
            req.language = opts.language;
            if (opts.source_path.empty()) {
                req.code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
            } else if (!ReadWholeFile(opts.source_path, req.code)) {
                EmitJSONLine(ErrorToJSON("InvalidRequest", "ValidationError",
                                         "failed to open source file: " + opts.source_path));
                return 2;
            }
            outcome = runner.Run(req);
        }

        if (!outcome.ok) {
            EmitJSONLine(ErrorToJSON(outcome.error, outcome.error_message));
            return 2;
        }
        json out = ResultToJSON(outcome.result);
        out["schema_version"] = 1;
        EmitJSONLine(out);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[沙箱] 引擎初始化失败: " << e.what() << std::endl;
        EmitJSONLine(ErrorToJSON("SystemError", "SystemError", e.what()));
        return 1;
    }
}
