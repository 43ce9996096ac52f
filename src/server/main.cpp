#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "runbox.grpc.pb.h"
#include "runner.h"
#include "history.h"
// 引入 Internal 头文件读取配置
#include "sandbox_internal.h"

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

namespace {

void FillResponse(const runbox::RunResult& r, runbox::rpc::RunResponse* out) {
    out->set_submission_id(r.submission_id);
    out->set_status(runbox::ClassificationName(r));
    out->set_output(r.output);
    out->set_error(r.error);
    out->set_exit_code(r.exit_code);
    out->set_output_truncated(r.output_truncated);
    out->set_time_used_ms(r.time_used_ms);
}

// 校验 / 准备阶段的拒绝: INVALID_ARGUMENT, 消息带上错误类型
Status Rejected(runbox::ErrorKind kind, const std::string& message) {
    std::string text = std::string(runbox::ErrorKindName(kind)) + ": " + message;
    return Status(grpc::INVALID_ARGUMENT, text);
}

runbox::RunRequest ToRunRequest(const runbox::rpc::RunRequest& req) {
    runbox::RunRequest out;
    out.submission_id = req.submission_id();
    out.language = req.language();
    out.code = req.code();
    return out;
}

}  // namespace

class SandboxServiceImpl final : public runbox::rpc::SandboxService::Service {
public:
    SandboxServiceImpl(runbox::Runner& runner, runbox::HistoryStore& history)
        : runner_(runner), history_(history) {}

    Status Run(ServerContext* context, const runbox::rpc::RunRequest* request,
               runbox::rpc::RunResponse* response) override {
        std::cerr << "[Server] Run (" << request->language() << ", "
                  << request->code().size() << " bytes)" << std::endl;
        runbox::RunOutcome outcome = runner_.Run(ToRunRequest(*request));
        if (!outcome.ok) {
            return Rejected(outcome.error, outcome.error_message);
        }
        FillResponse(outcome.result, response);
        return Status::OK;
    }

    Status RunBatch(ServerContext* context, const runbox::rpc::BatchRequest* request,
                    runbox::rpc::BatchResponse* response) override {
        std::cerr << "[Server] RunBatch (" << request->tasks_size() << " tasks)" << std::endl;
        std::vector<runbox::RunRequest> requests;
        requests.reserve(request->tasks_size());
        for (const auto& t : request->tasks()) {
            requests.push_back(ToRunRequest(t));
        }
        runbox::BatchOutcome outcome = runner_.RunBatch(requests);
        if (!outcome.ok) {
            return Rejected(outcome.error, outcome.error_message);
        }
        for (const auto& r : outcome.results) {
            FillResponse(r, response->add_results());
        }
        return Status::OK;
    }

    Status RunArchive(ServerContext* context, const runbox::rpc::ArchiveRequest* request,
                      runbox::rpc::RunResponse* response) override {
        std::cerr << "[Server] RunArchive (entry=" << request->entry_point() << ", "
                  << request->archive().size() << " bytes)" << std::endl;
        runbox::ArchiveRunRequest req;
        req.submission_id = request->submission_id();
        req.language = request->language();
        req.archive_bytes = request->archive();
        req.entry_point = request->entry_point();
        runbox::RunOutcome outcome = runner_.RunArchive(req);
        if (!outcome.ok) {
            return Rejected(outcome.error, outcome.error_message);
        }
        FillResponse(outcome.result, response);
        return Status::OK;
    }

    Status History(ServerContext* context, const runbox::rpc::HistoryRequest* request,
                   runbox::rpc::HistoryResponse* response) override {
        for (const auto& e : history_.Recent(request->limit())) {
            auto* entry = response->add_entries();
            entry->set_timestamp_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                e.timestamp.time_since_epoch()).count());
            entry->set_language(runbox::LanguageName(e.language));
            entry->set_code(e.code);
            FillResponse(e.result, entry->mutable_result());
        }
        return Status::OK;
    }

private:
    runbox::Runner& runner_;
    runbox::HistoryStore& history_;
};

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);

    // 1. 加载配置 (必须在所有逻辑之前)
    std::string config_path = argc > 1 ? argv[1] : "config/runbox.yaml";
    if (std::filesystem::exists(config_path)) {
        if (!runbox::LoadConfig(config_path)) {
            std::cerr << "[Server] 配置加载失败: " << config_path << std::endl;
            return 1;
        }
    } else {
        std::cerr << "[Server] 未找到 " << config_path << ", 使用默认配置" << std::endl;
    }
    const runbox::GlobalConfig& cfg = runbox::g_runner_config;

    // 2. 执行引擎 + 历史记录
    runbox::HistoryStore history(static_cast<std::size_t>(cfg.history_size),
                                 static_cast<std::size_t>(cfg.history_code_chars));
    std::unique_ptr<runbox::Runner> runner;
    try {
        runner = std::make_unique<runbox::Runner>(&history);
    } catch (const std::exception& e) {
        std::cerr << "[Server] 引擎初始化失败: " << e.what() << std::endl;
        return 1;
    }
    std::cerr << "[Server] 并发槽位: " << cfg.pool_size << std::endl;

    // 3. 启动 gRPC Server
    int port = cfg.server_port;
    if (port <= 0) port = 50051;
    std::string server_address("0.0.0.0:" + std::to_string(port));

    SandboxServiceImpl service(*runner, history);

    ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    // archive 上传上限 + 协议开销
    builder.SetMaxReceiveMessageSize(static_cast<int>(cfg.max_archive_bytes) + 1024 * 1024);
    builder.RegisterService(&service);

    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        std::cerr << "[Server] 无法监听: " << server_address << std::endl;
        return 1;
    }
    std::cerr << "[Server] 启动监听: " << server_address << std::endl;

    server->Wait();
    return 0;
}
