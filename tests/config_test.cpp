#include <cstring>
#include <filesystem>
#include <string>

#include "sandbox_internal.h"
#include "task.h"
#include "test_util.h"

using namespace runbox;
namespace fs = std::filesystem;

namespace {

fs::path g_dir;

const LanguageProfile& Profile(Language language) {
    return g_runner_config.languages[static_cast<int>(language)];
}

fs::path WriteConfig(const std::string& name, const std::string& yaml) {
    fs::path path = g_dir / name;
    runbox_test::WriteFile(path, yaml);
    return path;
}

void TestShippedConfig() {
    CHECK(LoadConfig(RUNBOX_DEFAULT_CONFIG_FILE));
    const GlobalConfig& c = g_runner_config;

    CHECK_EQ(c.pool_size, 5);
    CHECK_EQ(c.max_batch_size, 20);
    CHECK_EQ(c.max_code_chars, 5000);
    CHECK_EQ(c.timeout_ms, 10000);
    CHECK_EQ(c.memory_limit_mb, 128);
    CHECK_EQ(c.max_output_bytes, 1048576);
    CHECK_EQ(c.max_archive_bytes, 10485760);
    CHECK_EQ(c.history_size, 100);
    CHECK_EQ(c.history_code_chars, 2000);
    CHECK_EQ(c.create_timeout_ms, 30000);

    CHECK(c.backend == RuntimeBackend::DOCKER);
    CHECK_EQ(std::string(c.docker_bin), std::string("docker"));
    CHECK_EQ(std::string(c.unzip_bin), std::string("unzip"));
    CHECK_EQ(std::string(c.workspace_root), std::string("/tmp/runbox"));
    CHECK_EQ(c.mount_count, 4);
    CHECK_EQ(std::string(c.mount_dirs[0]), std::string("/usr"));
    CHECK_EQ(c.mount_file_count, 2);

    CHECK_EQ(std::string(Profile(Language::PYTHON).image), std::string("python:3.11-slim"));
    CHECK_EQ(std::string(Profile(Language::PYTHON).source_file), std::string("user_code.py"));
    CHECK_EQ(std::string(Profile(Language::NODE).interpreter), std::string("node"));
    CHECK_EQ(std::string(Profile(Language::NODE).host_interpreter), std::string("/usr/bin/node"));

    CHECK_EQ(c.run_uid, uid_t(65534));
    CHECK_EQ(c.run_gid, gid_t(65534));
    CHECK_EQ(c.pids_limit, 64);
    CHECK_EQ(c.fallback_uid_base, uid_t(200000));
    CHECK_EQ(c.server_port, 50051);
}

// 未出现的字段保留默认值
void TestPartialOverride() {
    fs::path path = WriteConfig("partial.yaml",
        "runner:\n"
        "  pool_size: 2\n"
        "  timeout_ms: 2500\n"
        "runtime:\n"
        "  backend: namespace\n"
        "path:\n"
        "  mount_dirs: [/opt/python, /usr]\n"
        "languages:\n"
        "  python:\n"
        "    image: registry.local/python:3.12\n"
        "  ruby:\n"
        "    image: ruby:3\n"
        "security:\n"
        "  run_as_uid: 1500\n");
    CHECK(LoadConfig(path.string()));
    const GlobalConfig& c = g_runner_config;

    CHECK_EQ(c.pool_size, 2);
    CHECK_EQ(c.timeout_ms, 2500);
    CHECK(c.backend == RuntimeBackend::NAMESPACE);
    CHECK_EQ(c.mount_count, 2);
    CHECK_EQ(std::string(c.mount_dirs[0]), std::string("/opt/python"));
    CHECK_EQ(std::string(Profile(Language::PYTHON).image), std::string("registry.local/python:3.12"));
    CHECK_EQ(std::string(Profile(Language::PYTHON).interpreter), std::string("python"));
    CHECK_EQ(c.run_uid, uid_t(1500));

    CHECK_EQ(c.max_batch_size, 20);
    CHECK_EQ(c.memory_limit_mb, 128);
    CHECK_EQ(c.mount_file_count, 2);
    CHECK_EQ(std::string(Profile(Language::NODE).image), std::string("node:20-slim"));
}

// 每次加载都从内置默认值开始, 不继承上一次的配置
void TestReloadStartsFromDefaults() {
    CHECK(LoadConfig(WriteConfig("first.yaml", "runner:\n  pool_size: 9\n").string()));
    CHECK_EQ(g_runner_config.pool_size, 9);
    CHECK(LoadConfig(WriteConfig("second.yaml", "server:\n  port: 6000\n").string()));
    CHECK_EQ(g_runner_config.pool_size, 5);
    CHECK_EQ(g_runner_config.server_port, 6000);
}

void TestRejectedConfigs() {
    CHECK(!LoadConfig((g_dir / "does-not-exist.yaml").string()));
    CHECK(!LoadConfig(WriteConfig("malformed.yaml", "runner:\n  pool_size: [1, 2\n").string()));
    CHECK(!LoadConfig(WriteConfig("bad-type.yaml", "runner:\n  timeout_ms: soon\n").string()));
    CHECK(!LoadConfig(WriteConfig("bad-backend.yaml", "runtime:\n  backend: bogus\n").string()));
    CHECK(!LoadConfig(WriteConfig("zero-timeout.yaml", "runner:\n  timeout_ms: 0\n").string()));
    CHECK(!LoadConfig(WriteConfig("negative-pool.yaml", "runner:\n  pool_size: -3\n").string()));
    CHECK(!LoadConfig(WriteConfig("mounts-not-list.yaml", "path:\n  mount_dirs: /usr\n").string()));
}

void TestResetDefaults() {
    g_runner_config.pool_size = 99;
    CopyString(g_runner_config.docker_bin, sizeof(g_runner_config.docker_bin), "/opt/docker");
    ResetConfigDefaults();
    CHECK_EQ(g_runner_config.pool_size, 5);
    CHECK_EQ(std::string(g_runner_config.docker_bin), std::string("docker"));
}

void TestCopyStringTruncates() {
    char buf[4];
    CopyString(buf, sizeof(buf), "abcdef");
    CHECK_EQ(std::string(buf), std::string("abc"));
    CopyString(buf, sizeof(buf), "");
    CHECK_EQ(std::strlen(buf), std::size_t(0));
}

}  // namespace

int main() {
    std::cout << "=== Config Test ===" << std::endl;
    g_dir = runbox_test::MakeTempDir("config");

    runbox_test::RunCase("shipped_config", TestShippedConfig);
    runbox_test::RunCase("partial_override", TestPartialOverride);
    runbox_test::RunCase("reload_starts_from_defaults", TestReloadStartsFromDefaults);
    runbox_test::RunCase("rejected_configs", TestRejectedConfigs);
    runbox_test::RunCase("reset_defaults", TestResetDefaults);
    runbox_test::RunCase("copy_string_truncates", TestCopyStringTruncates);

    std::error_code ec;
    fs::remove_all(g_dir, ec);
    return runbox_test::Summary("Config Test");
}
