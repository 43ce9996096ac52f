#include "cgroup_manager.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include <sys/vfs.h>
#include <unistd.h>

#ifndef CGROUP2_SUPER_MAGIC
#define CGROUP2_SUPER_MAGIC 0x63677270
#endif

namespace fs = std::filesystem;

namespace runbox {

namespace {

    const char* const kControllers = "+memory +pids";

    // cgroupfs 的写入错误在 flush/close 时才会出现
    bool WriteControl(const fs::path& file, const std::string& value)
    {
        std::ofstream out(file);
        if (!out) {
            std::cerr << "[CgroupManager] cannot open " << file.string() << ": "
                      << std::strerror(errno) << std::endl;
            return false;
        }
        out << value;
        out.close();
        if (out.fail()) {
            std::cerr << "[CgroupManager] write '" << value << "' to " << file.string()
                      << " rejected" << std::endl;
            return false;
        }
        return true;
    }

} // anonymous namespace

CgroupManager::CgroupManager(std::string root, std::string name)
    : root_(std::move(root))
    , name_(std::move(name))
    , path_((fs::path(root_) / name_).string())
{
}

CgroupManager::~CgroupManager()
{
    Remove();
}

bool CgroupManager::Available()
{
    struct statfs fsinfo;
    if (statfs("/sys/fs/cgroup", &fsinfo) != 0) return false;
    return fsinfo.f_type == CGROUP2_SUPER_MAGIC;
}

bool CgroupManager::Setup(int64_t memory_limit_bytes, int pids_limit)
{
    if (live_) return true;

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        std::cerr << "[CgroupManager] cannot create " << root_ << ": " << ec.message() << std::endl;
        return false;
    }

    // 上一级可能归 root 所有, 已经由运维开启控制器时失败无妨
    fs::path parent_control = fs::path(root_).parent_path() / "cgroup.subtree_control";
    if (!WriteControl(parent_control, kControllers)) {
        std::cerr << "[CgroupManager] Warning: controllers not enabled above " << root_ << std::endl;
    }
    if (!WriteControl(fs::path(root_) / "cgroup.subtree_control", kControllers)) {
        return false;
    }

    if (!fs::create_directory(path_, ec) && ec) {
        std::cerr << "[CgroupManager] cannot create " << path_ << ": " << ec.message() << std::endl;
        return false;
    }
    live_ = true;

    fs::path leaf(path_);
    bool limited = WriteControl(leaf / "memory.max", std::to_string(memory_limit_bytes)) &&
                   WriteControl(leaf / "pids.max", std::to_string(pids_limit));
    // 内核未开启 swap 记账时没有 memory.swap.max
    if (limited && fs::exists(leaf / "memory.swap.max", ec)) {
        limited = WriteControl(leaf / "memory.swap.max", "0");
    }
    if (!limited) {
        Remove();
        return false;
    }
    return true;
}

bool CgroupManager::Attach(pid_t pid)
{
    if (!live_) return false;
    return WriteControl(fs::path(path_) / "cgroup.procs", std::to_string(pid));
}

uint64_t CgroupManager::OomKillCount() const
{
    if (!live_) return 0;

    std::ifstream events(fs::path(path_) / "memory.events");
    std::string key;
    uint64_t count = 0;
    while (events >> key >> count) {
        if (key == "oom_kill") return count;
    }
    return 0;
}

std::vector<pid_t> CgroupManager::Members() const
{
    std::vector<pid_t> pids;
    std::ifstream procs(fs::path(path_) / "cgroup.procs");
    pid_t pid;
    while (procs >> pid) {
        if (pid > 0) pids.push_back(pid);
    }
    return pids;
}

int CgroupManager::KillAll()
{
    if (!live_) return 0;

    int killed = 0;
    for (pid_t pid : Members()) {
        if (kill(pid, SIGKILL) == 0) ++killed;
    }
    return killed;
}

void CgroupManager::Remove()
{
    if (!live_) return;

    // rmdir 只对没有成员的 cgroup 成功, 被杀进程退出需要一点时间
    std::error_code ec;
    for (int attempt = 0; attempt < 5; ++attempt) {
        int killed = KillAll();
        if (killed > 0 && attempt == 0) {
            std::cerr << "[CgroupManager] killed " << killed << " leftover processes in " << name_ << std::endl;
        }
        usleep(20000 * (attempt + 1));
        // 目录已不存在时 remove 返回 false 且不设置 ec
        if (fs::remove(path_, ec) || !ec) {
            live_ = false;
            return;
        }
    }

    std::cerr << "[CgroupManager] Warning: " << path_ << " not removed"
              << (ec ? ": " + ec.message() : std::string()) << std::endl;
    live_ = false;
}

} // namespace runbox
