#ifndef RUNBOX_CGROUP_MANAGER_H
#define RUNBOX_CGROUP_MANAGER_H

#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>

namespace runbox {

/**
 * @brief 单个 namespace 沙箱的 cgroup v2 叶子节点
 *
 * 路径为 <root>/<name>. memory.max + memory.swap.max=0 给出硬内存上限,
 * pids.max 挡住 fork 炸弹; memory.events 的 oom_kill 用来判断 OOM.
 * 控制器在 <root>/cgroup.subtree_control 中开启, 进程只加入叶子节点.
 */
class CgroupManager {
public:
    CgroupManager(std::string root, std::string name);
    ~CgroupManager();

    CgroupManager(const CgroupManager&) = delete;
    CgroupManager& operator=(const CgroupManager&) = delete;

    // 创建叶子节点并写入内存 / 进程数上限; 失败时已创建的目录会被删除
    bool Setup(int64_t memory_limit_bytes, int pids_limit);

    // 只能在子进程 execve 之前调用
    bool Attach(pid_t pid);

    uint64_t OomKillCount() const;

    // 返回被 SIGKILL 的进程数
    int KillAll();

    // 杀掉剩余进程后 rmdir; 可重复调用
    void Remove();

    const std::string& path() const { return path_; }

    // /sys/fs/cgroup 挂载的是 cgroup2
    static bool Available();

private:
    std::vector<pid_t> Members() const;

    std::string root_;
    std::string name_;
    std::string path_;
    bool live_ = false;
};

} // namespace runbox

#endif // RUNBOX_CGROUP_MANAGER_H
