#ifndef RUNBOX_SANDBOX_ISOLATION_H
#define RUNBOX_SANDBOX_ISOLATION_H

namespace runbox {

    /**
     * @brief namespace 后端子进程的入口点 (隔离层)
     * 兼容 clone() 函数签名。
     * 等待父进程放行 -> 构建只读 rootfs -> 资源限制 -> 降权 -> seccomp -> execve 解释器
     * @param arg 指向 NamespaceChildArgs 结构体的指针
     * @return int 只有失败时返回 (实际通过 _exit 退出)
     */
    int NamespaceChildFn(void* arg);

} // namespace runbox

#endif // RUNBOX_SANDBOX_ISOLATION_H
