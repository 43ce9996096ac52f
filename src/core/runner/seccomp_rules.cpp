#include "seccomp_rules.h"

#include <seccomp.h>
#include <cerrno>

namespace runbox {

    bool LoadSeccompRules() {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) return false;

        // 拒绝指定系统调用并返回 EPERM; 当前架构上不存在的调用号直接跳过
        #define DENY_SYSCALL(name) \
            do { \
                int nr = seccomp_syscall_resolve_name(#name); \
                if (nr != __NR_SCMP_ERROR && \
                    seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), nr, 0) != 0) { \
                    seccomp_release(ctx); return false; \
                } \
            } while (0)

        // 文件系统与命名空间
        DENY_SYSCALL(mount);
        DENY_SYSCALL(umount2);
        DENY_SYSCALL(pivot_root);
        DENY_SYSCALL(chroot);
        DENY_SYSCALL(setns);
        DENY_SYSCALL(unshare);
        DENY_SYSCALL(open_tree);
        DENY_SYSCALL(move_mount);
        DENY_SYSCALL(fsopen);
        DENY_SYSCALL(fsmount);
        DENY_SYSCALL(name_to_handle_at);
        DENY_SYSCALL(open_by_handle_at);

        // 调试与跨进程内存访问
        DENY_SYSCALL(ptrace);
        DENY_SYSCALL(process_vm_readv);
        DENY_SYSCALL(process_vm_writev);
        DENY_SYSCALL(kcmp);

        // 内核与系统管理
        DENY_SYSCALL(kexec_load);
        DENY_SYSCALL(kexec_file_load);
        DENY_SYSCALL(init_module);
        DENY_SYSCALL(finit_module);
        DENY_SYSCALL(delete_module);
        DENY_SYSCALL(reboot);
        DENY_SYSCALL(swapon);
        DENY_SYSCALL(swapoff);
        DENY_SYSCALL(acct);
        DENY_SYSCALL(settimeofday);
        DENY_SYSCALL(clock_settime);
        DENY_SYSCALL(adjtimex);
        DENY_SYSCALL(sethostname);
        DENY_SYSCALL(setdomainname);
        DENY_SYSCALL(iopl);
        DENY_SYSCALL(ioperm);
        DENY_SYSCALL(quotactl);

        // 内核攻击面
        DENY_SYSCALL(bpf);
        DENY_SYSCALL(perf_event_open);
        DENY_SYSCALL(userfaultfd);
        DENY_SYSCALL(keyctl);
        DENY_SYSCALL(add_key);
        DENY_SYSCALL(request_key);
        DENY_SYSCALL(lookup_dcookie);

        #undef DENY_SYSCALL

        int rc = seccomp_load(ctx);
        seccomp_release(ctx);
        return rc == 0;
    }
}
