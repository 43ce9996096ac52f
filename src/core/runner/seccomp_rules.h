#ifndef RUNBOX_SECCOMP_RULES_H
#define RUNBOX_SECCOMP_RULES_H

namespace runbox {

    /**
     * @brief 加载解释器运行阶段的 Seccomp 规则
     * 默认允许 + 特权系统调用黑名单 (返回 EPERM)。
     * 解释器需要的系统调用集合过大, 不适合白名单。
     * 只能在 clone 子进程中调用 (不分配 C++ 对象)。
     * @return false 如果规则无法构建或加载
     */
    bool LoadSeccompRules();

} // namespace runbox

#endif // RUNBOX_SECCOMP_RULES_H
