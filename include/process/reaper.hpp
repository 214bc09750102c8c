#pragma once

#include <sys/types.h>
#include <vector>

namespace sandbox::process {

/**
 * @brief 进程表中的一项
 */
struct process_info {
    pid_t pid;
    pid_t ppid;
    pid_t pgid;
    pid_t sid;
};

/**
 * @brief 进程表，负责枚举进程和发送信号
 * 抽象出来是为了让进程树的遍历逻辑可以用伪造的进程表测试。
 */
struct process_table {
    virtual ~process_table();

    /**
     * @brief 枚举当前存活的所有进程
     */
    virtual std::vector<process_info> snapshot() = 0;

    /**
     * @brief 向进程发送信号
     * @return false 若进程已经不存在
     */
    virtual bool send_signal(pid_t pid, int sig) = 0;
};

/**
 * @brief 通过 /proc 文件系统读取的进程表
 */
struct proc_fs_table : public process_table {
    std::vector<process_info> snapshot() override;

    bool send_signal(pid_t pid, int sig) override;
};

/**
 * @brief 杀死以某个进程为根的整个进程树
 *
 * 1. 枚举进程表，通过 ppid 建立父子关系，从根进程出发找出所有后代；
 *    同时把与根进程同会话、同进程组的进程也算进来，因为根进程退出后，
 *    它的子进程会被 init 收养，此时已经无法通过 ppid 找到；
 * 2. 对新发现的进程发送 SIGSTOP 冻结，重新枚举，直到没有新进程出现，
 *    避免遍历期间有进程 fork 出新的子进程而漏杀；
 * 3. 按发现顺序的逆序发送 SIGKILL，根进程最后被杀死。
 */
struct process_tree_reaper {
    explicit process_tree_reaper(process_table &table);

    /**
     * @brief 找出根进程以及所有后代进程
     * @return 按广度优先顺序排列，如果根进程存活则根进程在第一个
     */
    std::vector<pid_t> discover(pid_t root);

    /**
     * @brief 杀死整个进程树，返回时已经向所有发现的进程发送了 SIGKILL
     * 不会等待进程被操作系统回收。对已经不存在的进程调用是安全的。
     * @return 是否发现并向根进程发送了信号
     */
    bool terminate(pid_t root) noexcept;

private:
    process_table &table;
};

/**
 * @brief 基于 /proc 的全局进程树收割器
 */
process_tree_reaper &default_reaper();

}  // namespace sandbox::process
