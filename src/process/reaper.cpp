#include "process/reaper.hpp"
#include <dirent.h>
#include <errno.h>
#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <deque>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <string>

namespace sandbox::process {
using namespace std;

// 冻结后重新枚举的最大轮数，fork 炸弹也只能在每轮之间增加一层进程
static const int MAX_FREEZE_ROUNDS = 16;

process_table::~process_table() {}

/**
 * @brief 解析 /proc/[pid]/stat
 * 格式为 "pid (comm) state ppid pgrp session ..."，comm 中可能包含空格和括号，
 * 因此从最后一个 ')' 之后开始解析。
 */
static bool parse_stat(const string &line, process_info &info) {
    auto close_paren = line.rfind(')');
    if (close_paren == string::npos) return false;
    istringstream head(line.substr(0, line.find('(')));
    istringstream tail(line.substr(close_paren + 1));
    char state;
    if (!(head >> info.pid)) return false;
    if (!(tail >> state >> info.ppid >> info.pgid >> info.sid)) return false;
    return true;
}

vector<process_info> proc_fs_table::snapshot() {
    vector<process_info> processes;
    DIR *dir = opendir("/proc");
    if (!dir) {
        PLOG(ERROR) << "unable to open /proc";
        return processes;
    }
    while (struct dirent *entry = readdir(dir)) {
        const char *name = entry->d_name;
        if (!all_of(name, name + strlen(name), [](char c) { return isdigit((unsigned char)c) != 0; })) continue;

        // 进程可能在枚举过程中退出，读取失败直接忽略
        ifstream fin(string("/proc/") + name + "/stat");
        string line;
        if (!getline(fin, line)) continue;
        process_info info;
        if (parse_stat(line, info)) processes.push_back(info);
    }
    closedir(dir);
    return processes;
}

bool proc_fs_table::send_signal(pid_t pid, int sig) {
    if (kill(pid, sig) == 0) return true;
    if (errno != ESRCH)
        PLOG(WARNING) << "sending signal " << sig << " to process " << pid;
    return false;
}

process_tree_reaper::process_tree_reaper(process_table &table) : table(table) {}

vector<pid_t> process_tree_reaper::discover(pid_t root) {
    vector<process_info> processes = table.snapshot();
    map<pid_t, vector<pid_t>> children;
    bool root_alive = false;
    for (auto &info : processes) {
        children[info.ppid].push_back(info.pid);
        if (info.pid == root) root_alive = true;
    }

    pid_t self = getpid();
    vector<pid_t> result;
    set<pid_t> visited;
    deque<pid_t> queue;
    auto visit = [&](pid_t pid) {
        if (pid <= 1 || pid == self || visited.count(pid)) return;
        visited.insert(pid);
        queue.push_back(pid);
    };

    if (root_alive) visit(root);
    // 根进程是会话首进程，孤儿进程仍然保留着它的会话号和进程组号
    for (auto &info : processes)
        if (info.sid == root || info.pgid == root)
            visit(info.pid);

    while (!queue.empty()) {
        pid_t pid = queue.front();
        queue.pop_front();
        result.push_back(pid);
        auto it = children.find(pid);
        if (it == children.end()) continue;
        for (pid_t child : it->second) visit(child);
    }
    return result;
}

bool process_tree_reaper::terminate(pid_t root) noexcept {
    if (root <= 1) return false;
    try {
        vector<pid_t> order;
        set<pid_t> frozen;
        for (int round = 0; round < MAX_FREEZE_ROUNDS; ++round) {
            bool grown = false;
            for (pid_t pid : discover(root)) {
                if (frozen.count(pid)) continue;
                frozen.insert(pid);
                order.push_back(pid);
                table.send_signal(pid, SIGSTOP);
                grown = true;
            }
            if (!grown) break;
        }

        bool root_signalled = false;
        // 后发现的进程先杀死，根进程最后杀死
        stable_partition(order.begin(), order.end(), [root](pid_t pid) { return pid == root; });
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            bool delivered = table.send_signal(*it, SIGKILL);
            if (*it == root) root_signalled = delivered;
        }
        if (!order.empty())
            VLOG(1) << "killed " << order.size() << " processes in the tree of " << root;
        return root_signalled;
    } catch (std::exception &e) {
        LOG(ERROR) << "unable to terminate process tree of " << root << ": " << e.what();
        return false;
    }
}

process_tree_reaper &default_reaper() {
    static proc_fs_table table;
    static process_tree_reaper reaper(table);
    return reaper;
}

}  // namespace sandbox::process
