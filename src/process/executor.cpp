#include "process/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include "common/utils.hpp"
#include "process/subprocess.hpp"

namespace sandbox::process {
using namespace std;

const chrono::milliseconds KILL_GRACE(2000);

command_run_result run_command(const command_options &options, process_tree_reaper &reaper) {
    elapsed_time timer;
    command_run_result result;

    spawn_options spawn_opts;
    spawn_opts.command = options.command;
    spawn_opts.workdir = options.workdir;
    spawn_opts.pipe_stdin = options.stdin_data.has_value();
    spawn_opts.memory_limit = options.memory_limit;
    spawn_opts.env = options.env;

    unique_ptr<subprocess> proc;
    try {
        proc = make_unique<subprocess>(spawn_opts, reaper);
    } catch (std::exception &e) {
        LOG(WARNING) << "unable to start command " << options.command << ": " << e.what();
        result.status = command_run_status::ERROR;
        result.stderr_data = fmt::format("failed to start command: {}", e.what());
        result.execution_time = timer.seconds();
        return result;
    }

    auto deadline = deadline_after(options.timeout);
    try {
        stdin_feeder feeder(proc->input(), options.stdin_data.value_or(""));
        feeder.start();
        if (feeder.skipped())
            VLOG(1) << "stdin of child " << proc->pid() << " closed before writing";

        bool timed_out = false;
        while (!proc->exited()) {
            if (!proc->pump(deadline, &feeder)) {
                timed_out = true;
                break;
            }
        }

        if (timed_out) {
            LOG(INFO) << fmt::format("command exceeded time limit of {:.3f}s, killing process tree of {}",
                                     options.timeout.count(), proc->pid());
            proc->terminate();
            if (!proc->reap(clock_type::now() + KILL_GRACE))
                LOG(WARNING) << "child " << proc->pid() << " still alive after being killed";
            proc->drain();
            result.status = command_run_status::TIME_LIMIT_EXCEEDED;
        } else {
            // 进程已经退出但还没有被回收，先读出管道中剩余的输出，再杀死残留的后代进程
            proc->drain();
            proc->terminate();
            if (!proc->reap(clock_type::now() + KILL_GRACE))
                throw runtime_error("exited child could not be reaped");
            proc->drain();
            result.status = command_run_status::FINISHED;
            result.return_code = proc->return_code();
        }
        result.stdout_data = move(proc->stdout_data());
        result.stderr_data = move(proc->stderr_data());
    } catch (std::exception &e) {
        LOG(ERROR) << "error while running command " << options.command << ": " << e.what();
        proc->terminate();
        result.status = command_run_status::ERROR;
        result.return_code.reset();
        result.stdout_data = move(proc->stdout_data());
        result.stderr_data = fmt::format("internal error while running command: {}", e.what());
    }
    result.execution_time = timer.seconds();
    return result;
}

}  // namespace sandbox::process
