#include "runner/notebook.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include "common/utils.hpp"
#include "process/subprocess.hpp"

namespace sandbox {
using namespace std;
using namespace sandbox::process;

const char *CELL_MARKER_ENV = "SANDBOX_CELL_MARKER";

cell_stream_parser::cell_stream_parser(string marker) : marker(move(marker)) {}

bool cell_stream_parser::feed(const string &data) {
    while (true) {
        size_t found = data.find(marker, pos);
        if (found == string::npos) {
            // 末尾可能是标记的前半部分，留到下次再解析
            size_t safe = max(pos, data.size() - min(data.size(), marker.size() - 1));
            text.append(data, pos, safe - pos);
            pos = safe;
            return false;
        }
        size_t eol = data.find('\n', found);
        text.append(data, pos, found - pos);
        pos = found;
        if (eol == string::npos) return false;

        string line = data.substr(found + marker.size(), eol - found - marker.size());
        pos = eol + 1;
        if (boost::starts_with(line, " done")) {
            string code = boost::trim_copy(line.substr(5));
            if (!code.empty()) {
                try {
                    rc = boost::lexical_cast<int>(code);
                } catch (boost::bad_lexical_cast &) {
                    LOG(WARNING) << "Malformed return code from notebook driver: " << code;
                }
            }
            return true;
        } else if (boost::starts_with(line, " display ")) {
            displays.push_back(line.substr(9));
        } else {
            text.append(data, found, eol + 1 - found);
        }
    }
}

void cell_stream_parser::next_cell() {
    text.clear();
    displays.clear();
    rc.reset();
}

string &cell_stream_parser::output() {
    return text;
}

vector<string> &cell_stream_parser::display() {
    return displays;
}

const optional<int> &cell_stream_parser::return_code() const {
    return rc;
}

namespace {

enum class cell_outcome {
    COMPLETED,
    DRIVER_EXITED,
    TIMEOUT
};

/**
 * @brief 一次 notebook 会话，持有驱动进程
 */
struct notebook_session {
    notebook_session(subprocess &proc, const string &marker)
        : proc(proc), marker(marker), stdout_parser(marker), stderr_parser(marker) {}

    cell_outcome run_cell(const string &code, clock_type::time_point deadline, cell_run_result &cell) {
        string payload = code;
        if (!boost::ends_with(payload, "\n")) payload += '\n';
        payload += marker + " end\n";

        stdin_feeder feeder(proc.input(), move(payload), false);
        feeder.start();
        if (feeder.skipped()) return cell_outcome::DRIVER_EXITED;

        bool stdout_done = false, stderr_done = false;
        while (true) {
            stdout_done = stdout_done || stdout_parser.feed(proc.stdout_data());
            stderr_done = stderr_done || stderr_parser.feed(proc.stderr_data());
            if (stdout_done && stderr_done) break;

            if (proc.exited()) {
                proc.drain();
                stdout_done = stdout_done || stdout_parser.feed(proc.stdout_data());
                stderr_done = stderr_done || stderr_parser.feed(proc.stderr_data());
                if (stdout_done && stderr_done) break;
                return cell_outcome::DRIVER_EXITED;
            }
            if (!proc.pump(deadline, &feeder)) return cell_outcome::TIMEOUT;
        }

        cell.stdout_data = move(stdout_parser.output());
        cell.stderr_data = move(stderr_parser.output());
        cell.display = move(stdout_parser.display());
        cell.status = stdout_parser.return_code().value_or(1) == 0 ? "ok" : "error";
        stdout_parser.next_cell();
        stderr_parser.next_cell();
        return cell_outcome::COMPLETED;
    }

    /**
     * @brief 关闭 stdin 并等待驱动进程退出
     * @return false 若到达截止时间
     */
    bool shutdown(clock_type::time_point deadline) {
        if (auto input = proc.input(); input && !input->closed()) input->close();
        while (!proc.exited())
            if (!proc.pump(deadline)) return false;
        return true;
    }

private:
    subprocess &proc;
    const string &marker;
    cell_stream_parser stdout_parser, stderr_parser;
};

string make_marker() {
    string id = random_uuid();
    id.erase(remove(id.begin(), id.end(), '-'), id.end());
    return "__sandbox_cell_" + id;
}

}  // namespace

run_jupyter_result run_jupyter(const run_jupyter_args &args, const notebook_config &config) {
    elapsed_time timer;
    run_jupyter_result result;
    auto &driver = result.driver;
    auto overall_deadline = deadline_after(args.total_timeout);

    workspace ws(config.env.workspace_root);
    ws.materialize(args.files);

    string marker = make_marker();
    spawn_options options;
    options.command = expand_command(config.command, "", ws.path(), config.env.script_dir);
    options.workdir = ws.path();
    options.pipe_stdin = true;
    options.memory_limit = args.memory_limit;
    options.env[CELL_MARKER_ENV] = marker;

    unique_ptr<subprocess> proc;
    try {
        proc = make_unique<subprocess>(options, *config.env.reaper);
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to start notebook driver: " << e.what();
        driver.status = command_run_status::ERROR;
        driver.stderr_data = fmt::format("failed to start notebook driver: {}", e.what());
        driver.execution_time = timer.seconds();
        result.files = ws.fetch(args.fetch_files);
        return result;
    }

    try {
        notebook_session session(*proc, marker);
        cell_outcome outcome = cell_outcome::COMPLETED;
        for (size_t i = 0; i < args.cells.size(); ++i) {
            auto cell_deadline = min(overall_deadline, deadline_after(args.cell_timeout));
            cell_run_result cell;
            cell.execution_count = static_cast<int>(i + 1);
            outcome = session.run_cell(args.cells[i], cell_deadline, cell);
            if (outcome != cell_outcome::COMPLETED) break;
            result.cells.push_back(move(cell));
        }

        if (outcome == cell_outcome::COMPLETED && !session.shutdown(overall_deadline))
            outcome = cell_outcome::TIMEOUT;

        proc->drain();
        proc->terminate();
        if (!proc->reap(clock_type::now() + KILL_GRACE))
            throw runtime_error(fmt::format("notebook driver {} did not exit after being killed", proc->pid()));
        proc->drain();

        driver.stdout_data = move(proc->stdout_data());
        driver.stderr_data = move(proc->stderr_data());
        switch (outcome) {
            case cell_outcome::COMPLETED:
                driver.status = command_run_status::FINISHED;
                driver.return_code = proc->return_code();
                break;
            case cell_outcome::TIMEOUT:
                driver.status = command_run_status::TIME_LIMIT_EXCEEDED;
                break;
            case cell_outcome::DRIVER_EXITED:
                driver.status = command_run_status::ERROR;
                driver.return_code = proc->return_code();
                driver.stderr_data += fmt::format("\nnotebook driver exited after {} of {} cells", result.cells.size(), args.cells.size());
                break;
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Internal error while running notebook driver " << proc->pid() << ": " << e.what();
        proc->terminate();
        driver.status = command_run_status::ERROR;
        driver.return_code.reset();
        driver.stderr_data = fmt::format("internal error while running notebook driver: {}", e.what());
    }

    driver.execution_time = timer.seconds();
    result.files = ws.fetch(args.fetch_files);
    return result;
}

}  // namespace sandbox
