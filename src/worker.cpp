#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <csignal>

namespace sandbox {
using namespace std;
using namespace nlohmann;

// 停止接收请求的标记
static volatile sig_atomic_t stop = false;

void stop_workers() {
    stop = true;
}

bool workers_stopped() {
    return stop;
}

response_writer::response_writer(ostream &os) : os(os) {}

void response_writer::write(const json &response) {
    string line = response.dump();
    scoped_lock guard(mut);
    os << line << '\n';
    os.flush();
}

size_t read_requests(istream &is, concurrent_queue<request_task> &task_queue) {
    size_t count = 0, line_number = 0;
    string line;
    while (!stop && getline(is, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;
        if (!task_queue.push({line_number, line})) break;
        ++count;
    }
    if (stop) LOG(WARNING) << "Stopped reading requests at line " << line_number;
    task_queue.close();
    return count;
}

json process_request(sandbox_service &service, const request_task &task) {
    json request;
    try {
        request = json::parse(task.line);
    } catch (json::parse_error &ex) {
        LOG(WARNING) << "Malformed request at line " << task.line_number << ": " << ex.what();
        return {{"error", ex.what()}, {"line", task.line_number}};
    }
    if (!request.is_object())
        return {{"error", "request should be a JSON object"}, {"line", task.line_number}};
    return service.handle(request);
}

static void worker_loop(size_t worker_id, sandbox_service &service, concurrent_queue<request_task> &task_queue, response_writer &writer) {
    LOG(INFO) << "Worker " << worker_id << " started";

    request_task task;
    while (task_queue.pop(task)) {
        try {
            writer.write(process_request(service, task));
        } catch (std::exception &ex) {
            // 响应无法生成或者无法写出，记录下来继续处理下一个请求
            LOG(ERROR) << "Worker " << worker_id << " failed on request at line " << task.line_number << ": "
                       << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, sandbox_service &service, concurrent_queue<request_task> &task_queue, response_writer &writer) {
    return thread([worker_id, &service, &task_queue, &writer] {
        worker_loop(worker_id, service, task_queue, writer);
    });
}

}  // namespace sandbox
