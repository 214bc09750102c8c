#include "monitor/monitor.hpp"
#include <glog/logging.h>

namespace sandbox {
using namespace std;
using namespace nlohmann;

monitor::~monitor() = default;

void monitor::report_statistics(const json &) {}

void monitor::report_exception(const string &, const string &, const string &) {}

void glog_monitor::report_statistics(const json &summary) {
    LOG(WARNING) << "sandbox.run_code.stats " << summary.dump();
}

void glog_monitor::report_exception(const string &endpoint, const string &request_id, const string &message) {
    json record = {{"request_id", request_id}, {"error", message}};
    LOG(WARNING) << "sandbox." << endpoint << ".exception " << record.dump();
}

}  // namespace sandbox
