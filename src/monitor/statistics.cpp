#include "monitor/statistics.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <cmath>

namespace sandbox {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const import_failure &value) {
    j = {{"language", value.lang},
         {"module", value.module},
         {"error", value.error},
         {"code_preview", value.code_preview}};
}

static double round4(double value) {
    return round(value * 10000) / 10000;
}

run_statistics::run_statistics(monitor &sink, uint64_t log_every_requests, chrono::duration<double> log_every_seconds)
    : sink(sink), log_every_requests(log_every_requests), log_every_seconds(log_every_seconds) {}

void run_statistics::record(run_status status, failure_reason reason) {
    optional<json> summary;
    {
        scoped_lock guard(mut);
        ++total;
        ++status_count[status];
        ++reason_count[reason];
        // 在同一个临界区内判断，并发记录时不会跳过第 N 个请求
        bool by_count = log_every_requests > 0 && total % log_every_requests == 0;
        summary = take_summary_nolock(by_count);
    }
    if (summary) emit(*summary);
}

void run_statistics::update_import_failure(import_failure sample) {
    scoped_lock guard(mut);
    last_import_failure = move(sample);
}

bool run_statistics::flush(bool force) {
    optional<json> summary;
    {
        scoped_lock guard(mut);
        if (total == 0) return false;
        summary = take_summary_nolock(force);
    }
    if (!summary) return false;
    emit(*summary);
    return true;
}

optional<json> run_statistics::take_summary_nolock(bool force) {
    auto now = chrono::steady_clock::now();
    bool by_time = log_every_seconds.count() > 0 &&
                   (!last_flush || now - *last_flush >= log_every_seconds);
    if (!force && !by_time) return {};
    last_flush = now;
    return summary_nolock();
}

void run_statistics::emit(const json &summary) {
    try {
        sink.report_statistics(summary);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to report statistics: " << ex.what();
    }
}

json run_statistics::summary() const {
    scoped_lock guard(mut);
    return summary_nolock();
}

json run_statistics::summary_nolock() const {
    auto count_of = [this](run_status status) -> uint64_t {
        auto it = status_count.find(status);
        return it == status_count.end() ? 0 : it->second;
    };

    json breakdown = json::object();
    for (auto &[reason, count] : reason_count) {
        if (reason == failure_reason::SUCCESS) continue;
        breakdown[get_display_message(reason)] = {{"count", count},
                                                  {"ratio", round4((double)count / total)}};
    }

    uint64_t success = count_of(run_status::SUCCESS);
    json summary = {{"total_requests", total},
                    {"success_count", success},
                    {"failed_count", count_of(run_status::FAILED)},
                    {"sandbox_error_count", count_of(run_status::SANDBOX_ERROR)},
                    {"success_rate", total ? round4((double)success / total) : 0.0},
                    {"failure_breakdown", breakdown}};
    if (last_import_failure) summary["import_error_example"] = *last_import_failure;
    else summary["import_error_example"] = nullptr;
    return summary;
}

chrono::duration<double> run_statistics::log_interval() const {
    return log_every_seconds;
}

statistics_reporter::statistics_reporter(run_statistics &stats) : stats(stats) {}

statistics_reporter::~statistics_reporter() {
    stop();
}

bool statistics_reporter::start() {
    if (stats.log_interval().count() <= 0 || worker.joinable()) return false;
    {
        scoped_lock guard(mut);
        stopping = false;
    }
    worker = thread([this] { loop(); });
    return true;
}

void statistics_reporter::stop() {
    {
        scoped_lock guard(mut);
        stopping = true;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
}

bool statistics_reporter::running() const {
    return worker.joinable();
}

void statistics_reporter::loop() {
    auto interval = max<chrono::duration<double>>(stats.log_interval(), chrono::seconds(1));
    unique_lock lock(mut);
    while (true) {
        if (cv.wait_for(lock, interval, [this] { return stopping; })) break;
        // 持有锁输出，stop 返回之后不会再有统计输出
        try {
            stats.flush(true);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Statistics reporter failed: " << ex.what();
        }
    }
}

}  // namespace sandbox
