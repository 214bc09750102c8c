#include "runner/workspace.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

workspace::workspace(const filesystem::path &root) : dir(root / random_uuid()) {
    filesystem::create_directories(dir);
}

// 用户程序可能去掉了自己创建的目录的权限，非 root 运行时会导致删除失败
static void restore_permissions(const filesystem::path &root) {
    vector<filesystem::path> pending = {root};
    while (!pending.empty()) {
        filesystem::path current = move(pending.back());
        pending.pop_back();

        error_code ec;
        if (!filesystem::is_directory(filesystem::symlink_status(current, ec))) continue;
        filesystem::permissions(current, filesystem::perms::owner_all, filesystem::perm_options::add, ec);
        if (ec) {
            VLOG(1) << "Unable to restore permissions of " << current << ": " << ec.message();
            continue;
        }
        for (filesystem::directory_iterator it(current, ec), end; !ec && it != end; it.increment(ec))
            pending.push_back(it->path());
    }
}

workspace::~workspace() {
    error_code ec;
    filesystem::remove_all(dir, ec);
    if (ec) {
        restore_permissions(dir);
        ec.clear();
        filesystem::remove_all(dir, ec);
    }
    if (ec) LOG(ERROR) << "Unable to remove workspace " << dir << ": " << ec.message();
}

const filesystem::path &workspace::path() const {
    return dir;
}

void workspace::materialize(const file_map &files) const {
    for (auto &[subpath, content] : files) {
        auto target = dir / assert_safe_path(subpath);
        write_file_content(target, content ? base64_decode(*content) : string());
    }
}

void workspace::write(const string &subpath, const string &content) const {
    write_file_content(dir / assert_safe_path(subpath), content);
}

fetched_files workspace::fetch(const vector<string> &paths) const {
    fetched_files result;
    for (auto &subpath : paths) {
        auto target = dir / assert_safe_path(subpath);
        error_code ec;
        if (!filesystem::is_regular_file(target, ec) || !is_within(dir, target)) {
            VLOG(1) << "Skipping fetch of " << subpath << ", not a file in the workspace";
            continue;
        }
        result[subpath] = base64_encode(read_file_content(target));
    }
    return result;
}

}  // namespace sandbox
