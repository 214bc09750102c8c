#include "common/io_utils.hpp"
#include <errno.h>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;
namespace bai = boost::archive::iterators;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::in | ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

fs::path assert_safe_path(const string &subpath) {
    fs::path path(subpath);
    if (subpath.empty() || path.is_absolute() || path.has_root_name() || path.has_root_directory())
        throw unsafe_path_error(subpath);
    for (auto &component : path)
        if (component == "..")
            throw unsafe_path_error(subpath);
    fs::path normal = path.lexically_normal();
    if (normal.empty() || normal == ".")
        throw unsafe_path_error(subpath);
    return normal;
}

bool is_within(const fs::path &root, const fs::path &path) {
    error_code ec;
    fs::path real_root = fs::weakly_canonical(root, ec);
    if (ec) return false;
    fs::path real_path = fs::weakly_canonical(path, ec);
    if (ec) return false;
    auto [root_end, _] = mismatch(real_root.begin(), real_root.end(), real_path.begin(), real_path.end());
    return root_end == real_root.end();
}

string base64_encode(const string &data) {
    using encoder = bai::base64_from_binary<bai::transform_width<string::const_iterator, 6, 8>>;
    string encoded(encoder(data.begin()), encoder(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

string base64_decode(const string &input) {
    using decoder = bai::transform_width<bai::binary_from_base64<string::const_iterator>, 8, 6>;

    string encoded;
    encoded.reserve(input.size());
    copy_if(input.begin(), input.end(), back_inserter(encoded), [](char c) { return !isspace((unsigned char)c); });
    if (encoded.empty()) return "";
    if (encoded.size() % 4 != 0)
        throw invalid_payload_error("base64 payload length is not a multiple of 4");

    size_t padding = 0;
    while (padding < 2 && encoded[encoded.size() - 1 - padding] == '=') ++padding;
    if (find(encoded.begin(), encoded.end() - padding, '=') != encoded.end() - padding)
        throw invalid_payload_error("unexpected padding inside base64 payload");
    // binary_from_base64 不认识 '='，用值为 0 的 'A' 代替，最后再截掉补齐的字节
    replace(encoded.end() - padding, encoded.end(), '=', 'A');

    try {
        string decoded(decoder(encoded.begin()), decoder(encoded.end()));
        decoded.erase(decoded.size() - padding);
        return decoded;
    } catch (bai::dataflow_exception &e) {
        throw invalid_payload_error(string("malformed base64 payload: ") + e.what());
    }
}

}  // namespace sandbox
