#include "common/io_utils.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include "common/defer.hpp"
#include "common/utils.hpp"

namespace runexec {
using namespace std;

const string LOG_REDUCED_MARKER = "\n\n\nWARNING: YOUR LOGFILE WAS TOO LONG, SOME LINES IN THE MIDDLE WERE REMOVED.\n\n\n\n";

static const size_t BUF_SIZE = 65536;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

static ssize_t pread_fully(int fd, char *buf, size_t count, off_t offset) {
    ssize_t nread;
    do {
        nread = pread(fd, buf, count, offset);
    } while (nread < 0 && errno == EINTR);
    return nread;
}

static void pwrite_fully(int fd, const char *buf, size_t count, off_t offset, const filesystem::path &file) {
    while (count > 0) {
        ssize_t nwritten = pwrite(fd, buf, count, offset);
        if (nwritten < 0) {
            if (errno == EINTR) continue;
            error(errno, "writing to '{}'", file.string());
        }
        buf += nwritten;
        offset += nwritten;
        count -= nwritten;
    }
}

/**
 * @return 从 from 开始（包括 from）第一个换行符之后的位置，找不到换行符时返回 -1
 */
static off_t find_line_end(int fd, off_t from, off_t size, const filesystem::path &file) {
    char buf[BUF_SIZE];
    off_t pos = from;
    while (pos < size) {
        ssize_t nread = pread_fully(fd, buf, min<off_t>(BUF_SIZE, size - pos), pos);
        if (nread < 0) error(errno, "reading from '{}'", file.string());
        if (nread == 0) break;
        const void *newline = memchr(buf, '\n', nread);
        if (newline) return pos + (static_cast<const char *>(newline) - buf) + 1;
        pos += nread;
    }
    return -1;
}

bool reduce_file_size(const filesystem::path &file, size_t limit, size_t min_prefix) {
    int fd = open(file.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) error(errno, "opening file '{}'", file.string());
    defer { close(fd); };

    struct stat st;
    if (fstat(fd, &st) != 0) error(errno, "getting size of '{}'", file.string());
    off_t size = st.st_size;
    if (size <= (off_t)limit) return false;

    off_t half = limit / 2;
    off_t prefix_from = max<off_t>(half, min_prefix > 0 ? (off_t)min_prefix - 1 : 0);
    off_t prefix_end = find_line_end(fd, prefix_from, size, file);
    if (prefix_end < 0) return false;  // 没有可以切分的行

    off_t suffix_start = find_line_end(fd, max<off_t>(size - half, prefix_end), size, file);
    if (suffix_start < 0) suffix_start = size;

    // 中间部分比提示信息还短时，删减没有意义
    if (suffix_start - prefix_end <= (off_t)LOG_REDUCED_MARKER.size()) return false;

    LOG(WARNING) << "Logfile '" << file.string() << "' is too big (size " << size << " bytes). Removing lines.";

    pwrite_fully(fd, LOG_REDUCED_MARKER.data(), LOG_REDUCED_MARKER.size(), prefix_end, file);

    // 将尾部向前移动，紧接在提示信息之后
    off_t dest = prefix_end + LOG_REDUCED_MARKER.size();
    char buf[BUF_SIZE];
    for (off_t src = suffix_start; src < size;) {
        ssize_t nread = pread_fully(fd, buf, min<off_t>(BUF_SIZE, size - src), src);
        if (nread < 0) error(errno, "reading from '{}'", file.string());
        if (nread == 0) break;
        pwrite_fully(fd, buf, nread, dest, file);
        src += nread;
        dest += nread;
    }

    if (ftruncate(fd, dest) != 0) error(errno, "truncating '{}'", file.string());
    return true;
}

}  // namespace runexec
