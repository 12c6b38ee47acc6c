#include "output_log.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace runexec {
using namespace std;

string make_log_header(const string &command_line) {
    // 命令行，两个空行，分隔线，两个空行
    string header = command_line + "\n\n\n" + string(80, '-') + "\n\n\n";
    return header;
}

output_log::output_log(const filesystem::path &path, const string &command_line)
    : file(path) {
    log_fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (log_fd < 0) error(errno, "opening log file '{}'", path.string());

    string header = make_log_header(command_line);
    size_t written = 0;
    while (written < header.size()) {
        ssize_t n = write(log_fd, header.data() + written, header.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close_fd();
            error(err, "writing header of log file '{}'", path.string());
        }
        written += n;
    }
    header_bytes = header.size();
}

output_log::~output_log() {
    close_fd();
}

int output_log::fd() const {
    return log_fd;
}

size_t output_log::header_size() const {
    return header_bytes;
}

const filesystem::path &output_log::path() const {
    return file;
}

void output_log::close_fd() {
    if (log_fd >= 0) {
        if (close(log_fd) != 0)
            LOG(ERROR) << "closing log file " << file << ": " << strerror(errno);
        log_fd = -1;
    }
}

bool output_log::finalize(optional<size_t> max_size) {
    close_fd();
    if (!max_size) return false;
    return reduce_file_size(file, *max_size, header_bytes);
}

void output_log::discard() {
    close_fd();
    error_code ec;
    filesystem::remove(file, ec);
    if (ec) LOG(ERROR) << "removing log file " << file << ": " << ec.message();
}

}  // namespace runexec
