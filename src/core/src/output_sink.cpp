#include "../include/sniax_output.hpp"

#include <cerrno>
#include <system_error>

namespace sniax {

OutputSink::OutputSink(std::ostream& console) : console_(console) {}

OutputSink::OutputSink(std::ostream& console, const std::string& path)
    : console_(console) {
    if (path.empty()) return;
    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        throw SinkError("cannot create output file " + path + ": " + std::system_category().message(errno));
    }
}

void OutputSink::write(const std::string& hostname) {
    std::lock_guard<std::mutex> lock(mtx_);
    write_locked(hostname);
    console_.flush();
    if (file_.is_open()) file_.flush();
}

void OutputSink::write(const std::vector<std::string>& hostnames) {
    if (hostnames.empty()) return;
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& hostname : hostnames) {
        write_locked(hostname);
    }
    console_.flush();
    if (file_.is_open()) file_.flush();
}

void OutputSink::write_locked(const std::string& hostname) {
    console_ << hostname << '\n';
    if (file_.is_open()) {
        file_ << hostname << '\n';
    }
    ++lines_;
}

size_t OutputSink::lines_written() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lines_;
}

} // namespace sniax
