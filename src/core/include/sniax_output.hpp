#ifndef SNIAX_OUTPUT_HPP
#define SNIAX_OUTPUT_HPP

#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace sniax {

class SinkError : public std::runtime_error {
public:
    explicit SinkError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Shared destination for discovered hostnames
 *
 * Each hostname is one line on the console stream and, when a path is
 * configured, one line in the output file. Writes are serialized so
 * concurrent producers never split a line; no order between producers
 * is kept.
 */
class OutputSink {
public:
    /// Console only
    explicit OutputSink(std::ostream& console = std::cout);

    /**
     * @brief Console plus a file created (truncated) at `path`
     * @throws SinkError if the file cannot be created
     */
    OutputSink(std::ostream& console, const std::string& path);

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    void write(const std::string& hostname);
    void write(const std::vector<std::string>& hostnames);

    bool has_file() const { return file_.is_open(); }
    size_t lines_written() const;

private:
    void write_locked(const std::string& hostname);

    std::ostream& console_;
    std::ofstream file_;
    size_t lines_ = 0;
    mutable std::mutex mtx_;
};

} // namespace sniax

#endif // SNIAX_OUTPUT_HPP
