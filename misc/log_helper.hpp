#ifndef __PERRON_MISC_LOG_HELPER_HPP__
#define __PERRON_MISC_LOG_HELPER_HPP__

#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace perron { namespace log {

/** dual_ostream: line-oriented logger writing to a console stream
    and to a log file. Each message carries a priority (0 = most
    important); it reaches the console if its priority does not
    exceed the console threshold, and the file likewise. Messages are
    assembled in per-thread buffers and written out atomically when
    std::endl is streamed.

        dual_ostream log("run.log", std::cout, 0, 1);
        log(1, "info") << "iteration " << k << std::endl;
 */
class dual_ostream {
public:
    typedef dual_ostream self_t;

    dual_ostream(const std::string& filename = "",
                 std::ostream& os = std::cout,
                 int os_thresh = 0, int file_thresh = 1)
        : m_os(os), m_os_thresh(os_thresh), m_file_thresh(file_thresh) {
        if (!filename.empty()) {
            m_file.open(filename.c_str());
            if (!m_file) {
                throw std::runtime_error("dual_ostream: unable to open log file " + filename);
            }
        }
    }

    void set_thresholds(int os_thresh, int file_thresh) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_os_thresh = os_thresh;
        m_file_thresh = file_thresh;
    }

    int os_threshold() const { return m_os_thresh; }
    int file_threshold() const { return m_file_thresh; }
    bool has_file() const { return m_file.is_open(); }

    self_t& operator()(int p = 0, const std::string& pre = "") {
        line_buffer& buf = buffer();
        buf.priority = p;
        buf.os.str("");
        buf.os.clear();
        buf.file.str("");
        buf.file.clear();
        buf.active = to_console(p) || to_file(p);
        if (!pre.empty()) {
            if (to_console(p)) buf.os << pre << ": ";
            if (to_file(p)) buf.file << pre << ": ";
        }
        return *this;
    }

    self_t& operator<<(std::ios_base& (*func)(std::ios_base&)) {
        line_buffer& buf = buffer();
        if (!buf.active) return *this;
        if (to_console(buf.priority)) func(buf.os);
        if (to_file(buf.priority)) func(buf.file);
        return *this;
    }

    // std::endl and friends terminate the current message
    self_t& operator<<(std::ostream& (*func)(std::ostream&)) {
        line_buffer& buf = buffer();
        if (!buf.active) return *this;
        std::lock_guard<std::mutex> lock(m_mutex);
        if (to_console(buf.priority)) {
            func(buf.os);
            m_os << buf.os.str() << std::flush;
        }
        if (to_file(buf.priority) && m_file.is_open()) {
            func(buf.file);
            m_file << buf.file.str() << std::flush;
        }
        buf.active = false;
        buf.os.str("");
        buf.file.str("");
        return *this;
    }

    template<typename T>
    friend self_t& operator<<(self_t&, const T&);

private:
    struct line_buffer {
        line_buffer() : priority(0), active(false) {}
        std::ostringstream os, file;
        int  priority;
        bool active;
    };

    bool to_console(int p) const { return p <= m_os_thresh; }
    bool to_file(int p) const { return p <= m_file_thresh && m_file.is_open(); }

    line_buffer& buffer() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_buffers[std::this_thread::get_id()];
    }

    std::ostream& m_os;
    std::ofstream m_file;
    int m_os_thresh;
    int m_file_thresh;

    std::mutex m_mutex;
    std::map<std::thread::id, line_buffer> m_buffers;
};

template<typename T>
dual_ostream& operator<<(dual_ostream& os, const T& t) {
    dual_ostream::line_buffer& buf = os.buffer();
    if (!buf.active) return os;
    if (os.to_console(buf.priority)) buf.os << t;
    if (os.to_file(buf.priority)) buf.file << t;
    return os;
}

} // log
} // perron

#endif // __PERRON_MISC_LOG_HELPER_HPP__
