#ifndef __PERRON_MISC_PROGRESS_HPP__
#define __PERRON_MISC_PROGRESS_HPP__

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace perron {

inline std::string human_readable_duration(double _t) {
    using namespace std::chrono;
    typedef duration< double, std::ratio<1, 1000> > dms;

    if (_t < 0.001) return std::string("0 ms.");
    dms t(_t);
    std::ostringstream os;
    size_t h = duration_cast<hours>(t).count();
    if (h>0) {
        os << h << " h. ";
        t -= duration_cast<milliseconds>(hours(h));
    }
    size_t m = duration_cast<minutes>(t).count();
    if (m>0) {
        os << m << " m. ";
        t -= duration_cast<milliseconds>(minutes(m));
    }
    size_t s = duration_cast<seconds>(t).count();
    if (s>0) {
        os << s << " s. ";
        t -= duration_cast<milliseconds>(seconds(s));
    }
    size_t ms = duration_cast<milliseconds>(t).count();
    if (ms>0) {
        os << ms << " ms. ";
    }
    std::string str=os.str();
    if (str.empty()) return std::string("0 ms.");
    return str.substr(0, str.size()-1);
}

// Console progress bar with cpu and wall clock timing.
class progress_display {
public:
    typedef std::chrono::steady_clock   wall_clock_t;
    typedef wall_clock_t::time_point    time_point_t;

    progress_display(bool activate=true, std::ostream& _os=std::cout)
        : m_active(activate), m_stopped(false), m_progress(0),
          m_bar_width(50), m_precision(1), m_size(0), m_at(0), m_delta_at(1),
          m_os(_os) {
        m_cpu_begin = m_cpu_end = std::clock();
        m_wall_begin = m_wall_end = wall_clock_t::now();
    }

    void begin(size_t size, const std::string& str="", size_t nb_updates=100) {
        m_str = str;
        m_size = size;
        m_progress = 0;
        m_at = 0;
        m_stopped = false;
        m_delta_at = std::max(static_cast<size_t>(1), m_size/nb_updates);
        m_cpu_begin = std::clock();
        m_wall_begin = wall_clock_t::now();
        if (m_active) display();
    }

    void end() {
        m_cpu_end = std::clock();
        m_wall_end = wall_clock_t::now();
        m_stopped = true;
        if (m_active) {
            m_progress = 1;
            display();
            m_os << '\n';
        }
    }

    void update(size_t at) {
        if (m_size == 0) return;
        if (at - m_at >= m_delta_at || at+1 == m_size) {
            m_progress = static_cast<float>(at+1)/static_cast<float>(m_size);
            m_at = at;
            if (m_active) display();
        }
    }

    void set_active(bool active=true) { m_active = active; }

    size_t size() const { return m_size; }

    // milliseconds
    double cpu_time() const {
        std::clock_t end = m_stopped ? m_cpu_end : std::clock();
        return 1000.*static_cast<double>(end-m_cpu_begin)/CLOCKS_PER_SEC;
    }

    // milliseconds
    double wall_time() const {
        time_point_t end = m_stopped ? m_wall_end : wall_clock_t::now();
        return std::chrono::duration<double, std::milli>(end-m_wall_begin).count();
    }

private:
    void display() {
        if (!m_str.empty()) m_os << m_str << ": ";
        int pos = static_cast<int>(m_bar_width * m_progress);
        m_os << "[" << std::string(pos, '=') << '>'
             << std::string(std::max(m_bar_width-pos-1, 0), ' ')
             << "] "
             << std::setprecision(m_precision)
             << std::fixed
             << m_progress*100.0
             << " %\r"
             << std::flush;
    }

    bool m_active, m_stopped;
    float m_progress;
    int m_bar_width;
    int m_precision;
    size_t m_size, m_at, m_delta_at;
    std::clock_t m_cpu_begin, m_cpu_end;
    time_point_t m_wall_begin, m_wall_end;
    std::ostream& m_os;
    std::string m_str;
};

inline std::ostream& operator<<(std::ostream& os, const progress_display& pd) {
    os << "wall time: " << human_readable_duration(pd.wall_time())
       << ", cpu time: " << human_readable_duration(pd.cpu_time());
    return os;
}

} // namespace perron

#endif // __PERRON_MISC_PROGRESS_HPP__
