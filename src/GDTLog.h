#ifndef _GDTLOG_H_
#define _GDTLOG_H_

#include <cstdint>
#include <iostream>
#include <sstream>
#include <mutex>

enum LogLevel {
    None = 0,
    Error,
    Normal,
    Debug
};

class GDTLog 
{
public:
    enum Manip { Endl = 176 };

    GDTLog(LogLevel level = Normal) 
        : log_level(level) {}

    ~GDTLog() 
    {
        if (should_log() && !oss.str().empty()) 
        {
            flush();
        }
    }

    template <typename T>
    GDTLog& operator<<(const T& value) 
    {
        if (should_log()) 
        {
            oss << value;
        }
        return *this;
    }

    GDTLog& operator<<(Manip manip);

    void set_log_level(LogLevel level) 
    {
        current_level = level;
    }

    bool should_log() const 
    {
        return current_level >= log_level;
    }

    LogLevel get_log_level() const 
    {
        return current_level;
    }

    // Safe to call from worker threads, redraws are throttled to 10 per second
    void print_progress(uint64_t processed, uint64_t total);

private:
    static LogLevel current_level;
    static std::mutex out_mutex;

    std::ostringstream oss;
    LogLevel log_level;    

    void flush();
};

#endif // _GDTLOG_H_
