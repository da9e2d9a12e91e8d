#include <iomanip>
#include <chrono>

#include "GDTLog.h"

LogLevel GDTLog::current_level = Normal;
std::mutex GDTLog::out_mutex;

GDTLog& GDTLog::operator<<(Manip manip) 
{
    if (manip == Manip::Endl && should_log()) 
    {
        oss << '\n';
        flush();
    }
    return *this;
}

void GDTLog::flush()
{
    std::lock_guard<std::mutex> lock(out_mutex);
    std::cerr << oss.str();
    std::cerr.flush();
    oss.str("");  // Clear the stream after flushing
    oss.clear();
}

void GDTLog::print_progress(uint64_t processed, uint64_t total) 
{
    static auto last_update_time = std::chrono::steady_clock::now();

    if (current_level < Normal || total == 0) 
    {
        return;
    }

    std::lock_guard<std::mutex> lock(out_mutex);

    auto now = std::chrono::steady_clock::now();
    auto duration_since_last_update = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_update_time);

    if (duration_since_last_update.count() < 100 && processed < total) 
    {
        return;
    }

    last_update_time = now;

    const int bar_width = 50;
    float progress = static_cast<float>(processed) / total;

    std::cerr << "\r[";

    int pos = static_cast<int>(bar_width * progress);
    for (int i = 0; i < bar_width; ++i) 
    {
        if (i < pos) std::cerr << "=";
        else if (i == pos) std::cerr << ">";
        else std::cerr << " ";
    }

    std::cerr << "] " << std::setw(6) << std::fixed << std::setprecision(2) << (progress * 100.0) << "%";

    if (processed >= total) 
    {
        std::cerr << '\n';
    }
    std::cerr.flush();
}
