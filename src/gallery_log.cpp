// ============================================================================
//  File: src/gallery_log.cpp — Journal minimal (stderr)
// ============================================================================

#include "gallery_log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace EinkGallery
{

namespace
{
std::atomic<int> g_level{(int)LogLevel::Info};
std::mutex       g_sink_mu;

const char* level_tag(LogLevel l)
{
    switch(l)
    {
    case LogLevel::Debug:
        return "[DEBUG] ";
    case LogLevel::Info:
        return "[INFO] ";
    case LogLevel::Warn:
        return "[WARN] ";
    case LogLevel::Error:
        return "[ERROR] ";
    default:
        return "";
    }
}
} // anon

void set_log_level(LogLevel lvl)
{
    g_level.store((int)lvl);
}

LogLevel log_level()
{
    return (LogLevel)g_level.load();
}

bool parse_log_level(const std::string& s, LogLevel& out)
{
    std::string v;
    for(char c: s) v.push_back((char)std::tolower((unsigned char)c));
    if(v=="debug")               out = LogLevel::Debug;
    else if(v=="info")           out = LogLevel::Info;
    else if(v=="warn" || v=="warning") out = LogLevel::Warn;
    else if(v=="error")          out = LogLevel::Error;
    else if(v=="off" || v=="none") out = LogLevel::Off;
    else return false;
    return true;
}

void log_message(LogLevel lvl, const std::string& msg)
{
    if(lvl==LogLevel::Off || (int)lvl < g_level.load()) return;
    std::lock_guard<std::mutex> lk(g_sink_mu);
    std::cerr << level_tag(lvl) << msg << "\n";
}

} // namespace EinkGallery
