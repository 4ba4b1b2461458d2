// ============================================================================
//  File: include/gallery_log.hpp — Journal minimal (stderr)
//  Project: E-Ink Gallery Renderer v1
//
//  • Une ligne par message: "[LEVEL] message".
//  • Sérialisé par mutex: les workers de rendu écrivent en parallèle.
//  • Seuil global réglé par la config (`log_level`) ou EINK_LOG_LEVEL.
// ============================================================================

#pragma once
#include <string>

namespace EinkGallery
{

enum class LogLevel : unsigned char { Debug=0, Info=1, Warn=2, Error=3, Off=4 };

void      set_log_level(LogLevel lvl);
LogLevel  log_level();
bool      parse_log_level(const std::string& s, LogLevel& out);

void log_message(LogLevel lvl, const std::string& msg);

inline void log_debug(const std::string& m)
{
    log_message(LogLevel::Debug, m);
}
inline void log_info(const std::string& m)
{
    log_message(LogLevel::Info, m);
}
inline void log_warn(const std::string& m)
{
    log_message(LogLevel::Warn, m);
}
inline void log_error(const std::string& m)
{
    log_message(LogLevel::Error, m);
}

} // namespace EinkGallery
