#ifndef FMCAL_LOG_H
#define FMCAL_LOG_H

#include <iosfwd>
#include <string>

// Line-oriented diagnostics on std::cerr, "Warning: ..." style.
namespace fmcal {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void setLevel(Level level);
Level level();

// Sink defaults to std::cerr. The stream must outlive its use.
void setSink(std::ostream *sink);

void debug(const std::string &message);
void info(const std::string &message);
void warn(const std::string &message);
void error(const std::string &message);

}  // namespace log
}  // namespace fmcal

#endif  // FMCAL_LOG_H
