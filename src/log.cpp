#include "log.h"

#include <iostream>
#include <mutex>

namespace fmcal {
namespace log {

namespace {

Level gLevel = Level::Info;
std::ostream *gSink = &std::cerr;
std::mutex gMutex;

void write(Level lvl, const char *prefix, const std::string &message) {
    std::lock_guard<std::mutex> lock(gMutex);
    if (lvl < gLevel || gSink == nullptr) return;
    *gSink << prefix << message << '\n';
}

}  // namespace

void setLevel(Level level) {
    std::lock_guard<std::mutex> lock(gMutex);
    gLevel = level;
}

Level level() {
    std::lock_guard<std::mutex> lock(gMutex);
    return gLevel;
}

void setSink(std::ostream *sink) {
    std::lock_guard<std::mutex> lock(gMutex);
    gSink = sink;
}

void debug(const std::string &message) { write(Level::Debug, "Debug: ", message); }
void info(const std::string &message) { write(Level::Info, "", message); }
void warn(const std::string &message) { write(Level::Warn, "Warning: ", message); }
void error(const std::string &message) { write(Level::Error, "Error: ", message); }

}  // namespace log
}  // namespace fmcal
