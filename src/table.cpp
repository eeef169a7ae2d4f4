#include "table.h"

#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>

#include <unistd.h>

#include "errors.h"
#include "log.h"

namespace fmcal {
namespace table {

namespace fs = std::filesystem;

std::string escape(const std::string &field) {
    std::string out;
    out.reserve(field.size());
    for (char ch : field) {
        switch (ch) {
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\\': out += "\\\\"; break;
        default: out += ch;
        }
    }
    return out;
}

std::string unescape(const std::string &field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] != '\\' || i + 1 == field.size()) {
            out += field[i];
            continue;
        }
        switch (field[++i]) {
        case 't': out += '\t'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        default: out += field[i];
        }
    }
    return out;
}

std::string formatDouble(double v) {
    std::ostringstream os;
    os << std::setprecision(17) << v;
    return os.str();
}

double parseDouble(const std::string &field) {
    size_t used = 0;
    double v;
    try {
        v = std::stod(field, &used);
    } catch (const std::logic_error &) {
        throw StoreError("Bad number in table: '" + field + "'");
    }
    if (used != field.size()) throw StoreError("Bad number in table: '" + field + "'");
    return v;
}

int parseInt(const std::string &field) {
    size_t used = 0;
    int v;
    try {
        v = std::stoi(field, &used);
    } catch (const std::logic_error &) {
        throw StoreError("Bad integer in table: '" + field + "'");
    }
    if (used != field.size()) throw StoreError("Bad integer in table: '" + field + "'");
    return v;
}

std::vector<Row> read(const fs::path &file, size_t columns) {
    std::vector<Row> rows;
    std::ifstream in(file);
    if (!in.is_open()) {
        if (fs::exists(file)) throw StoreError("Failed to open " + file.string());
        return rows;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        Row row;
        size_t pos = 0;
        while (true) {
            const size_t tab = line.find('\t', pos);
            row.push_back(unescape(line.substr(pos, tab - pos)));
            if (tab == std::string::npos) break;
            pos = tab + 1;
        }
        if (row.size() != columns) {
            throw StoreError(file.string() + ": expected " + std::to_string(columns) +
                             " fields, got " + std::to_string(row.size()));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void writeAtomic(const fs::path &file, const std::string &header,
                 const std::vector<Row> &rows) {
    fs::path tmp = file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) throw StoreError("Failed to write " + tmp.string());
        out << "# " << header << '\n';
        for (const Row &row : rows) {
            for (size_t i = 0; i < row.size(); ++i) {
                if (i > 0) out << '\t';
                out << escape(row[i]);
            }
            out << '\n';
        }
        out.flush();
        if (!out) throw StoreError("Failed to write " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec) throw StoreError("Failed to replace " + file.string() + ": " + ec.message());
}

namespace {

const char *kOwnerFile = "owner";

std::string ownerLine() {
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream os;
    os << "pid " << ::getpid() << " since " << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

std::string lockHolder(const fs::path &lock) {
    std::ifstream in(lock / kOwnerFile);
    std::string line;
    if (!std::getline(in, line) || line.empty()) return "an unknown process";
    return line;
}

}  // namespace

DirectoryLock::DirectoryLock(fs::path path, int timeoutMs) : path_(std::move(path)) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
        std::error_code ec;
        if (fs::create_directory(path_, ec)) break;
        if (ec) throw StoreError("Failed to lock " + path_.string() + ": " + ec.message());
        if (std::chrono::steady_clock::now() >= deadline) {
            throw StoreError("Store is locked by " + lockHolder(path_) + " at " +
                             path_.string() + "; if no fmcal process is running, remove " +
                             path_.string());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    std::ofstream out(path_ / kOwnerFile);
    out << ownerLine() << '\n';
    out.flush();
    if (!out) {
        std::error_code ec;
        fs::remove_all(path_, ec);
        throw StoreError("Failed to record lock owner in " + path_.string());
    }
}

DirectoryLock::~DirectoryLock() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) log::warn("Failed to release lock " + path_.string() + ": " + ec.message());
}

}  // namespace table
}  // namespace fmcal
