#ifndef FMCAL_TABLE_H
#define FMCAL_TABLE_H

#include <filesystem>
#include <string>
#include <vector>

namespace fmcal {
namespace table {

using Row = std::vector<std::string>;

// Tab-separated rows. Tabs, newlines and backslashes inside a field are
// written as \t, \n and \\. Lines starting with '#' are headers/comments.
std::string escape(const std::string &field);
std::string unescape(const std::string &field);

std::string formatDouble(double v);
double parseDouble(const std::string &field);
int parseInt(const std::string &field);

// Missing file reads as no rows. Throws StoreError when a row does not have
// `columns` fields.
std::vector<Row> read(const std::filesystem::path &file, size_t columns);

// Writes to "<file>.tmp" and renames it over `file`.
void writeAtomic(const std::filesystem::path &file, const std::string &header,
                 const std::vector<Row> &rows);

// Exclusive lock held as a directory next to the tables. The directory holds
// an "owner" file naming the holder's pid and start time. Waits up to
// `timeoutMs` for a concurrent holder, then throws StoreError naming that
// owner. A process killed while holding the lock leaves the directory
// behind; once no fmcal process is running it can be removed by hand.
class DirectoryLock {
public:
    explicit DirectoryLock(std::filesystem::path path, int timeoutMs = 2000);
    ~DirectoryLock();

    DirectoryLock(const DirectoryLock &) = delete;
    DirectoryLock &operator=(const DirectoryLock &) = delete;

private:
    std::filesystem::path path_;
};

}  // namespace table
}  // namespace fmcal

#endif  // FMCAL_TABLE_H
