#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace buildprof {

// Local time as "YYYY-MM-DD HH:MM:SS TZ"; sub-second digits are dropped.
std::string formatLocalTimestamp(int64_t mtimeNs);

// Wraps value in double quotes, doubling any embedded quote.
std::string csvEscape(const std::string &value);

// Header "filepath,last_modification_timestamp" followed by one quoted row
// per change, in the order given.
std::string renderCsv(const std::vector<ChangeRecord> &changes);
bool writeCsvFile(const QString &path, const std::vector<ChangeRecord> &changes);

std::string renderTable(const std::vector<ChangeRecord> &changes);
std::string renderMarkdown(const ProfileRun &run);
std::string renderJson(const ProfileRun &run);

std::string renderHistoryTable(const std::vector<ProfileRun> &runs);
std::string renderHistoryJson(const std::vector<ProfileRun> &runs);

} // namespace buildprof
