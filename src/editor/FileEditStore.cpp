#include "editor/FileEditStore.h"
#include "utils/TextUtils.h"
#include "utils/Logger.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string formatKb(uintmax_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / 1024.0;
    return out.str();
}

} // namespace

FileEditStore::FileEditStore(size_t maxHistory, std::vector<std::string> ignorePatterns)
    : historyLimit(maxHistory), ignoreRules(std::move(ignorePatterns)) {}

fs::path FileEditStore::canonicalKey(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return canonical;
}

std::shared_ptr<FileEditStore::Slot> FileEditStore::slotFor(const fs::path& key) {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto& slot = slots[key.string()];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

std::optional<ToolError> FileEditStore::checkAccess(const fs::path& key) const {
    if (ignoreRules.isRestricted(key)) {
        return ToolError::make(ErrorKind::InvalidArgument,
                               "The file '" + key.string() + "' is restricted by ignore patterns",
                               key.string());
    }
    return std::nullopt;
}

bool FileEditStore::readFile(const fs::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) return false;
    out = buffer.str();
    return true;
}

bool FileEditStore::writeFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    return !file.fail();
}

std::optional<ToolError> FileEditStore::syncFromDisk(FileRecord& record, const fs::path& key) {
    std::error_code ec;
    if (!fs::is_regular_file(key, ec)) {
        // 曾经见过的文件在外部被删除
        if (record.current) {
            record.current.reset();
            record.mtime.reset();
        }
        return std::nullopt;
    }

    auto mtime = fs::last_write_time(key, ec);
    if (ec) {
        return ToolError::make(ErrorKind::IOError,
                               "Failed to get file metadata: " + ec.message(), key.string());
    }
    if (record.current && record.mtime && *record.mtime == mtime) {
        return std::nullopt;
    }

    std::string content;
    if (!readFile(key, content)) {
        return ToolError::make(ErrorKind::IOError, "Failed to read file: " + key.string(), key.string());
    }
    if (record.current && *record.current != content) {
        Logger::getInstance().debug("Reloaded externally modified file: " + key.string());
    }
    record.current = std::move(content);
    record.mtime = mtime;
    record.observed = true;
    return std::nullopt;
}

void FileEditStore::pushHistory(FileRecord& record, std::optional<std::string> snapshot) {
    record.history.push_back(std::move(snapshot));
    while (record.history.size() > historyLimit) {
        record.history.pop_front();
    }
}

void FileEditStore::markCommitted(FileRecord& record, const fs::path& key, std::string content) {
    std::error_code ec;
    auto mtime = fs::last_write_time(key, ec);
    record.mtime = ec ? std::nullopt : std::optional<fs::file_time_type>(mtime);
    record.current = std::move(content);
    record.observed = true;
}

Outcome<std::string> FileEditStore::view(const fs::path& path) {
    const fs::path key = canonicalKey(path);
    if (auto denied = checkAccess(key)) return *denied;

    auto slot = slotFor(key);
    std::lock_guard<FifoMutex> guard(slot->lock);
    FileRecord& record = slot->record;

    std::error_code ec;
    if (!fs::is_regular_file(key, ec)) {
        record.current.reset();
        record.mtime.reset();
        return ToolError::make(ErrorKind::NotFound,
                               "The path '" + key.string() + "' does not exist or is not a file.",
                               key.string());
    }

    uintmax_t size = fs::file_size(key, ec);
    if (ec) {
        return ToolError::make(ErrorKind::IOError, "Failed to get file metadata: " + ec.message(), key.string());
    }
    if (size > MAX_FILE_BYTES) {
        return ToolError::make(ErrorKind::TooLarge,
                               "File '" + key.string() + "' is too large (" + formatKb(size) +
                               "KB). Maximum size is 400KB.",
                               key.string());
    }

    if (auto err = syncFromDisk(record, key)) return *err;

    const std::string& content = *record.current;
    size_t chars = UTF8Utils::codepointCount(content);
    if (chars > MAX_CHARS) {
        return ToolError::make(ErrorKind::TooLarge,
                               "File '" + key.string() + "' has too many characters (" + std::to_string(chars) +
                               "). Maximum character count is " + std::to_string(MAX_CHARS) + ".",
                               key.string());
    }
    return content;
}

Outcome<std::string> FileEditStore::write(const fs::path& path, const std::string& fileText) {
    const fs::path key = canonicalKey(path);
    if (auto denied = checkAccess(key)) return *denied;

    size_t chars = UTF8Utils::codepointCount(fileText);
    if (chars > MAX_CHARS) {
        return ToolError::make(ErrorKind::TooLarge,
                               "Input content for '" + key.string() + "' has too many characters (" +
                               std::to_string(chars) + "). Maximum allowed is " + std::to_string(MAX_CHARS) + ".",
                               key.string());
    }

    auto slot = slotFor(key);
    std::lock_guard<FifoMutex> guard(slot->lock);
    FileRecord& record = slot->record;

    std::error_code ec;
    if (fs::is_directory(key, ec)) {
        return ToolError::make(ErrorKind::InvalidArgument,
                               "The path '" + key.string() +
                               "' is an existing directory. The 'write' command can only target files.",
                               key.string());
    }

    if (key.has_parent_path()) {
        fs::create_directories(key.parent_path(), ec);
        if (ec) {
            return ToolError::make(ErrorKind::IOError,
                                   "Failed to create directories: " + ec.message(), key.string());
        }
    }

    if (auto err = syncFromDisk(record, key)) return *err;

    // 从未见过的新文件不入历史; 见过后又消失的文件记一个 "不存在" 快照
    bool takeSnapshot = record.current.has_value() || record.observed;
    std::optional<std::string> snapshot = record.current;

    std::string normalized = TextUtils::normalizeLineEndings(fileText);
    if (!writeFile(key, normalized)) {
        return ToolError::make(ErrorKind::IOError, "Failed to write file: " + key.string(), key.string());
    }

    if (takeSnapshot) {
        pushHistory(record, std::move(snapshot));
    }
    markCommitted(record, key, normalized);
    Logger::getInstance().debug("Wrote " + key.string() + " (history " + std::to_string(record.history.size()) + ")");
    return normalized;
}

Outcome<std::string> FileEditStore::strReplace(const fs::path& path, const std::string& oldStr,
                                               const std::string& newStr) {
    const fs::path key = canonicalKey(path);
    if (auto denied = checkAccess(key)) return *denied;

    auto slot = slotFor(key);
    std::lock_guard<FifoMutex> guard(slot->lock);
    FileRecord& record = slot->record;

    std::error_code ec;
    if (!fs::is_regular_file(key, ec)) {
        record.current.reset();
        record.mtime.reset();
        return ToolError::make(ErrorKind::NotFound,
                               "File '" + key.string() +
                               "' does not exist, you can write a new file with the `write` command",
                               key.string());
    }
    if (oldStr.empty()) {
        return ToolError::make(ErrorKind::InvalidArgument, "'old_str' must not be empty", "old_str");
    }

    if (auto err = syncFromDisk(record, key)) return *err;
    const std::string content = *record.current;

    size_t matches = TextUtils::countOccurrences(content, oldStr);
    if (matches == 0) {
        return ToolError::make(ErrorKind::NoMatch,
                               "'old_str' must appear exactly once in the file, but it does not appear in the file. "
                               "Make sure the string exactly matches existing file content, including whitespace!",
                               key.string());
    }
    if (matches > 1) {
        return ToolError::make(ErrorKind::AmbiguousMatch,
                               "'old_str' must appear exactly once in the file, but it appears " +
                               std::to_string(matches) + " times",
                               key.string());
    }

    const size_t pos = content.find(oldStr);
    std::string replaced = content;
    replaced.replace(pos, oldStr.size(), newStr);
    const std::string updated = TextUtils::normalizeLineEndings(replaced);

    if (!writeFile(key, updated)) {
        return ToolError::make(ErrorKind::IOError, "Failed to write file: " + key.string(), key.string());
    }
    pushHistory(record, content);
    markCommitted(record, key, updated);

    // 片段: 编辑起始行前 SNIPPET_LINES 行 到 插入文本结束后 SNIPPET_LINES 行
    const size_t replacementLine = static_cast<size_t>(std::count(content.begin(), content.begin() + pos, '\n'));
    const size_t startLine = replacementLine > SNIPPET_LINES ? replacementLine - SNIPPET_LINES : 0;
    const size_t endLine = replacementLine + SNIPPET_LINES + std::count(newStr.begin(), newStr.end(), '\n');

    std::vector<std::string> lines = splitLines(updated);
    std::string snippet;
    for (size_t i = startLine; i <= endLine && i < lines.size(); ++i) {
        if (i > startLine) snippet += "\n";
        snippet += lines[i];
    }
    return snippet;
}

Outcome<std::string> FileEditStore::undo(const fs::path& path) {
    const fs::path key = canonicalKey(path);
    if (auto denied = checkAccess(key)) return *denied;

    auto slot = slotFor(key);
    std::lock_guard<FifoMutex> guard(slot->lock);
    FileRecord& record = slot->record;

    if (record.history.empty()) {
        return ToolError::make(ErrorKind::NoHistory, "No edit history available to undo", key.string());
    }

    std::optional<std::string> previous = std::move(record.history.back());
    record.history.pop_back();
    const std::string restored = previous.value_or("");

    std::error_code ec;
    if (key.has_parent_path()) {
        fs::create_directories(key.parent_path(), ec);
    }
    if (ec || !writeFile(key, restored)) {
        record.history.push_back(std::move(previous));
        return ToolError::make(ErrorKind::IOError, "Failed to write file: " + key.string(), key.string());
    }

    markCommitted(record, key, restored);
    return restored;
}

size_t FileEditStore::historyDepth(const fs::path& path) {
    const fs::path key = canonicalKey(path);
    auto slot = slotFor(key);
    std::lock_guard<FifoMutex> guard(slot->lock);
    return slot->record.history.size();
}
