#pragma once
#include <string>
#include <vector>
#include <deque>
#include <optional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <filesystem>
#include "editor/FifoMutex.h"
#include "tools/ToolError.h"
#include "utils/AccessIgnore.h"

namespace fs = std::filesystem;

/**
 * @brief 单个文件的内容缓存与撤销历史
 *
 * history 中的 nullopt 表示 "当时文件不存在"。
 */
struct FileRecord {
    std::optional<std::string> current;
    bool observed = false;                        // 是否曾经见过磁盘上的内容
    std::optional<fs::file_time_type> mtime;      // 最近一次加载/提交时的修改时间
    std::deque<std::optional<std::string>> history;
};

/**
 * @brief text_editor 的状态: 按规范化绝对路径保存内容与有界撤销历史
 *
 * 同一路径上的操作互斥且按到达顺序执行 (每个路径一把 FifoMutex);
 * 不同路径只在查找槽位时短暂共享 registryMutex。
 * 所有操作返回 Outcome, 不抛异常。
 */
class FileEditStore {
public:
    static constexpr uintmax_t MAX_FILE_BYTES = 400 * 1024;
    static constexpr size_t MAX_CHARS = 400000;
    static constexpr size_t SNIPPET_LINES = 4;

    explicit FileEditStore(size_t maxHistory = 10, std::vector<std::string> ignorePatterns = {});

    FileEditStore(const FileEditStore&) = delete;
    FileEditStore& operator=(const FileEditStore&) = delete;

    Outcome<std::string> view(const fs::path& path);

    // 返回实际写入的内容 (已统一为 LF)
    Outcome<std::string> write(const fs::path& path, const std::string& fileText);

    // 返回编辑位置前后各 SNIPPET_LINES 行
    Outcome<std::string> strReplace(const fs::path& path, const std::string& oldStr, const std::string& newStr);

    Outcome<std::string> undo(const fs::path& path);

    size_t historyDepth(const fs::path& path);
    size_t maxHistory() const { return historyLimit; }
    bool isRestricted(const fs::path& path) const { return ignoreRules.isRestricted(path); }

private:
    struct Slot {
        FifoMutex lock;
        FileRecord record;
    };

    size_t historyLimit;
    AccessIgnoreRules ignoreRules;

    std::mutex registryMutex;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots;

    static fs::path canonicalKey(const fs::path& path);
    std::shared_ptr<Slot> slotFor(const fs::path& key);
    std::optional<ToolError> checkAccess(const fs::path& key) const;

    std::optional<ToolError> syncFromDisk(FileRecord& record, const fs::path& key);
    void pushHistory(FileRecord& record, std::optional<std::string> snapshot);
    static void markCommitted(FileRecord& record, const fs::path& key, std::string content);

    static bool readFile(const fs::path& path, std::string& out);
    static bool writeFile(const fs::path& path, const std::string& content);
};
