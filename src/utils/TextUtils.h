#pragma once
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// UTF-8 验证和清理辅助函数
namespace UTF8Utils {
    /**
     * @brief 验证并清理 UTF-8 字符串，替换无效字节为 '?'
     */
    std::string sanitize(const std::string& input);

    /**
     * @brief 统计 Unicode 码点数量 (大小限制按字符而不是字节计算)
     */
    size_t codepointCount(const std::string& input);
}

namespace TextUtils {
    // CRLF -> LF
    std::string normalizeLineEndings(const std::string& text);

    /**
     * @brief 根据扩展名返回 Markdown 代码块的语言标识
     * 未知扩展名返回空字符串
     */
    std::string languageForPath(const fs::path& path);

    // "### <path>\n```<lang>\n<content>\n```"
    std::string formatFileBlock(const fs::path& path, const std::string& content);

    /**
     * @brief 展开开头的 "~" 为 $HOME
     */
    std::string expandUserPath(const std::string& path);

    /**
     * @brief 统计 needle 在 haystack 中不重叠出现的次数
     * needle 为空时返回 0
     */
    size_t countOccurrences(const std::string& haystack, const std::string& needle);
}
