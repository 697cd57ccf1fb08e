#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * 访问忽略规则：text_editor 与 shell 共用的「禁止访问路径」判断。
 * - 配置：editor.ignore_patterns 为正则 (ECMAScript)，对绝对路径做 search。
 * - 以 "!" 开头的条目是例外规则；按顺序匹配，最后命中的一条决定结果。
 * - 无内置规则：未配置时一切路径可访问。
 */
class AccessIgnoreRules {
public:
    /** patterns 为正则表达式，如 "secret\\.txt", "\\.env$"（字面点需写 \\.） */
    explicit AccessIgnoreRules(std::vector<std::string> patterns = {});
    ~AccessIgnoreRules();

    AccessIgnoreRules(const AccessIgnoreRules&) = delete;
    AccessIgnoreRules& operator=(const AccessIgnoreRules&) = delete;

    bool isRestricted(const fs::path& path) const;

    // 无效正则在构造时被跳过, 这里返回实际生效的条数
    size_t patternCount() const;

    /**
     * @brief 把 .gitignore 转换成上面格式的正则列表
     * @param gitignoreFile .gitignore 文件路径, 规则相对其所在目录
     * @return 正则列表; 文件不存在或不可读时为空
     *
     * 支持 #注释、!取反、前导 / 锚定、结尾 / 仅匹配目录 (及其下所有路径)、
     * *、?、**、[...]。
     */
    static std::vector<std::string> fromGitignore(const fs::path& gitignoreFile);

    // 单条 gitignore 规则转正则; 空行与注释返回空串
    static std::string gitignoreLineToRegex(const std::string& line, const fs::path& baseDir);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
