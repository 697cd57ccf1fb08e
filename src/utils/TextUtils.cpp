#include "utils/TextUtils.h"
#include <cstdlib>
#include <map>
#include <algorithm>
#include <cctype>

// ============================================================================
// UTF-8 Utilities
// ============================================================================

namespace UTF8Utils {
    std::string sanitize(const std::string& input) {
        std::string output;
        output.reserve(input.size());

        size_t i = 0;
        while (i < input.size()) {
            unsigned char c = static_cast<unsigned char>(input[i]);

            // 单字节 ASCII (0x00-0x7F)
            if (c <= 0x7F) {
                output.push_back(static_cast<char>(c));
                i++;
            }
            // 2 字节序列 (0xC2-0xDF) - 注意: 0xC0-0xC1 是无效的
            else if (c >= 0xC2 && c <= 0xDF) {
                if (i + 1 < input.size()) {
                    unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
                    if ((c1 & 0xC0) == 0x80) {
                        output.push_back(input[i]);
                        output.push_back(input[i + 1]);
                        i += 2;
                        continue;
                    }
                }
                output.push_back('?');
                i++;
            }
            // 3 字节序列 (0xE0-0xEF)
            else if (c >= 0xE0 && c <= 0xEF) {
                if (i + 2 < input.size()) {
                    unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
                    unsigned char c2 = static_cast<unsigned char>(input[i + 2]);
                    if ((c1 & 0xC0) == 0x80 && (c2 & 0xC0) == 0x80 && !(c == 0xE0 && c1 < 0xA0)) {
                        output.append(input, i, 3);
                        i += 3;
                        continue;
                    }
                }
                output.push_back('?');
                i++;
            }
            // 4 字节序列 (0xF0-0xF4)
            else if (c >= 0xF0 && c <= 0xF4) {
                if (i + 3 < input.size()) {
                    unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
                    unsigned char c2 = static_cast<unsigned char>(input[i + 2]);
                    unsigned char c3 = static_cast<unsigned char>(input[i + 3]);
                    bool continuation = (c1 & 0xC0) == 0x80 && (c2 & 0xC0) == 0x80 && (c3 & 0xC0) == 0x80;
                    bool overlong = (c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F);
                    if (continuation && !overlong) {
                        output.append(input, i, 4);
                        i += 4;
                        continue;
                    }
                }
                output.push_back('?');
                i++;
            }
            // 孤立的续字节 (0x80-0xBF) 或其他无效字节：直接跳过
            else {
                i++;
            }
        }

        return output;
    }

    size_t codepointCount(const std::string& input) {
        size_t count = 0;
        for (unsigned char c : input) {
            // 续字节 10xxxxxx 不计数
            if ((c & 0xC0) != 0x80) {
                count++;
            }
        }
        return count;
    }
}

// ============================================================================
// Text helpers
// ============================================================================

namespace TextUtils {
    std::string normalizeLineEndings(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                continue;
            }
            out.push_back(text[i]);
        }
        return out;
    }

    std::string languageForPath(const fs::path& path) {
        static const std::map<std::string, std::string> languages = {
            {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hpp", "cpp"},
            {".h", "c"}, {".c", "c"},
            {".py", "python"},
            {".js", "javascript"}, {".jsx", "javascript"},
            {".ts", "typescript"}, {".tsx", "typescript"},
            {".java", "java"},
            {".go", "go"},
            {".rs", "rust"},
            {".cs", "csharp"},
            {".rb", "ruby"},
            {".php", "php"},
            {".swift", "swift"},
            {".kt", "kotlin"}, {".kts", "kotlin"},
            {".sh", "bash"}, {".bash", "bash"}, {".zsh", "zsh"},
            {".json", "json"},
            {".toml", "toml"},
            {".yaml", "yaml"}, {".yml", "yaml"},
            {".md", "markdown"},
            {".html", "html"}, {".htm", "html"},
            {".css", "css"},
            {".sql", "sql"},
            {".xml", "xml"},
            {".cmake", "cmake"}
        };

        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (path.filename() == "CMakeLists.txt") return "cmake";
        if (path.filename() == "Makefile") return "make";

        auto it = languages.find(ext);
        return it == languages.end() ? "" : it->second;
    }

    std::string formatFileBlock(const fs::path& path, const std::string& content) {
        return "### " + path.string() + "\n```" + languageForPath(path) + "\n" + content + "\n```";
    }

    std::string expandUserPath(const std::string& path) {
        if (path.empty() || path[0] != '~') return path;
        if (path.size() > 1 && path[1] != '/') return path;  // ~user 形式不处理

        const char* home = std::getenv("HOME");
        if (!home || !*home) return path;
        return std::string(home) + path.substr(1);
    }

    size_t countOccurrences(const std::string& haystack, const std::string& needle) {
        if (needle.empty()) return 0;
        size_t count = 0;
        size_t pos = haystack.find(needle);
        while (pos != std::string::npos) {
            count++;
            pos = haystack.find(needle, pos + needle.size());
        }
        return count;
    }
}
