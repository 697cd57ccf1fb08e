#include "utils/AccessIgnore.h"
#include "utils/Logger.h"
#include <fstream>
#include <regex>

namespace {

struct Rule {
    std::regex re;
    bool exception;   // "!" 开头: 命中则放行
};

std::string escapeRegex(const std::string& text) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

// gitignore glob -> ECMAScript 正则 (不含锚点)
std::string globToRegex(const std::string& glob) {
    std::string regex;
    regex.reserve(glob.size() * 2);
    size_t i = 0;
    while (i < glob.size()) {
        char c = glob[i];
        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    regex += "(?:.*/)?";
                    i += 3;
                } else {
                    regex += ".*";
                    i += 2;
                }
                continue;
            }
            regex += "[^/]*";
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '[') {
            size_t close = glob.find(']', i + 2);
            if (close == std::string::npos) {
                regex += "\\[";
            } else {
                regex += '[';
                size_t j = i + 1;
                if (glob[j] == '!' || glob[j] == '^') {
                    regex += '^';
                    ++j;
                }
                for (; j < close; ++j) {
                    if (glob[j] == '\\') regex += '\\';
                    regex += glob[j];
                }
                regex += ']';
                i = close;
            }
        } else if (c == '\\' && i + 1 < glob.size()) {
            regex += escapeRegex(std::string(1, glob[i + 1]));
            ++i;
        } else {
            regex += escapeRegex(std::string(1, c));
        }
        ++i;
    }
    return regex;
}

} // namespace

struct AccessIgnoreRules::Impl {
    std::vector<Rule> rules;
};

AccessIgnoreRules::AccessIgnoreRules(std::vector<std::string> patterns)
    : impl_(std::make_unique<Impl>()) {
    for (const auto& s : patterns) {
        const bool exception = !s.empty() && s[0] == '!';
        const std::string body = exception ? s.substr(1) : s;
        if (body.empty()) continue;
        try {
            impl_->rules.push_back({std::regex(body, std::regex::ECMAScript), exception});
        } catch (const std::regex_error& e) {
            // 无效正则则跳过该条
            Logger::getInstance().warn("Ignoring invalid ignore pattern '" + s + "': " + e.what());
        }
    }
}

AccessIgnoreRules::~AccessIgnoreRules() = default;

bool AccessIgnoreRules::isRestricted(const fs::path& path) const {
    if (impl_->rules.empty()) return false;

    const std::string p = path.generic_string();
    bool restricted = false;
    for (const auto& rule : impl_->rules) {
        if (std::regex_search(p, rule.re)) {
            restricted = !rule.exception;
        }
    }
    return restricted;
}

size_t AccessIgnoreRules::patternCount() const {
    return impl_->rules.size();
}

std::string AccessIgnoreRules::gitignoreLineToRegex(const std::string& rawLine, const fs::path& baseDir) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    if (line.empty() || line[0] == '#') return "";

    bool negate = false;
    if (line[0] == '!') {
        negate = true;
        line.erase(0, 1);
    } else if (line[0] == '\\' && line.size() > 1 && (line[1] == '#' || line[1] == '!')) {
        line.erase(0, 1);
    }

    bool dirOnly = false;
    if (!line.empty() && line.back() == '/') {
        dirOnly = true;
        line.pop_back();
    }
    if (line.empty()) return "";

    // 含 / 的规则相对 baseDir 锚定, 否则匹配任意层级
    const bool anchored = line.find('/') != std::string::npos;
    if (line[0] == '/') line.erase(0, 1);
    if (line.empty()) return "";

    std::string base = baseDir.generic_string();
    while (!base.empty() && base.back() == '/') base.pop_back();

    std::string regex = "^" + escapeRegex(base) + (anchored ? "/" : "/(?:.*/)?") + globToRegex(line);
    regex += dirOnly ? "/.*$" : "(?:/.*)?$";
    return negate ? "!" + regex : regex;
}

std::vector<std::string> AccessIgnoreRules::fromGitignore(const fs::path& gitignoreFile) {
    std::vector<std::string> patterns;
    std::ifstream in(gitignoreFile);
    if (!in.is_open()) return patterns;

    std::error_code ec;
    fs::path base = gitignoreFile.has_parent_path() ? gitignoreFile.parent_path() : fs::current_path(ec);
    fs::path canonical = fs::weakly_canonical(base, ec);
    if (!ec) base = canonical;

    std::string line;
    while (std::getline(in, line)) {
        std::string regex = gitignoreLineToRegex(line, base);
        if (!regex.empty()) patterns.push_back(std::move(regex));
    }
    return patterns;
}
