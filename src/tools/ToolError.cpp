#include "tools/ToolError.h"
#include <map>

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::TooLarge: return "TooLarge";
        case ErrorKind::NoMatch: return "NoMatch";
        case ErrorKind::AmbiguousMatch: return "AmbiguousMatch";
        case ErrorKind::NoHistory: return "NoHistory";
        case ErrorKind::InvalidWorkflowReference: return "InvalidWorkflowReference";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::SchemaValidation: return "SchemaValidation";
        case ErrorKind::IOError: return "IOError";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

ErrorKind errorKindFromName(const std::string& name) {
    static const std::map<std::string, ErrorKind> kinds = {
        {"NotFound", ErrorKind::NotFound},
        {"TooLarge", ErrorKind::TooLarge},
        {"NoMatch", ErrorKind::NoMatch},
        {"AmbiguousMatch", ErrorKind::AmbiguousMatch},
        {"NoHistory", ErrorKind::NoHistory},
        {"InvalidWorkflowReference", ErrorKind::InvalidWorkflowReference},
        {"InvalidArgument", ErrorKind::InvalidArgument},
        {"SchemaValidation", ErrorKind::SchemaValidation},
        {"IOError", ErrorKind::IOError},
        {"Internal", ErrorKind::Internal}
    };
    auto it = kinds.find(name);
    return it == kinds.end() ? ErrorKind::Internal : it->second;
}

std::string ToolError::describe() const {
    std::string text = errorKindName(kind) + ": " + message;
    for (const auto& p : problems) {
        text += "\n  - " + p;
    }
    return text;
}

nlohmann::json ToolError::toJson() const {
    nlohmann::json j = {
        {"kind", errorKindName(kind)},
        {"message", message}
    };
    if (!subject.empty()) {
        j["subject"] = subject;
    }
    if (!problems.empty()) {
        j["problems"] = problems;
    }
    return j;
}
