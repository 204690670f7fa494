#pragma once
#include "../tool.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace largefile {

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!out.is_object()) {
        return ToolResult{false, "Failed to parse arguments: expected a JSON object"};
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

// Optional boolean field; out keeps its default when absent.
inline std::optional<ToolResult> optional_bool(const nlohmann::json& args, const char* field,
                                               bool& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_boolean()) {
        return ToolResult{false, std::string("Parameter must be a boolean: ") + field};
    }
    out = args[field].get<bool>();
    return std::nullopt;
}

// Optional non-negative integer field; out keeps its default when absent.
inline std::optional<ToolResult> optional_unsigned(const nlohmann::json& args, const char* field,
                                                   size_t& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    const auto& v = args[field];
    if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0)) {
        return ToolResult{false, std::string("Parameter must be a non-negative integer: ") + field};
    }
    out = v.get<size_t>();
    return std::nullopt;
}

// Structured failure: {"error": ..., "suggestion": ...}
inline ToolResult error_result(const std::string& error, const std::string& suggestion) {
    nlohmann::json j = {{"error", error}, {"suggestion", suggestion}};
    return ToolResult{false, j.dump(2)};
}

inline const char* suggestion_for(AccessError::Kind kind) {
    switch (kind) {
        case AccessError::Kind::NotFound:         return "Check that the file exists and is readable";
        case AccessError::Kind::PermissionDenied: return "Check the file permissions";
        case AccessError::Kind::DecodeFailed:     return "The file may be binary or use an unsupported encoding";
        case AccessError::Kind::Io:               return "Check that the path is a regular, readable file";
        case AccessError::Kind::WriteFailed:      return "Check that the file and its directory are writable";
    }
    return "Check that the file exists and is readable";
}

inline const char* suggestion_for(SearchError::Kind kind) {
    switch (kind) {
        case SearchError::Kind::Unreadable:         return "Check that the file exists and is readable";
        case SearchError::Kind::MatcherUnavailable: return "Retry with fuzzy set to false";
        case SearchError::Kind::InvalidPattern:     return "Provide a non-empty search pattern";
        case SearchError::Kind::NoMatch:            return "Use search with fuzzy matching to locate similar lines";
    }
    return "Check the search pattern";
}

inline const char* suggestion_for(EditError::Kind kind) {
    switch (kind) {
        case EditError::Kind::InvalidArgument: return "Check search_text and replace_text";
        case EditError::Kind::NoTarget:        return "Disable fuzzy matching or adjust the search text";
        case EditError::Kind::BackupFailed:    return "Check that the backup directory is writable";
        case EditError::Kind::WriteFailed:     return "Check that the file is writable";
    }
    return "Check the edit arguments";
}

// Run body, reporting every error family as a structured failure.
template <typename Body>
ToolResult run_tool(Body&& body) {
    try {
        return body();
    } catch (const AccessError& e) {
        return error_result(std::string("File access failed: ") + e.what(), suggestion_for(e.kind()));
    } catch (const SearchError& e) {
        return error_result(std::string("Search failed: ") + e.what(), suggestion_for(e.kind()));
    } catch (const EditError& e) {
        return error_result(std::string("Edit failed: ") + e.what(), suggestion_for(e.kind()));
    } catch (const std::invalid_argument& e) {
        return error_result(std::string("Invalid argument: ") + e.what(),
                            "Check the tool arguments");
    } catch (const std::exception& e) {
        return error_result(std::string("Unexpected error: ") + e.what(),
                            "Report the error with the file that triggered it");
    }
}

} // namespace largefile
