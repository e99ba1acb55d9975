#include <ganttgen/io/chart_loader.hpp>
#include <ganttgen/io/error.hpp>
#include <ganttgen/core/calendar.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace ganttgen::io {

namespace {

using namespace ganttgen::core;

constexpr unsigned PARSE_FLAGS =
    rapidjson::kParseCommentsFlag | rapidjson::kParseTrailingCommasFlag | rapidjson::kParseValidateEncodingFlag;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

// Optional members: absent and null are the same
const rapidjson::Value* find_optional(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    return &it->value;
}

ScheduleItem parse_item(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("item must be an object", ctx);
    }

    ScheduleItem item;
    item.title = get_string(obj, "title", ctx);

    if (const auto* duration = find_optional(obj, "duration")) {
        if (!duration->IsInt64()) {
            throw LoaderError("field 'duration' must be an integer", ctx);
        }
        if (duration->GetInt64() < 0) {
            throw LoaderError("field 'duration' must be non-negative", ctx);
        }
        if (duration->GetInt64() > MAX_SPAN_DAYS) {
            throw LoaderError("field 'duration' exceeds " + std::to_string(MAX_SPAN_DAYS) + " days", ctx);
        }
        item.duration = duration->GetInt64();
    }

    if (const auto* start = find_optional(obj, "startDate")) {
        if (!start->IsString()) {
            throw LoaderError("field 'startDate' must be a string", ctx);
        }
        std::string_view text{start->GetString(), start->GetStringLength()};
        auto parsed = parse_date_time(text);
        if (!parsed) {
            throw LoaderError("field 'startDate' is not a valid date and time: '" + std::string(text) + "'", ctx);
        }
        item.start = *parsed;
    }

    if (const auto* resource = find_optional(obj, "resource")) {
        if (!resource->IsInt64()) {
            throw LoaderError("field 'resource' must be an integer", ctx);
        }
        if (resource->GetInt64() < 0) {
            throw LoaderError("field 'resource' must be non-negative", ctx);
        }
        item.resource = static_cast<std::size_t>(resource->GetInt64());
    }

    if (const auto* open = find_optional(obj, "open")) {
        if (!open->IsBool()) {
            throw LoaderError("field 'open' must be a boolean", ctx);
        }
        item.open = open->GetBool();
    }

    return item;
}

void parse_chart_impl(Chart& result, const rapidjson::Document& doc) {
    result.title = get_string(doc, "title", "chart");

    if (const auto* marked = find_optional(doc, "markedDate")) {
        if (!marked->IsString()) {
            throw LoaderError("field 'markedDate' must be a string", "chart");
        }
        std::string_view text{marked->GetString(), marked->GetStringLength()};
        auto parsed = parse_date(text);
        if (!parsed) {
            throw LoaderError("field 'markedDate' is not a valid date: '" + std::string(text) + "'", "chart");
        }
        result.marked_date = *parsed;
    }

    const auto& resources = get_array(doc, "resources", "chart");
    for (rapidjson::SizeType ridx = 0; ridx < resources.Size(); ++ridx) {
        const auto& name = resources[ridx];
        if (!name.IsString()) {
            throw LoaderError("resource name must be a string", "resources[" + std::to_string(ridx) + "]");
        }
        result.resources.emplace_back(name.GetString(), name.GetStringLength());
    }

    const auto& items = get_array(doc, "items", "chart");
    result.items.reserve(items.Size());
    for (rapidjson::SizeType idx = 0; idx < items.Size(); ++idx) {
        result.items.push_back(parse_item(items[idx], "items[" + std::to_string(idx) + "]"));
    }
}

} // anonymous namespace

core::Chart load_chart(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }
    return load_chart_from_stream(file);
}

core::Chart load_chart_from_stream(std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();
    return load_chart_from_string(oss.str());
}

core::Chart load_chart_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse<PARSE_FLAGS>(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "chart");
    }

    core::Chart result;
    parse_chart_impl(result, doc);
    return result;
}

} // namespace ganttgen::io
