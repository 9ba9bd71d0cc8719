/**
 * @file CollectionSerializer.cpp
 * @brief Implementation of CollectionSerializer.
 */

#include "infrastructure/CollectionSerializer.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

namespace iconforge::infrastructure {

using json = nlohmann::ordered_json;

namespace {

json NumberValue(double value) {
    double whole = 0.0;
    if (std::modf(value, &whole) == 0.0 && std::fabs(whole) < 9.0e15) {
        return static_cast<std::int64_t>(whole);
    }
    return value;
}

json RecordValue(const domain::CollectionRecord& record) {
    json j = json::object();
    j["prefix"] = record.prefix;

    json icons = json::object();
    for (const auto& [name, entry] : record.icons) {
        json icon = {{"body", entry.body}};
        if (entry.left) icon["left"] = NumberValue(*entry.left);
        if (entry.top) icon["top"] = NumberValue(*entry.top);
        if (entry.width) icon["width"] = NumberValue(*entry.width);
        if (entry.height) icon["height"] = NumberValue(*entry.height);
        icons[name] = icon;
    }
    j["icons"] = icons;

    if (!record.aliases.empty()) {
        json aliases = json::object();
        for (const auto& [name, alias] : record.aliases) {
            aliases[name] = {{"parent", alias.parent}};
        }
        j["aliases"] = aliases;
    }

    j["lastModified"] = record.lastModified;
    if (record.width) j["width"] = NumberValue(*record.width);
    if (record.height) j["height"] = NumberValue(*record.height);
    return j;
}

std::optional<double> OptionalNumber(const json& object, const char* key, const std::string& context) {
    if (!object.contains(key)) return std::nullopt;
    const json& value = object.at(key);
    if (!value.is_number()) {
        throw CollectionFormatError(context + ": \"" + key + "\" must be a number");
    }
    return value.get<double>();
}

} // namespace

std::string CollectionSerializer::ToJson(const domain::CollectionRecord& record, int indent) {
    return RecordValue(record).dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string CollectionSerializer::ToJson(const std::map<std::string, domain::CollectionRecord>& records, int indent) {
    json j = json::object();
    for (const auto& [key, record] : records) {
        j[key] = RecordValue(record);
    }
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

domain::CollectionRecord CollectionSerializer::FromJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw CollectionFormatError(std::string("Invalid JSON: ") + e.what());
    }

    if (!j.is_object()) throw CollectionFormatError("Collection must be a JSON object");
    if (!j.contains("icons") || !j.at("icons").is_object()) {
        throw CollectionFormatError("Collection has no \"icons\" object");
    }

    domain::CollectionRecord record;
    if (j.contains("prefix")) {
        if (!j.at("prefix").is_string()) throw CollectionFormatError("\"prefix\" must be a string");
        record.prefix = j.at("prefix").get<std::string>();
    }
    if (j.contains("lastModified")) {
        if (!j.at("lastModified").is_number()) throw CollectionFormatError("\"lastModified\" must be a number");
        record.lastModified = static_cast<std::int64_t>(j.at("lastModified").get<double>());
    }
    record.width = OptionalNumber(j, "width", "Collection");
    record.height = OptionalNumber(j, "height", "Collection");

    for (auto it = j.at("icons").begin(); it != j.at("icons").end(); ++it) {
        const std::string context = "Icon \"" + it.key() + "\"";
        const json& value = it.value();
        if (!value.is_object() || !value.contains("body") || !value.at("body").is_string()) {
            throw CollectionFormatError(context + " has no string \"body\"");
        }
        domain::IconEntry entry;
        entry.body = value.at("body").get<std::string>();
        entry.left = OptionalNumber(value, "left", context);
        entry.top = OptionalNumber(value, "top", context);
        entry.width = OptionalNumber(value, "width", context);
        entry.height = OptionalNumber(value, "height", context);
        record.icons.emplace(it.key(), std::move(entry));
    }

    if (j.contains("aliases")) {
        if (!j.at("aliases").is_object()) throw CollectionFormatError("\"aliases\" must be an object");
        for (auto it = j.at("aliases").begin(); it != j.at("aliases").end(); ++it) {
            const json& value = it.value();
            if (!value.is_object() || !value.contains("parent") || !value.at("parent").is_string()) {
                throw CollectionFormatError("Alias \"" + it.key() + "\" has no string \"parent\"");
            }
            record.aliases.emplace(it.key(), domain::IconAlias{value.at("parent").get<std::string>()});
        }
    }
    return record;
}

domain::CollectionRecord CollectionSerializer::LoadFile(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw CollectionFormatError("Cannot open \"" + path.string() + "\"");
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return FromJson(text);
}

} // namespace iconforge::infrastructure
