// File: src/io/json_codec.cpp
#include "io/json_codec.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace p3if {
namespace json_codec {

namespace {

// ============================================================================
// Field Helpers
// ============================================================================

[[noreturn]] void FieldError(const std::string& field, const std::string& expected) {
    throw FrameworkError(ErrorCode::PARSE_ERROR, "Field '" + field + "' must be " + expected);
}

void RequireObject(const Json::Value& value, const std::string& what) {
    if (!value.isObject()) {
        throw FrameworkError(ErrorCode::PARSE_ERROR, what + " must be a JSON object");
    }
}

std::optional<std::string> OptionalString(const Json::Value& object, const char* field) {
    const Json::Value& value = object[field];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        FieldError(field, "a string");
    }
    return value.asString();
}

std::string RequiredString(const Json::Value& object, const char* field) {
    auto value = OptionalString(object, field);
    if (!value) {
        throw FrameworkError(ErrorCode::PARSE_ERROR, std::string("Missing field '") + field + "'");
    }
    return *value;
}

std::string StringOr(const Json::Value& object, const char* field, const std::string& fallback) {
    return OptionalString(object, field).value_or(fallback);
}

double NumberOr(const Json::Value& object, const char* field, double fallback) {
    const Json::Value& value = object[field];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isNumeric()) {
        FieldError(field, "a number");
    }
    return value.asDouble();
}

bool BoolOr(const Json::Value& object, const char* field, bool fallback) {
    const Json::Value& value = object[field];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isBool()) {
        FieldError(field, "a boolean");
    }
    return value.asBool();
}

std::vector<std::string> StringList(const Json::Value& object, const char* field) {
    std::vector<std::string> items;
    const Json::Value& value = object[field];
    if (value.isNull()) {
        return items;
    }
    if (!value.isArray()) {
        FieldError(field, "an array of strings");
    }
    for (const auto& item : value) {
        if (!item.isString()) {
            FieldError(field, "an array of strings");
        }
        items.push_back(item.asString());
    }
    return items;
}

Json::Value ObjectOr(const Json::Value& object, const char* field) {
    const Json::Value& value = object[field];
    if (value.isNull()) {
        return Json::Value(Json::objectValue);
    }
    if (!value.isObject()) {
        FieldError(field, "an object");
    }
    return value;
}

Json::Value EncodeList(const std::vector<std::string>& items) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) {
        array.append(item);
    }
    return array;
}

Json::Value EncodeOptional(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Timestamp DecodeTimestamp(const Json::Value& object, const char* field, Timestamp fallback) {
    auto text = OptionalString(object, field);
    if (!text) {
        return fallback;
    }
    try {
        return Timestamp::FromIso8601(*text);
    } catch (const std::invalid_argument& e) {
        throw FrameworkError(ErrorCode::PARSE_ERROR, std::string("Field '") + field + "': " + e.what());
    }
}

template<typename Enum, typename Parser>
Enum DecodeEnum(const Json::Value& object, const char* field, Enum fallback, Parser parse) {
    auto text = OptionalString(object, field);
    if (!text) {
        return fallback;
    }
    try {
        return parse(*text);
    } catch (const std::invalid_argument& e) {
        throw FrameworkError(ErrorCode::PARSE_ERROR, std::string("Field '") + field + "': " + e.what());
    }
}

const Json::Value& ArrayField(const Json::Value& root, const char* field) {
    const Json::Value& value = root[field];
    if (!value.isNull() && !value.isArray()) {
        FieldError(field, "an array");
    }
    return value;
}

} // namespace

// ============================================================================
// Attributes
// ============================================================================

Json::Value EncodeAttributes(const PatternAttributes& attributes) {
    Json::Value out(Json::objectValue);

    if (const auto* property = std::get_if<PropertyAttributes>(&attributes)) {
        out["data_type"] = property->data_type;
        out["unit"] = property->unit;
        out["category"] = property->category;
        out["priority"] = property->priority;
    } else if (const auto* process = std::get_if<ProcessAttributes>(&attributes)) {
        out["inputs"] = EncodeList(process->inputs);
        out["outputs"] = EncodeList(process->outputs);
        out["duration"] = process->duration;
        out["complexity"] = process->complexity;
        out["automation_level"] = process->automation_level;
    } else if (const auto* perspective = std::get_if<PerspectiveAttributes>(&attributes)) {
        out["viewpoint"] = perspective->viewpoint;
        out["concerns"] = EncodeList(perspective->concerns);
        out["stakeholder_type"] = perspective->stakeholder_type;
        out["scope"] = perspective->scope;
    }

    return out;
}

PatternAttributes DecodeAttributes(PatternType type, const Json::Value& value) {
    if (value.isNull()) {
        return DefaultAttributes(type);
    }
    RequireObject(value, "attributes");

    switch (type) {
        case PatternType::PROCESS: {
            ProcessAttributes process;
            process.inputs = StringList(value, "inputs");
            process.outputs = StringList(value, "outputs");
            process.duration = StringOr(value, "duration", "");
            process.complexity = StringOr(value, "complexity", process.complexity);
            process.automation_level = StringOr(value, "automation_level", process.automation_level);
            return process;
        }
        case PatternType::PERSPECTIVE: {
            PerspectiveAttributes perspective;
            perspective.viewpoint = StringOr(value, "viewpoint", perspective.viewpoint);
            perspective.concerns = StringList(value, "concerns");
            perspective.stakeholder_type = StringOr(value, "stakeholder_type", "");
            perspective.scope = StringOr(value, "scope", perspective.scope);
            return perspective;
        }
        case PatternType::PROPERTY:
        default: {
            PropertyAttributes property;
            property.data_type = StringOr(value, "data_type", "");
            property.unit = StringOr(value, "unit", "");
            property.category = StringOr(value, "category", "");
            property.priority = StringOr(value, "priority", property.priority);
            return property;
        }
    }
}

// ============================================================================
// Pattern
// ============================================================================

Json::Value EncodePattern(const Pattern& pattern) {
    Json::Value out(Json::objectValue);
    out["id"] = pattern.GetId();
    out["name"] = pattern.GetName();
    out["description"] = EncodeOptional(pattern.GetDescription());
    out["type"] = ToString(pattern.GetType());
    out["domain"] = EncodeOptional(pattern.GetDomain());

    Json::Value tags(Json::arrayValue);
    for (const auto& tag : pattern.GetTags()) {
        tags.append(tag);
    }
    out["tags"] = tags;

    out["metadata"] = pattern.GetMetadata();
    out["quality_score"] = pattern.GetQualityScore();
    out["validation_status"] = ToString(pattern.GetValidationStatus());
    out["version"] = pattern.GetVersion();
    out["attributes"] = EncodeAttributes(pattern.GetAttributes());
    out["created_at"] = pattern.GetCreatedAt().ToIso8601();
    out["updated_at"] = pattern.GetUpdatedAt().ToIso8601();
    return out;
}

Pattern DecodePattern(const Json::Value& value) {
    RequireObject(value, "pattern record");

    if (value["type"].isNull()) {
        throw FrameworkError(ErrorCode::PARSE_ERROR, "Missing field 'type'");
    }
    PatternType type = DecodeEnum(value, "type", PatternType::PROPERTY, ParsePatternType);

    std::string name = RequiredString(value, "name");
    auto id = OptionalString(value, "id");
    Pattern pattern = id ? Pattern(*id, type, name) : Pattern(type, name);

    pattern.SetDescription(OptionalString(value, "description"));
    pattern.SetDomain(OptionalString(value, "domain"));
    pattern.SetTags(StringList(value, "tags"));
    pattern.SetMetadata(ObjectOr(value, "metadata"));
    pattern.SetQualityScore(NumberOr(value, "quality_score", 1.0));
    pattern.SetValidationStatus(
        DecodeEnum(value, "validation_status", ValidationStatus::DRAFT, ParseValidationStatus));
    pattern.SetVersion(StringOr(value, "version", "1.0.0"));
    pattern.SetAttributes(DecodeAttributes(type, value["attributes"]));

    Timestamp created_at = DecodeTimestamp(value, "created_at", pattern.GetCreatedAt());
    Timestamp updated_at = DecodeTimestamp(value, "updated_at", created_at);
    pattern.RestoreTimestamps(created_at, updated_at);
    return pattern;
}

// ============================================================================
// Relationship
// ============================================================================

Json::Value EncodeRelationship(const Relationship& relationship) {
    Json::Value out(Json::objectValue);
    out["id"] = relationship.GetId();
    out["property_id"] = EncodeOptional(relationship.GetPropertyId());
    out["process_id"] = EncodeOptional(relationship.GetProcessId());
    out["perspective_id"] = EncodeOptional(relationship.GetPerspectiveId());
    out["strength"] = relationship.GetStrength();
    out["confidence"] = relationship.GetConfidence();
    out["bidirectional"] = relationship.IsBidirectional();
    out["relationship_type"] = relationship.GetRelationshipType();
    out["metadata"] = relationship.GetMetadata();
    out["created_at"] = relationship.GetCreatedAt().ToIso8601();
    out["updated_at"] = relationship.GetUpdatedAt().ToIso8601();
    return out;
}

Relationship DecodeRelationship(const Json::Value& value) {
    RequireObject(value, "relationship record");

    double strength = NumberOr(value, "strength", 0.5);
    double confidence = NumberOr(value, "confidence", 1.0);
    auto id = OptionalString(value, "id");
    Relationship relationship = id ? Relationship(*id, strength, confidence)
                                   : Relationship(strength, confidence);

    relationship.SetPropertyId(OptionalString(value, "property_id"));
    relationship.SetProcessId(OptionalString(value, "process_id"));
    relationship.SetPerspectiveId(OptionalString(value, "perspective_id"));
    relationship.SetBidirectional(BoolOr(value, "bidirectional", true));
    relationship.SetRelationshipType(StringOr(value, "relationship_type", "general"));
    relationship.SetMetadata(ObjectOr(value, "metadata"));

    Timestamp created_at = DecodeTimestamp(value, "created_at", relationship.GetCreatedAt());
    Timestamp updated_at = DecodeTimestamp(value, "updated_at", created_at);
    relationship.RestoreTimestamps(created_at, updated_at);
    return relationship;
}

// ============================================================================
// Documents
// ============================================================================

Json::Value EncodeDocument(const std::vector<Pattern>& patterns,
                           const std::vector<Relationship>& relationships) {
    Json::Value root(Json::objectValue);

    Json::Value pattern_array(Json::arrayValue);
    for (const auto& pattern : patterns) {
        pattern_array.append(EncodePattern(pattern));
    }
    root["patterns"] = pattern_array;

    Json::Value relationship_array(Json::arrayValue);
    for (const auto& relationship : relationships) {
        relationship_array.append(EncodeRelationship(relationship));
    }
    root["relationships"] = relationship_array;

    Json::Value metadata(Json::objectValue);
    metadata["exported_at"] = Timestamp::Now().ToIso8601();
    metadata["schema_version"] = kSchemaVersion;
    metadata["pattern_count"] = static_cast<Json::UInt64>(patterns.size());
    metadata["relationship_count"] = static_cast<Json::UInt64>(relationships.size());
    root["framework_metadata"] = metadata;

    return root;
}

Document DecodeDocument(const Json::Value& root) {
    RequireObject(root, "document");

    Document document;
    for (const auto& record : ArrayField(root, "patterns")) {
        document.patterns.push_back(DecodePattern(record));
    }
    for (const auto& record : ArrayField(root, "relationships")) {
        document.relationships.push_back(DecodeRelationship(record));
    }

    const Json::Value& metadata = root["framework_metadata"];
    if (metadata.isObject()) {
        document.schema_version = StringOr(metadata, "schema_version", "");
    }
    return document;
}

ExternalFramework DecodeExternalFramework(const Json::Value& root) {
    RequireObject(root, "external framework");

    ExternalFramework external;

    auto decode_pattern = [](const Json::Value& record) {
        RequireObject(record, "external pattern");
        ExternalPatternData data;
        data.id = OptionalString(record, "id");
        data.name = StringOr(record, "name", "");
        data.description = OptionalString(record, "description");
        data.domain = OptionalString(record, "domain");
        data.tags = StringList(record, "tags");
        data.metadata = ObjectOr(record, "metadata");
        if (!record["quality_score"].isNull()) {
            data.quality_score = NumberOr(record, "quality_score", 1.0);
        }
        return data;
    };

    for (const auto& key : root.getMemberNames()) {
        if (key == "relationships" || key == "framework_metadata") {
            continue;
        }

        const Json::Value& items = ArrayField(root, key.c_str());
        if (key == "patterns") {
            // Export layout: group by each record's type
            for (const auto& record : items) {
                RequireObject(record, "external pattern");
                std::string dimension = StringOr(record, "type", "");
                external.patterns[dimension].push_back(decode_pattern(record));
            }
            continue;
        }

        auto& bucket = external.patterns[key];
        for (const auto& record : items) {
            bucket.push_back(decode_pattern(record));
        }
    }

    for (const auto& record : ArrayField(root, "relationships")) {
        RequireObject(record, "external relationship");
        ExternalRelationshipData data;
        data.id = OptionalString(record, "id");
        data.property_id = OptionalString(record, "property_id");
        data.process_id = OptionalString(record, "process_id");
        data.perspective_id = OptionalString(record, "perspective_id");
        data.strength = NumberOr(record, "strength", 0.5);
        data.confidence = NumberOr(record, "confidence", 1.0);
        data.bidirectional = BoolOr(record, "bidirectional", true);
        data.relationship_type = StringOr(record, "relationship_type", "general");
        data.metadata = ObjectOr(record, "metadata");
        external.relationships.push_back(std::move(data));
    }

    return external;
}

// ============================================================================
// Text
// ============================================================================

Json::Value Parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw FrameworkError(ErrorCode::PARSE_ERROR, "Malformed JSON: " + errors);
    }
    return root;
}

Json::Value ParseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Parse(buffer.str());
}

std::string Write(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["precision"] = 17;
    return Json::writeString(builder, value);
}

void WriteFile(const std::string& path, const Json::Value& value) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to open file for writing: " + path);
    }
    file << Write(value) << "\n";
    if (!file) {
        throw FrameworkError(ErrorCode::STORAGE_ERROR, "Failed to write file: " + path);
    }
}

} // namespace json_codec
} // namespace p3if
