// File: src/io/json_codec.hpp
#pragma once

#include "core/pattern.hpp"
#include "core/relationship.hpp"
#include "framework/multiplexer.hpp"
#include <json/json.h>
#include <string>
#include <vector>

namespace p3if {

/// JSON encoding of patterns, relationships and framework documents
///
/// Document layout:
///   {
///     "patterns":      [ {id, name, description, type, domain, tags, metadata,
///                         quality_score, validation_status, version,
///                         attributes, created_at, updated_at}, ... ],
///     "relationships": [ {id, property_id, process_id, perspective_id,
///                         strength, confidence, bidirectional, relationship_type,
///                         metadata, created_at, updated_at}, ... ],
///     "framework_metadata": {exported_at, schema_version, pattern_count,
///                            relationship_count}
///   }
///
/// Timestamps are ISO-8601 UTC with microseconds. Decoders throw
/// FrameworkError(PARSE_ERROR) for structural problems; value violations
/// (empty name, score out of range) surface with their own error codes.
namespace json_codec {

/// Schema version written to framework_metadata
inline constexpr const char* kSchemaVersion = "2.0";

// ============================================================================
// Records
// ============================================================================

Json::Value EncodeAttributes(const PatternAttributes& attributes);
PatternAttributes DecodeAttributes(PatternType type, const Json::Value& value);

Json::Value EncodePattern(const Pattern& pattern);
Pattern DecodePattern(const Json::Value& value);

Json::Value EncodeRelationship(const Relationship& relationship);
Relationship DecodeRelationship(const Json::Value& value);

// ============================================================================
// Documents
// ============================================================================

/// Full export document
Json::Value EncodeDocument(const std::vector<Pattern>& patterns,
                           const std::vector<Relationship>& relationships);

/// Decoded contents of an export document
struct Document {
    std::vector<Pattern> patterns;
    std::vector<Relationship> relationships;
    std::string schema_version;
};

/// @throws FrameworkError(PARSE_ERROR) on a malformed document
Document DecodeDocument(const Json::Value& root);

/// External framework input for Multiplexer
///
/// Either {"<dimension>": [pattern...], ..., "relationships": [...]} or the
/// export document layout (patterns grouped by their "type" field).
ExternalFramework DecodeExternalFramework(const Json::Value& root);

// ============================================================================
// Text
// ============================================================================

/// Parse JSON text
/// @throws FrameworkError(PARSE_ERROR) with the reader's message
Json::Value Parse(const std::string& text);

/// Read and parse a JSON file
/// @throws FrameworkError(STORAGE_ERROR) if the file cannot be opened
/// @throws FrameworkError(PARSE_ERROR) on malformed content
Json::Value ParseFile(const std::string& path);

/// Serialize with two-space indentation (or compact)
std::string Write(const Json::Value& value, bool pretty = true);

/// @throws FrameworkError(STORAGE_ERROR) if the file cannot be written
void WriteFile(const std::string& path, const Json::Value& value);

} // namespace json_codec
} // namespace p3if
