#pragma once

#include "core/json_dom.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace rowguard::schema {

enum class DocumentFormat {
  kJson,
  kYaml,
};

// Picks the reader by extension (.json, .yml, .yaml). Other extensions fall
// back to content: a document whose first non-blank character is '{' is JSON.
DocumentFormat DetectDocumentFormat(const std::filesystem::path& path, std::string_view text);

// Parses schema document text into the shared nested mapping.
//
// Contract:
// - YAML plain scalars resolve to null, boolean, number or string the way a
//   YAML 1.1 loader would; quoted scalars always stay strings.
// - Returns false with a line/column diagnostic on syntax errors.
// - Does not judge schema content; that is ValidateSchema's job.
bool ParseSchemaDocument(std::string_view text, DocumentFormat format, core::json::Value& root,
                         std::string& error);

// Reads and parses a schema (or config) document from disk.
bool LoadSchemaDocument(const std::filesystem::path& path, core::json::Value& root,
                        std::string& error);

} // namespace rowguard::schema
