// Repository: Clipper
// Component: JSON Field Extraction
// Purpose: Minimal field extraction for the fixed-schema JSON documents the
//          engine reads (config, word timings, cache index lines).
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_UTIL_JSON_FIELDS_HPP_
#define CLIPPER_UTIL_JSON_FIELDS_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace clipper::util::json {

// Escape for embedding in a JSON string literal.
std::string Escape(const std::string& s);

// Each Extract* finds the first occurrence of "field": in `json` and parses
// the value that follows. Returns false when the field is absent or the value
// has the wrong type; `out` is untouched in that case.
bool ExtractString(const std::string& json, const std::string& field, std::string& out);
bool ExtractNumber(const std::string& json, const std::string& field, double& out);
bool ExtractInt(const std::string& json, const std::string& field, int64_t& out);
bool ExtractBool(const std::string& json, const std::string& field, bool& out);

// "field": { ... } including braces.
bool ExtractObject(const std::string& json, const std::string& field, std::string& out);

// "field": [ "a", "b" ]
bool ExtractStringArray(const std::string& json, const std::string& field,
                        std::vector<std::string>& out);

// "field": [ {...}, {...} ], each element returned with its braces.
bool ExtractObjectArray(const std::string& json, const std::string& field,
                        std::vector<std::string>& out);

// True when `field` appears as a key anywhere in `json`.
bool HasField(const std::string& json, const std::string& field);

}  // namespace clipper::util::json

#endif  // CLIPPER_UTIL_JSON_FIELDS_HPP_
