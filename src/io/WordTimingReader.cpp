// Repository: Clipper
// Component: Word Timing Reader Implementation
// Copyright (c) 2026 Clipper

#include "clipper/io/WordTimingReader.hpp"

#include <sstream>

#include "clipper/io/CsvReader.hpp"
#include "clipper/util/JsonFields.hpp"

namespace clipper::io {

WordTimingReader::ReadResult WordTimingReader::Parse(const std::string& json_text) {
  std::vector<std::string> objects;
  if (!util::json::ExtractObjectArray(json_text, "words", objects)) {
    return ReadResult::Failure(PlanError::kMalformedInput,
                               "expected a \"words\" array of objects");
  }

  std::vector<WordTiming> words;
  words.reserve(objects.size());
  for (size_t i = 0; i < objects.size(); ++i) {
    const std::string& obj = objects[i];
    WordTiming w;
    if (!util::json::ExtractString(obj, "word", w.text) &&
        !util::json::ExtractString(obj, "text", w.text)) {
      std::ostringstream detail;
      detail << "word " << i << ": missing \"word\" text";
      return ReadResult::Failure(PlanError::kMalformedInput, detail.str());
    }
    w.text = Trim(w.text);
    if (!util::json::ExtractNumber(obj, "start", w.interval.start) ||
        !util::json::ExtractNumber(obj, "end", w.interval.end)) {
      std::ostringstream detail;
      detail << "word " << i << " '" << w.text << "': missing numeric start/end";
      return ReadResult::Failure(PlanError::kMalformedInput, detail.str());
    }
    words.push_back(std::move(w));
  }

  return ReadResult::Success(std::move(words));
}

WordTimingReader::ReadResult WordTimingReader::ReadFile(const std::string& path) {
  std::string text;
  std::string err;
  if (!ReadTextFile(path, text, &err)) {
    return ReadResult::Failure(PlanError::kMalformedInput, err);
  }
  auto result = Parse(text);
  if (!result.ok) result.detail = path + ": " + result.detail;
  return result;
}

}  // namespace clipper::io
