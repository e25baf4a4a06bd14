#include "quizconv/converter.hpp"

#include <cstdlib>
#include <exception>
#include <utility>
#include <vector>

#include "quizconv/logging.hpp"
#include "quizconv/markdown.hpp"
#include "quizconv/plaintext.hpp"
#include "quizconv/text_util.hpp"
#include "quizconv/validator.hpp"

namespace quizconv {

using logging::LogError;
using logging::LogInfo;
using logging::LogWarn;

ConverterConfig LoadConverterConfig() {
  ConverterConfig config;
  if (const char* collect = std::getenv("QUIZCONV_COLLECT_ALL")) {
    const std::string value = text::ToLower(collect);
    if (value == "1" || value == "true" || value == "yes") {
      config.collect_all_errors = true;
    } else if (value != "0" && value != "false" && value != "no" && !value.empty()) {
      LogWarn("QUIZCONV_COLLECT_ALL is not a boolean, falling back to stopping at the first "
              "error");
    }
  }
  if (const char* indent = std::getenv("QUIZCONV_JSON_INDENT")) {
    try {
      const int parsed = std::stoi(indent);
      if (parsed >= 0 && parsed <= 8) {
        config.json_indent = parsed;
      } else {
        LogWarn("QUIZCONV_JSON_INDENT is outside the valid range 0-8, falling back to default 2");
      }
    } catch (const std::exception& ex) {
      LogWarn(std::string{"Failed to parse QUIZCONV_JSON_INDENT: "} + ex.what());
    }
  }
  return config;
}

std::string FormatName(Format format) {
  return format == Format::kMarkdown ? "Markdown" : "plaintext";
}

Format FormatFromPath(const std::string& path) {
  const std::string lowered = text::ToLower(path);
  if (text::EndsWith(lowered, ".md") || text::EndsWith(lowered, ".markdown")) {
    return Format::kMarkdown;
  }
  return Format::kPlaintext;
}

Result<ParsedQuiz> Read(Format format, const std::string& content) {
  return format == Format::kMarkdown ? markdown::ReadMarkdown(content)
                                     : plaintext::ReadPlaintext(content);
}

std::string Write(Format format, const Quiz& quiz, const Annotations& annotations) {
  return format == Format::kMarkdown ? markdown::WriteMarkdown(quiz, annotations)
                                     : plaintext::WritePlaintext(quiz, annotations);
}

Result<ParsedQuiz> Load(Format format, const std::string& content,
                        const ConverterConfig& config) {
  auto parsed = Read(format, content);
  if (!parsed.ok()) {
    LogError("Failed to read " + FormatName(format) + " quiz: " + parsed.error().Describe());
    return parsed;
  }

  std::vector<ConversionError> violations;
  if (config.collect_all_errors) {
    violations = CollectViolations(parsed.value().quiz);
  } else if (auto violation = Validate(parsed.value().quiz)) {
    violations.push_back(std::move(*violation));
  }
  if (!violations.empty()) {
    LogError("Quiz failed validation with " + std::to_string(violations.size()) +
             " violation(s); first: " + violations.front().Describe());
    return Result<ParsedQuiz>::Failure(std::move(violations));
  }
  return parsed;
}

Result<std::string> Convert(const std::string& content, Format from, Format to,
                            const ConverterConfig& config) {
  auto loaded = Load(from, content, config);
  if (!loaded.ok()) {
    return Result<std::string>::Failure(loaded.errors());
  }
  const ParsedQuiz& parsed = loaded.value();
  std::string output = Write(to, parsed.quiz, parsed.annotations);
  LogInfo("Converted " + FormatName(from) + " to " + FormatName(to) + ": " +
          std::to_string(parsed.quiz.questions.size()) + " question(s), " +
          std::to_string(parsed.annotations.Size()) + " comment(s)");
  return Result<std::string>::Success(std::move(output));
}

}  // namespace quizconv
