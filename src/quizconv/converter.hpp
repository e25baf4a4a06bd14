#pragma once

#include <optional>
#include <string>

#include "quizconv/annotations.hpp"
#include "quizconv/errors.hpp"

namespace quizconv {

enum class Format { kMarkdown, kPlaintext };

struct ConverterConfig {
  bool collect_all_errors = false;
  int json_indent = 2;
};

ConverterConfig LoadConverterConfig();

std::string FormatName(Format format);

// ".md" and ".markdown" are Markdown; everything else is plaintext.
Format FormatFromPath(const std::string& path);

Result<ParsedQuiz> Read(Format format, const std::string& content);
std::string Write(Format format, const Quiz& quiz, const Annotations& annotations);

// Read, then validate. With collect_all_errors every violation is reported.
Result<ParsedQuiz> Load(Format format, const std::string& content,
                        const ConverterConfig& config);

// Read, validate, write. No output is produced when any step fails.
Result<std::string> Convert(const std::string& content, Format from, Format to,
                            const ConverterConfig& config);

}  // namespace quizconv
