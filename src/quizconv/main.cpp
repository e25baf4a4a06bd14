#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "quizconv/converter.hpp"
#include "quizconv/logging.hpp"
#include "quizconv/quiz_json.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
  std::string command;
  std::string input;
  std::string output;
  bool all_errors = false;
};

void PrintUsage(std::ostream& stream) {
  stream << "usage: quizconv <md2txt|txt2md|check|json> <input> [-o <output>] [--all-errors]\n"
         << "  md2txt   convert a Markdown quiz to text2qti plaintext\n"
         << "  txt2md   convert a text2qti plaintext quiz to Markdown\n"
         << "  check    read and validate (format chosen by extension)\n"
         << "  json     print the validated quiz model as JSON\n";
}

bool ParseArguments(int argc, char** argv, CommandLine& command_line) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-o" || arg == "--output") {
      if (i + 1 >= argc) {
        std::cerr << "quizconv: " << arg << " requires a path\n";
        return false;
      }
      command_line.output = argv[++i];
    } else if (arg == "--all-errors") {
      command_line.all_errors = true;
    } else if (arg == "-h" || arg == "--help") {
      return false;
    } else if (!arg.empty() && arg.front() == '-' && arg != "-") {
      std::cerr << "quizconv: unknown option " << arg << "\n";
      return false;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 2) {
    return false;
  }
  command_line.command = positional[0];
  command_line.input = positional[1];
  return command_line.command == "md2txt" || command_line.command == "txt2md" ||
         command_line.command == "check" || command_line.command == "json";
}

bool ReadInput(const std::string& path, std::string& content) {
  if (path == "-") {
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    content = buffer.str();
    return true;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    std::cerr << "quizconv: cannot open " << path << ": " << std::strerror(errno) << "\n";
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  content = buffer.str();
  return true;
}

bool WriteOutput(const std::string& path, const std::string& content) {
  if (path.empty()) {
    std::cout << content;
    std::cout.flush();
    return static_cast<bool>(std::cout);
  }
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    std::cerr << "quizconv: cannot write " << path << ": " << std::strerror(errno) << "\n";
    return false;
  }
  file << content;
  return static_cast<bool>(file);
}

void ReportErrors(const std::string& input, const std::vector<quizconv::ConversionError>& errors) {
  for (const auto& error : errors) {
    std::cerr << input << ":" << error.line << ": " << quizconv::ErrorKindName(error.kind)
              << ": ";
    if (error.question > 0) {
      std::cerr << "question " << error.question << ": ";
    }
    std::cerr << error.message << "\n";
  }
}

int Run(const CommandLine& command_line, const quizconv::ConverterConfig& config) {
  std::string content;
  if (!ReadInput(command_line.input, content)) {
    return kExitFailure;
  }

  if (command_line.command == "md2txt" || command_line.command == "txt2md") {
    const bool to_plaintext = command_line.command == "md2txt";
    const auto from = to_plaintext ? quizconv::Format::kMarkdown : quizconv::Format::kPlaintext;
    const auto to = to_plaintext ? quizconv::Format::kPlaintext : quizconv::Format::kMarkdown;
    const auto result = quizconv::Convert(content, from, to, config);
    if (!result.ok()) {
      ReportErrors(command_line.input, result.errors());
      return kExitFailure;
    }
    return WriteOutput(command_line.output, result.value()) ? kExitOk : kExitFailure;
  }

  const auto format = quizconv::FormatFromPath(command_line.input);
  const auto loaded = quizconv::Load(format, content, config);
  if (!loaded.ok()) {
    ReportErrors(command_line.input, loaded.errors());
    return kExitFailure;
  }
  const auto& quiz = loaded.value().quiz;
  const std::string fingerprint = quizconv::SemanticFingerprint(quiz);

  if (command_line.command == "check") {
    return WriteOutput(command_line.output, "OK " + fingerprint + "\n") ? kExitOk
                                                                        : kExitFailure;
  }
  auto document = quizconv::QuizToJson(quiz);
  document["fingerprint"] = fingerprint;
  return WriteOutput(command_line.output, document.dump(config.json_indent) + "\n")
             ? kExitOk
             : kExitFailure;
}

}  // namespace

int main(int argc, char** argv) {
  quizconv::logging::InitializeFromEnvironment();
  auto config = quizconv::LoadConverterConfig();

  CommandLine command_line;
  if (!ParseArguments(argc, argv, command_line)) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (command_line.all_errors) {
    config.collect_all_errors = true;
  }

  try {
    return Run(command_line, config);
  } catch (const std::exception& ex) {
    quizconv::logging::LogError(std::string{"quizconv terminated with error: "} + ex.what());
    return kExitFailure;
  }
}
