#include "fluffy/core/config.h"
#include "fluffy/core/error.h"
#include "fluffy/processor/tag_processor.h"

#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr const char kProgramName[] = "fluffy_stream";
constexpr std::size_t kDefaultChunkSize = 1;

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " [--tag=NAME]... [--chunk=N] [--threshold=N] [--debug] [input-file]\n"
         << "Reads text (stdin when no file is given), feeds it in N-character\n"
         << "chunks and prints every tag and untagged segment as it completes.\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_size(std::string_view text, std::size_t& value) {
  if (text.empty()) {
    return false;
  }

  std::size_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed == 0) {
    return false;
  }

  value = parsed;
  return true;
}

std::string format_attributes(const fluffy::core::Attributes& attributes) {
  std::string text;
  for (const auto& [name, value] : attributes) {
    text += " " + name + "=\"" + value + "\"";
  }
  return text;
}

bool read_input(const std::string& path, std::string& text) {
  if (path.empty()) {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> tags;
  std::size_t chunk_size = kDefaultChunkSize;
  fluffy::processor::ProcessorOptions options;
  std::string input_path;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (is_help_flag(argument)) {
      print_usage(std::cout);
      return 0;
    }
    if (is_version_flag(argument)) {
      std::cout << fluffy::core::config::kVersionString << "\n";
      return 0;
    }
    if (argument == "--debug") {
      options.debug = true;
      continue;
    }
    if (starts_with(argument, "--tag=")) {
      const std::string_view name = argument.substr(6);
      if (name.empty()) {
        std::cerr << "Invalid --tag: name must not be empty\n";
        print_usage(std::cerr);
        return 1;
      }
      tags.emplace_back(name);
      continue;
    }
    if (starts_with(argument, "--chunk=")) {
      if (!parse_positive_size(argument.substr(8), chunk_size)) {
        std::cerr << "Invalid --chunk: '" << argument << "' (expected a positive integer)\n";
        print_usage(std::cerr);
        return 1;
      }
      continue;
    }
    if (starts_with(argument, "--threshold=")) {
      if (!parse_positive_size(argument.substr(12), options.auto_process_threshold)) {
        std::cerr << "Invalid --threshold: '" << argument << "' (expected a positive integer)\n";
        print_usage(std::cerr);
        return 1;
      }
      continue;
    }
    if (starts_with(argument, "--") || !input_path.empty()) {
      std::cerr << "Unexpected argument: '" << argument << "'\n";
      print_usage(std::cerr);
      return 1;
    }
    input_path = std::string(argument);
  }

  std::string text;
  if (!read_input(input_path, text)) {
    std::cerr << "Cannot read input: " << input_path << "\n";
    return 1;
  }

  options.error_handler = [](const fluffy::core::TagError& error) {
    std::cout << "[error] " << error.format() << "\n";
  };
  // Chunks are fed verbatim, whitespace included.
  options.ignore_blank_tokens = false;

  fluffy::processor::TagProcessor processor(options);
  processor.set_untagged_content_handler([](const std::string& content) {
    std::cout << "[text] " << content << "\n";
  });

  try {
    for (const auto& tag : tags) {
      processor.register_handler(tag,
          [tag](const fluffy::core::Attributes& attributes, const std::string& content) {
            std::cout << "[" << tag << format_attributes(attributes) << "] " << content << "\n";
          });
    }
  } catch (const fluffy::core::TagProcessorError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  for (std::size_t pos = 0; pos < text.size(); pos += chunk_size) {
    processor.process_token(std::string_view(text).substr(pos, chunk_size));
  }
  processor.flush();

  for (const auto& pending : processor.pending_tag_info()) {
    std::cout << "[pending] " << pending.name << " (" << pending.content_length
              << " chars buffered)\n";
  }
  return processor.pending_tag_info().empty() ? 0 : 2;
}
