#include <quire/core/config.h>
#include <quire/core/diagnostics.h>
#include <quire/dom/document.h>
#include <quire/markup/libxml_parser.h>
#include <quire/net/fetcher.h>
#include <quire/xmldoc/content_resolver.h>

#include <charconv>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr const char kProgramName[] = "quire_inspect";
constexpr std::size_t kSnippetLength = 40;

struct Options {
  std::string path;
  std::optional<std::string> content_type;
  std::optional<std::size_t> offset;
  std::optional<std::string> reference;
  bool list_offsets = false;
  bool verbose = false;
};

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " <path> [--content-type=TYPE] [--offset=N] [--ref=REF]"
            " [--list-offsets] [--verbose]\n";
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

bool parse_offset(std::string_view text, std::size_t& value) {
  if (text.empty()) {
    return false;
  }
  std::size_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end) {
    return false;
  }
  value = parsed;
  return true;
}

// Returns false after reporting the offending argument
bool parse_arguments(int argc, char** argv, Options& options) {
  constexpr std::string_view kContentType = "--content-type=";
  constexpr std::string_view kOffset = "--offset=";
  constexpr std::string_view kRef = "--ref=";

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (starts_with(argument, kContentType)) {
      options.content_type = std::string(argument.substr(kContentType.size()));
    } else if (starts_with(argument, kOffset)) {
      std::size_t offset = 0;
      if (!parse_offset(argument.substr(kOffset.size()), offset)) {
        std::cerr << "Invalid --offset: '" << argument << "'\n";
        return false;
      }
      options.offset = offset;
    } else if (starts_with(argument, kRef)) {
      options.reference = std::string(argument.substr(kRef.size()));
    } else if (argument == "--list-offsets") {
      options.list_offsets = true;
    } else if (argument == "--verbose") {
      options.verbose = true;
    } else if (starts_with(argument, "--")) {
      std::cerr << "Unknown option: '" << argument << "'\n";
      return false;
    } else if (options.path.empty()) {
      options.path = std::string(argument);
    } else {
      std::cerr << "Unexpected argument: '" << argument << "'\n";
      return false;
    }
  }
  if (options.path.empty()) {
    std::cerr << "Missing <path>\n";
    return false;
  }
  return true;
}

std::string describe(const quire::dom::Node& node) {
  using quire::dom::NodeType;
  switch (node.node_type()) {
    case NodeType::Element: {
      const auto& element = static_cast<const quire::dom::Element&>(node);
      std::string text = "<" + element.tag_name() + ">";
      if (!element.namespace_uri().empty()) {
        text += " {" + element.namespace_uri() + "}";
      }
      return text;
    }
    case NodeType::Text:
    case NodeType::Comment: {
      std::string data = node.text_content();
      if (data.size() > kSnippetLength) {
        data = data.substr(0, kSnippetLength) + "...";
      }
      return (node.node_type() == NodeType::Text ? "text \"" : "comment \"") + data + "\"";
    }
    case NodeType::ProcessingInstruction: {
      const auto& pi = static_cast<const quire::dom::ProcessingInstruction&>(node);
      return "<?" + pi.target() + " " + pi.data() + "?>";
    }
    case NodeType::Document:
      return "#document";
  }
  return "?";
}

void list_offsets(quire::xmldoc::DocumentHolder& holder, const quire::dom::Element& element,
                  int depth) {
  std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ')
            << holder.get_element_offset(element) << " " << describe(element) << "\n";
  for (const quire::dom::Element* child : element.element_children()) {
    list_offsets(holder, *child, depth + 1);
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << quire::core::config::kVersionString << "\n";
    return 0;
  }

  Options options;
  if (!parse_arguments(argc, argv, options)) {
    print_usage(std::cerr);
    return 1;
  }

  quire::core::DiagnosticEmitter diagnostics;
  if (options.verbose) {
    diagnostics.add_observer([](const quire::core::DiagnosticEvent& event) {
      std::cerr << quire::core::format_diagnostic(event) << "\n";
    });
  } else {
    diagnostics.set_min_severity(quire::core::Severity::Warning);
  }

  quire::net::FileFetcher fetcher;
  auto response = fetcher.fetch(options.path);
  if (!response) {
    std::cerr << "Unable to read " << options.path << "\n";
    return 2;
  }
  if (options.content_type) {
    response->headers.set("Content-Type", *options.content_type);
  }

  quire::markup::LibxmlParser parser(&diagnostics);
  auto holder = quire::xmldoc::parse_xml_resource(*response, parser, &diagnostics);
  if (!holder) {
    for (const auto& event : diagnostics.events_by_severity(quire::core::Severity::Warning)) {
      std::cerr << quire::core::format_diagnostic(event) << "\n";
    }
    std::cerr << "No usable document in " << options.path << "\n";
    return 2;
  }

  std::cout << "url: " << holder->url() << "\n";
  std::cout << "content-type: " << holder->document().content_type() << "\n";
  std::cout << "root: " << describe(*holder->root()) << "\n";
  if (holder->lang()) {
    std::cout << "lang: " << *holder->lang() << "\n";
  }
  std::cout << "head: " << (holder->head() ? "yes" : "no")
            << ", body: " << (holder->body() ? "yes" : "no") << "\n";
  std::cout << "total offset: " << holder->get_total_offset() << "\n";

  if (options.list_offsets) {
    list_offsets(*holder, *holder->root(), 0);
  }

  if (options.offset) {
    const quire::dom::Node* node = holder->get_node_by_offset(*options.offset);
    std::cout << "offset " << *options.offset << ": " << describe(*node) << "\n";
  }

  if (options.reference) {
    const quire::dom::Element* element = holder->get_element(*options.reference);
    if (!element) {
      std::cout << "ref " << *options.reference << ": not found\n";
      return 3;
    }
    std::cout << "ref " << *options.reference << ": " << describe(*element)
              << " at offset " << holder->get_element_offset(*element) << "\n";
  }
  return 0;
}
