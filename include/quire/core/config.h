#pragma once
#include <cstddef>

namespace quire::core::config {

inline constexpr const char kVersionString[] = "quire 0.1.0";

// Namespace URIs
inline constexpr const char kXhtmlNamespace[] = "http://www.w3.org/1999/xhtml";
inline constexpr const char kXmlNamespace[] = "http://www.w3.org/XML/1998/namespace";
inline constexpr const char kSvgNamespace[] = "http://www.w3.org/2000/svg";
inline constexpr const char kMathMlNamespace[] = "http://www.w3.org/1998/Math/MathML";

// Element the markup parser emits in place of (or inside) a malformed document
inline constexpr const char kParserErrorTag[] = "parsererror";
inline constexpr const char kParserErrorNamespace[] =
    "http://www.mozilla.org/newlayout/xml/parsererror.xml";

// Events a DiagnosticEmitter retains before dropping the oldest
inline constexpr std::size_t kDefaultDiagnosticCapacity = 4096;

// Worker threads backing DocumentStore::load_async
inline constexpr std::size_t kDefaultLoaderThreads = 2;

} // namespace quire::core::config
