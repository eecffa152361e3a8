#pragma once
#include <quire/dom/document.h>
#include <quire/xmldoc/node_list.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace quire::xmldoc {

// A node handed to the offset queries is not part of the holder's tree.
class OffsetTraversalError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Length of `text` in offset units (UTF-16 code units of the UTF-8 input)
size_t character_length(std::string_view text);

// Wraps one parsed document and answers positional queries against it.
//
// Offsets linearize the tree in document order: an element occupies one
// unit, a text or comment node as many units as it has characters, and the
// root element sits at 0. They are computed lazily by a forward cursor
// that remembers where the previous query stopped, so a front-to-back scan
// costs one walk over the tree in total. The element offsets found on the
// way are kept in a side table; the tree itself is never touched.
//
// All queries may be called from several threads; cache updates are
// serialized per holder.
class DocumentHolder {
public:
    // Throws std::invalid_argument if the document has no document element
    DocumentHolder(std::string url, std::shared_ptr<const dom::Document> document);

    const std::string& url() const { return url_; }
    const dom::Document& document() const { return *document_; }
    const std::shared_ptr<const dom::Document>& shared_document() const { return document_; }

    const dom::Element* root() const { return root_; }
    // Set only for documents whose root is in the XHTML namespace
    const dom::Element* head() const { return head_; }
    const dom::Element* body() const { return body_; }
    const std::optional<std::string>& lang() const { return lang_; }

    // The document node as a one-element list, for tree queries
    NodeList doc() const;

    size_t get_element_offset(const dom::Element& element);

    // Offset of a point in the document. For an element: its own offset, or
    // with `after` the offset just past its subtree. For a text or comment
    // node: the offset of character `offset_in_node` within it.
    size_t get_node_offset(const dom::Node& node, size_t offset_in_node, bool after);

    // Offset just past the root element
    size_t get_total_offset();

    // Last node whose offset is not greater than `offset`. Never null.
    const dom::Node* get_node_by_offset(size_t offset);

    // Resolves "#id" or "url#id". Returns nullptr for references without a
    // fragment, for other documents' URLs and for unknown ids.
    const dom::Element* get_element(std::string_view reference);

private:
    size_t element_offset_locked(const dom::Element& element);
    size_t node_offset_locked(const dom::Node& node, size_t offset_in_node, bool after);
    void build_id_index_locked();

    std::string url_;
    std::shared_ptr<const dom::Document> document_;
    const dom::Element* root_ = nullptr;
    const dom::Element* head_ = nullptr;
    const dom::Element* body_ = nullptr;
    std::optional<std::string> lang_;

    std::mutex mutex_;
    const dom::Node* last_visited_ = nullptr;
    size_t last_offset_ = 1;  // offset the cursor assigns to the next node
    std::optional<size_t> total_offset_;
    std::unordered_map<const dom::Element*, size_t> element_offsets_;
    std::optional<std::unordered_map<std::string, const dom::Element*>> id_index_;
};

} // namespace quire::xmldoc
