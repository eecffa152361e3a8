#include <quire/xmldoc/document_holder.h>
#include <quire/markup/libxml_parser.h>
#include <quire/core/config.h>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace quire;
using xmldoc::DocumentHolder;

namespace {

std::shared_ptr<const dom::Document> parse(const std::string& text,
                                           markup::MediaType type = markup::MediaType::ApplicationXml) {
    markup::LibxmlParser parser;
    return std::shared_ptr<const dom::Document>(parser.parse_from_string(text, type));
}

std::vector<const dom::Element*> elements_in_order(const dom::Element& root) {
    std::vector<const dom::Element*> result{&root};
    for (const dom::Element* child : root.element_children()) {
        auto sub = elements_in_order(*child);
        result.insert(result.end(), sub.begin(), sub.end());
    }
    return result;
}

const dom::Element* by_id(DocumentHolder& holder, const std::string& id) {
    return holder.get_element("#" + id);
}

// <a><b/>hello<c id="c">xy</c></a>
//  a=0  b=1  "hello"=2..6  c=7  "xy"=8..9  total=10
constexpr const char kSmall[] = "<a><b id=\"b\"/>hello<c id=\"c\">xy</c></a>";

} // namespace

// ---------------------------------------------------------------------------
// 1. Construction
// ---------------------------------------------------------------------------
TEST(DocumentHolderTest, RejectsDocumentWithoutRoot) {
    auto empty = std::make_shared<const dom::Document>();
    EXPECT_THROW(DocumentHolder("x.xml", empty), std::invalid_argument);
    EXPECT_THROW(DocumentHolder("x.xml", nullptr), std::invalid_argument);
}

TEST(DocumentHolderTest, XhtmlRootExposesHeadBodyAndLang) {
    DocumentHolder holder("ch1.xhtml", parse(
        "<html xmlns=\"http://www.w3.org/1999/xhtml\" lang=\"fr\">"
        "<head><title>t</title></head><body><p>x</p></body></html>",
        markup::MediaType::ApplicationXhtmlXml));
    ASSERT_NE(holder.head(), nullptr);
    ASSERT_NE(holder.body(), nullptr);
    EXPECT_EQ(holder.head()->local_name(), "head");
    EXPECT_EQ(holder.body()->local_name(), "body");
    ASSERT_TRUE(holder.lang().has_value());
    EXPECT_EQ(*holder.lang(), "fr");
    EXPECT_EQ(holder.url(), "ch1.xhtml");
}

TEST(DocumentHolderTest, NonXhtmlRootHasNoHeadOrBody) {
    DocumentHolder holder("ch1.xml", parse("<html lang=\"fr\"><head/><body/></html>"));
    EXPECT_EQ(holder.head(), nullptr);
    EXPECT_EQ(holder.body(), nullptr);
    EXPECT_FALSE(holder.lang().has_value());
    EXPECT_EQ(holder.root()->local_name(), "html");
}

TEST(DocumentHolderTest, DocListWrapsDocumentNode) {
    DocumentHolder holder("a.xml", parse(kSmall));
    auto list = holder.doc();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list.nodes()[0], &holder.document());
    EXPECT_EQ(list.child("a").size(), 1u);
}

// ---------------------------------------------------------------------------
// 2. Element offsets
// ---------------------------------------------------------------------------
TEST(DocumentHolderTest, ElementOffsetsFollowDocumentOrder) {
    DocumentHolder holder("a.xml", parse(kSmall));
    EXPECT_EQ(holder.get_element_offset(*holder.root()), 0u);
    EXPECT_EQ(holder.get_element_offset(*by_id(holder, "b")), 1u);
    EXPECT_EQ(holder.get_element_offset(*by_id(holder, "c")), 7u);
}

TEST(DocumentHolderTest, OffsetsAreIdempotentInAnyQueryOrder) {
    DocumentHolder forward("a.xml", parse(kSmall));
    DocumentHolder backward("a.xml", parse(kSmall));

    auto fwd = elements_in_order(*forward.root());
    auto bwd = elements_in_order(*backward.root());
    std::vector<size_t> expected;
    for (const dom::Element* e : fwd) {
        expected.push_back(forward.get_element_offset(*e));
    }
    for (size_t i = bwd.size(); i-- > 0;) {
        EXPECT_EQ(backward.get_element_offset(*bwd[i]), expected[i]);
    }
    for (size_t i = 0; i < fwd.size(); ++i) {
        EXPECT_EQ(forward.get_element_offset(*fwd[i]), expected[i]);
    }
}

TEST(DocumentHolderTest, OffsetsStrictlyIncreaseInDocumentOrder) {
    DocumentHolder holder("book.xml", parse(
        "<book><ch><t>One</t><p>aaa</p><p>bb<i>c</i>d</p></ch>"
        "<ch><t>Two</t><!--skip--><p/><p>é😀</p></ch></book>"));
    auto order = elements_in_order(*holder.root());
    ASSERT_GT(order.size(), 5u);
    size_t previous = holder.get_element_offset(*order[0]);
    EXPECT_EQ(previous, 0u);
    for (size_t i = 1; i < order.size(); ++i) {
        size_t offset = holder.get_element_offset(*order[i]);
        EXPECT_GT(offset, previous);
        previous = offset;
    }
}

TEST(DocumentHolderTest, CommentsCountAsText) {
    DocumentHolder holder("a.xml", parse("<r><!--1234--><e id=\"e\"/></r>"));
    EXPECT_EQ(holder.get_element_offset(*by_id(holder, "e")), 5u);
}

TEST(DocumentHolderTest, ProcessingInstructionDataCountsAsText) {
    // r=0  "abcd"=1..4  e=5
    DocumentHolder holder("a.xml", parse("<r><?pi abcd?><e id=\"e\"/></r>"));
    EXPECT_EQ(holder.get_element_offset(*by_id(holder, "e")), 5u);
    EXPECT_EQ(holder.get_total_offset(), 6u);
}

TEST(DocumentHolderTest, CharacterLengthCountsUtf16Units) {
    EXPECT_EQ(xmldoc::character_length(""), 0u);
    EXPECT_EQ(xmldoc::character_length("abc"), 3u);
    EXPECT_EQ(xmldoc::character_length("\xC3\xA9"), 1u);           // é
    EXPECT_EQ(xmldoc::character_length("\xE2\x82\xAC"), 1u);       // €
    EXPECT_EQ(xmldoc::character_length("\xF0\x9F\x98\x80"), 2u);   // U+1F600
}

TEST(DocumentHolderTest, ForeignElementThrows) {
    DocumentHolder holder("a.xml", parse(kSmall));
    auto other = parse(kSmall);
    const dom::Element* stranger = other->document_element()->first_element_child();
    EXPECT_THROW(holder.get_element_offset(*stranger), xmldoc::OffsetTraversalError);
    // The holder stays usable afterwards
    EXPECT_EQ(holder.get_element_offset(*by_id(holder, "c")), 7u);
}

// ---------------------------------------------------------------------------
// 3. Node offsets
// ---------------------------------------------------------------------------
TEST(DocumentHolderTest, TextNodeOffsets) {
    DocumentHolder holder("a.xml", parse(kSmall));
    const dom::Node* hello = by_id(holder, "b")->next_sibling();
    ASSERT_NE(hello, nullptr);
    ASSERT_EQ(hello->node_type(), dom::NodeType::Text);
    EXPECT_EQ(holder.get_node_offset(*hello, 0, false), 2u);
    EXPECT_EQ(holder.get_node_offset(*hello, 3, false), 5u);

    // First child text counts from its parent
    const dom::Node* xy = by_id(holder, "c")->first_child();
    EXPECT_EQ(holder.get_node_offset(*xy, 0, false), 8u);
    EXPECT_EQ(holder.get_node_offset(*xy, 1, false), 9u);
}

TEST(DocumentHolderTest, ElementNodeOffsetWithoutAfterIsElementOffset) {
    DocumentHolder holder("a.xml", parse(kSmall));
    const dom::Element* c = by_id(holder, "c");
    EXPECT_EQ(holder.get_node_offset(*c, 0, false), 7u);
}

TEST(DocumentHolderTest, AfterOnElementWithoutChildren) {
    DocumentHolder holder("a.xml", parse(kSmall));
    const dom::Element* b = by_id(holder, "b");
    EXPECT_EQ(holder.get_node_offset(*b, 0, true), 2u);
}

TEST(DocumentHolderTest, AfterOnElementWhoseLastChildIsEmpty) {
    // <r><p>ab<q/></p><s/></r>  r=0 p=1 "ab"=2..3 q=4 s=5
    DocumentHolder holder("a.xml", parse("<r><p id=\"p\">ab<q id=\"q\"/></p><s id=\"s\"/></r>"));
    const dom::Element* p = by_id(holder, "p");
    const dom::Element* q = by_id(holder, "q");
    EXPECT_EQ(holder.get_node_offset(*q, 0, true), 5u);
    EXPECT_EQ(holder.get_node_offset(*p, 0, true), 5u);
    EXPECT_EQ(holder.get_element_offset(*by_id(holder, "s")), 5u);
}

TEST(DocumentHolderTest, AfterOnElementEndingInText) {
    DocumentHolder holder("a.xml", parse(kSmall));
    const dom::Element* c = by_id(holder, "c");
    EXPECT_EQ(holder.get_node_offset(*c, 0, true), 10u);
}

TEST(DocumentHolderTest, TotalOffsetIsOnePlusContentLength) {
    DocumentHolder holder("a.xml", parse(kSmall));
    // b(1) + hello(5) + c(1) + xy(2)
    EXPECT_EQ(holder.get_total_offset(), 10u);
    EXPECT_EQ(holder.get_total_offset(), 10u);

    DocumentHolder lone("b.xml", parse("<only/>"));
    EXPECT_EQ(lone.get_total_offset(), 1u);
}

TEST(DocumentHolderTest, TotalOffsetBoundsEveryElement) {
    DocumentHolder holder("book.xml", parse(
        "<book><ch><t>One</t><p>aaa</p></ch><ch><t>Two</t><p/></ch></book>"));
    size_t total = holder.get_total_offset();
    for (const dom::Element* e : elements_in_order(*holder.root())) {
        EXPECT_LT(holder.get_element_offset(*e), total);
    }
}

// ---------------------------------------------------------------------------
// 4. Reverse lookup
// ---------------------------------------------------------------------------
TEST(DocumentHolderTest, NodeByOffsetZeroIsRoot) {
    DocumentHolder holder("a.xml", parse(kSmall));
    EXPECT_EQ(holder.get_node_by_offset(0), holder.root());
}

TEST(DocumentHolderTest, NodeByOffsetRoundTripsElements) {
    DocumentHolder holder("book.xml", parse(
        "<book><ch><t>One</t><p>aaa</p><p>bb<i>c</i>d</p></ch><ch><t>Two</t><p/></ch></book>"));
    for (const dom::Element* e : elements_in_order(*holder.root())) {
        EXPECT_EQ(holder.get_node_by_offset(holder.get_element_offset(*e)), e);
    }
}

TEST(DocumentHolderTest, NodeByOffsetInsideText) {
    DocumentHolder holder("a.xml", parse(kSmall));
    const dom::Node* hello = by_id(holder, "b")->next_sibling();
    EXPECT_EQ(holder.get_node_by_offset(3), hello);
    EXPECT_EQ(holder.get_node_by_offset(6), hello);
    EXPECT_EQ(holder.get_node_by_offset(7), by_id(holder, "c"));
    EXPECT_EQ(holder.get_node_by_offset(9), by_id(holder, "c")->first_child());
}

TEST(DocumentHolderTest, NodeByOffsetPastEndIsLastNode) {
    DocumentHolder holder("a.xml", parse(kSmall));
    EXPECT_EQ(holder.get_node_by_offset(1000), by_id(holder, "c")->first_child());
}

TEST(DocumentHolderTest, WhitespaceBeforeElementResolvesToElement) {
    DocumentHolder holder("a.xml", parse("<r><a id=\"a\"/>   <b id=\"b\"/></r>"));
    // r=0 a=1 "   "=2..4 b=5
    EXPECT_EQ(holder.get_element_offset(*by_id(holder, "b")), 5u);
    EXPECT_EQ(holder.get_node_by_offset(3), by_id(holder, "b"));
}

TEST(DocumentHolderTest, NonAsciiSpaceBeforeElementResolvesToElement) {
    // r=0 a=1 NBSP=2 b=3
    DocumentHolder holder("a.xml", parse("<r><a id=\"a\"/>\xC2\xA0<b id=\"b\"/></r>"));
    EXPECT_EQ(holder.get_element_offset(*by_id(holder, "b")), 3u);
    EXPECT_EQ(holder.get_node_by_offset(2), by_id(holder, "b"));

    // U+3000 ideographic space and U+FEFF count the same way
    DocumentHolder wide("w.xml", parse("<r><a/>\xE3\x80\x80\xEF\xBB\xBF<b id=\"b\"/></r>"));
    EXPECT_EQ(wide.get_node_by_offset(3), by_id(wide, "b"));
}

TEST(DocumentHolderTest, NonSpaceTextBeforeElementStaysText) {
    // U+00E9 is not whitespace: the text node itself is found
    DocumentHolder holder("a.xml", parse("<r><a/>\xC3\xA9<b id=\"b\"/></r>"));
    const dom::Node* node = holder.get_node_by_offset(2);
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->node_type(), dom::NodeType::Text);
}

TEST(DocumentHolderTest, NodeByOffsetMatchesTextNodeOffsets) {
    DocumentHolder holder("a.xml", parse("<r><p>first</p><p>second <em>third</em> fourth</p></r>"));
    std::vector<const dom::Node*> texts;
    std::vector<const dom::Node*> stack{holder.root()};
    while (!stack.empty()) {
        const dom::Node* node = stack.back();
        stack.pop_back();
        if (node->node_type() == dom::NodeType::Text) {
            texts.push_back(node);
        }
        for (const dom::Node* c = node->last_child(); c; c = c->previous_sibling()) {
            stack.push_back(c);
        }
    }
    ASSERT_EQ(texts.size(), 4u);
    for (const dom::Node* text : texts) {
        EXPECT_EQ(holder.get_node_by_offset(holder.get_node_offset(*text, 1, false)), text);
    }
}

// ---------------------------------------------------------------------------
// 5. Identifier resolution
// ---------------------------------------------------------------------------
TEST(DocumentHolderTest, GetElementByPlainIdAndXmlId) {
    DocumentHolder holder("doc.xml", parse("<r><a id=\"foo\"/><b xml:id=\"bar\"/></r>"));
    const dom::Element* foo = holder.get_element("#foo");
    const dom::Element* bar = holder.get_element("#bar");
    ASSERT_NE(foo, nullptr);
    ASSERT_NE(bar, nullptr);
    EXPECT_EQ(foo->local_name(), "a");
    EXPECT_EQ(bar->local_name(), "b");
    EXPECT_EQ(holder.get_element("doc.xml#bar"), bar);
}

TEST(DocumentHolderTest, DuplicateIdsPreferDocumentOrder) {
    DocumentHolder holder("doc.xml", parse(
        "<r><a xml:id=\"dup\"/><b id=\"dup\"/><c id=\"dup\"/></r>"));
    const dom::Element* found = holder.get_element("#dup");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->local_name(), "a");
}

TEST(DocumentHolderTest, ForeignUrlAndMissingFragmentReturnNull) {
    DocumentHolder holder("doc.xml", parse("<r><a id=\"foo\"/></r>"));
    EXPECT_EQ(holder.get_element("other.xml#foo"), nullptr);
    EXPECT_EQ(holder.get_element("doc.xml"), nullptr);
    EXPECT_EQ(holder.get_element("#"), nullptr);
    EXPECT_EQ(holder.get_element("#nope"), nullptr);
    EXPECT_EQ(holder.get_element(""), nullptr);
}

TEST(DocumentHolderTest, FallbackIndexCoversHandBuiltTrees) {
    // Nothing registered natively: only the lazy index can answer
    auto doc = std::make_shared<dom::Document>();
    auto& root = static_cast<dom::Element&>(doc->append_child(doc->create_element("r")));
    auto& first = static_cast<dom::Element&>(root.append_child(doc->create_element("x")));
    first.set_attribute_ns(core::config::kXmlNamespace, "xml:id", "k");
    auto& second = static_cast<dom::Element&>(root.append_child(doc->create_element("y")));
    second.set_attribute("id", "k");
    auto& third = static_cast<dom::Element&>(root.append_child(doc->create_element("z")));
    third.set_attribute("id", "z");

    DocumentHolder holder("h.xml", doc);
    EXPECT_EQ(holder.get_element("#k"), &first);
    EXPECT_EQ(holder.get_element("#z"), &third);
    EXPECT_EQ(holder.get_element("#k"), &first);
}

TEST(DocumentHolderTest, HtmlNameLookup) {
    DocumentHolder holder("page.html", parse(
        "<html><body><a name=\"top\">x</a></body></html>", markup::MediaType::TextHtml));
    const dom::Element* top = holder.get_element("#top");
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->local_name(), "a");
}

// ---------------------------------------------------------------------------
// 6. Concurrency
// ---------------------------------------------------------------------------
TEST(DocumentHolderTest, ConcurrentQueriesAgree) {
    std::string text = "<r>";
    for (int i = 0; i < 200; ++i) {
        text += "<p id=\"p" + std::to_string(i) + "\">text " + std::to_string(i) + "</p>";
    }
    text += "</r>";

    DocumentHolder reference("r.xml", parse(text));
    std::vector<size_t> expected;
    for (int i = 0; i < 200; ++i) {
        expected.push_back(reference.get_element_offset(*by_id(reference, "p" + std::to_string(i))));
    }

    DocumentHolder holder("r.xml", parse(text));
    std::vector<std::thread> threads;
    std::vector<int> mismatches(4, 0);
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&holder, &expected, &mismatches, t]() {
            for (int n = 0; n < 200; ++n) {
                int i = (t % 2 == 0) ? n : 199 - n;
                const dom::Element* e = by_id(holder, "p" + std::to_string(i));
                if (!e || holder.get_element_offset(*e) != expected[i] ||
                    holder.get_node_by_offset(expected[i]) != e) {
                    ++mismatches[t];
                }
            }
            holder.get_total_offset();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int count : mismatches) {
        EXPECT_EQ(count, 0);
    }
    EXPECT_EQ(holder.get_total_offset(), reference.get_total_offset());
}
