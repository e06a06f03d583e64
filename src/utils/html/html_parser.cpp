#include "html_parser.hpp"
#include <gumbo.h>
#include <memory>

namespace Clawweb {
namespace Utils {
namespace Html {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const noexcept {
        if (output)
            gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

void collect_links(const GumboNode* node, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE)
        return;

    if (node->v.element.tag == GUMBO_TAG_A) {
        const GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href) {
            links.emplace_back(href->value);
        }
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_links(static_cast<const GumboNode*>(children->data[i]), links);
    }
}

}  // namespace

std::vector<std::string> HtmlParser::extract_links(const std::string& html) {
    std::vector<std::string> links;
    if (html.empty())
        return links;

    std::unique_ptr<GumboOutput, GumboOutputDeleter> output(
        gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output)
        return links;

    collect_links(output->root, links);
    return links;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Clawweb
