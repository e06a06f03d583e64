#include "fetcher.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/html/html_parser.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Clawweb {
namespace Engine {

using namespace Clawweb::Core;
using namespace Clawweb::Utils;

Fetcher::Fetcher(Network::Http::HttpClient& client, std::string url)
    : client_(client), url_(std::move(url)) {
}

const std::string& Fetcher::url() const {
    return url_;
}

const std::vector<std::string>& Fetcher::links() const {
    return result_.links;
}

std::string Fetcher::media_type(const std::string& content_type) {
    std::string type = content_type.substr(0, content_type.find(';'));
    type             = Text::to_lower(Text::trim(type));
    if (type.empty() || type.find('/') == std::string::npos)
        return Constants::DEFAULT_MIME_TYPE;
    return type;
}

void Fetcher::add_link(std::string link) {
    if (std::find(result_.links.begin(), result_.links.end(), link) != result_.links.end())
        return;
    result_.links.push_back(std::move(link));
}

const FetchResult& Fetcher::fetch() {
    if (fetched_)
        return result_;
    fetched_ = true;

    Logger::info("Fetching: " + url_);
    Response res = client_.get(url_);

    result_.status_code  = res.status_code;
    result_.content_type = res.content_type;

    if (!res.success) {
        result_.kind  = ErrorKind::Transport;
        result_.error = res.error.empty() ? "request failed" : res.error;
        Logger::error(url_ + ": " + result_.error);
        return result_;
    }

    std::string mime = media_type(res.content_type);
    if (mime != Constants::HTML_MIME_TYPE) {
        result_.kind  = ErrorKind::NonHtmlContent;
        result_.error = "Not interested in files of type " + mime;
        Logger::warn("Can't process url '" + url_ + "' (" + result_.error + ")");
        return result_;
    }

    std::string html = Text::sanitize_utf8(res.body);
    for (const auto& href : Html::HtmlParser::extract_links(html)) {
        add_link(Url::resolve(url_, Text::escape_html(href)));
    }

    Logger::info("Found " + std::to_string(result_.links.size()) + " links on " + url_);
    return result_;
}

int print_links(Network::Http::HttpClient& client, const std::string& url, std::ostream& out) {
    Fetcher fetcher(client, url);
    fetcher.fetch();

    int count = 0;
    for (const auto& link : fetcher.links()) {
        if (!Text::contains(link, Constants::LINKS_MODE_MARKER))
            continue;
        out << ++count << ". " << link << "\n";
    }
    out.flush();
    return count;
}

}  // namespace Engine
}  // namespace Clawweb
