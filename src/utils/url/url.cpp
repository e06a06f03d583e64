#include "url.hpp"
#include <cctype>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace Clawweb {
namespace Utils {

namespace {

struct UrlParts {
    std::string scheme;
    bool        has_authority = false;
    std::string authority;
    std::string path;
    std::string query;
    std::string fragment;
};

bool is_scheme(std::string_view candidate) {
    if (candidate.empty() || !std::isalpha(static_cast<unsigned char>(candidate[0])))
        return false;
    for (char c : candidate) {
        auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '+' && c != '-' && c != '.')
            return false;
    }
    return true;
}

// Leading C0 controls and spaces are dropped; tab, CR and LF are removed
// wherever they appear.
std::string clean_reference(const std::string& ref) {
    size_t start = 0;
    while (start < ref.size() && static_cast<unsigned char>(ref[start]) <= 0x20)
        ++start;

    std::string out;
    out.reserve(ref.size() - start);
    for (size_t i = start; i < ref.size(); ++i) {
        if (ref[i] == '\t' || ref[i] == '\r' || ref[i] == '\n')
            continue;
        out += ref[i];
    }
    return out;
}

UrlParts split(std::string_view sv) {
    UrlParts parts;

    size_t colon = sv.find(':');
    if (colon != std::string_view::npos && colon < sv.find_first_of("/?#")
        && is_scheme(sv.substr(0, colon))) {
        parts.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t end_auth     = sv.find_first_of("/?#");
        parts.has_authority = true;
        parts.authority     = std::string(sv.substr(0, end_auth));
        sv = end_auth == std::string_view::npos ? std::string_view() : sv.substr(end_auth);
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parts.fragment = std::string(sv.substr(h_pos + 1));
        sv             = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parts.query = std::string(sv.substr(q_pos + 1));
        sv          = sv.substr(0, q_pos);
    }

    parts.path = std::string(sv);
    return parts;
}

std::string recompose(const UrlParts& parts) {
    std::string out;
    if (!parts.scheme.empty())
        out += parts.scheme + ":";
    if (parts.has_authority)
        out += "//" + parts.authority;
    out += parts.path;
    // Empty query and fragment components are dropped with their delimiter.
    if (!parts.query.empty())
        out += "?" + parts.query;
    if (!parts.fragment.empty())
        out += "#" + parts.fragment;
    return out;
}

std::string remove_dot_segments(const std::string& path) {
    if (path.empty())
        return path;

    std::vector<std::string> segments;
    size_t                   pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos)
            slash = path.size();
        segments.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }

    bool                     absolute = path[0] == '/';
    std::vector<std::string> output;
    for (size_t i = absolute ? 1 : 0; i < segments.size(); ++i) {
        const std::string& seg  = segments[i];
        bool               last = i + 1 == segments.size();
        if (seg == ".") {
            if (last)
                output.emplace_back();
        }
        else if (seg == "..") {
            if (!output.empty())
                output.pop_back();
            if (last)
                output.emplace_back();
        }
        else {
            output.push_back(seg);
        }
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < output.size(); ++i) {
        if (i > 0)
            result += "/";
        result += output[i];
    }
    return result;
}

std::string merge_paths(const UrlParts& base, const std::string& ref_path) {
    if (base.has_authority && base.path.empty())
        return "/" + ref_path;

    size_t last_slash = base.path.find_last_of('/');
    if (last_slash == std::string::npos)
        return ref_path;
    return base.path.substr(0, last_slash + 1) + ref_path;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    UrlParts parts = split(url);
    parsed.scheme  = parts.scheme;
    parsed.query   = parts.query;
    parsed.path    = parts.path.empty() ? "/" : parts.path;

    if (!parts.authority.empty()) {
        const std::string& authority = parts.authority;
        bool               open      = authority.find('[') != std::string::npos;
        bool               close     = authority.find(']') != std::string::npos;
        if (open != close) {
            parsed.valid = false;
            parsed.error = "Invalid IPv6 URL";
            return parsed;
        }

        size_t      at = authority.find_last_of('@');
        std::string host_port =
            (at != std::string::npos) ? authority.substr(at + 1) : authority;

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            parsed.host        = host_port.substr(0, end_bracket + 1);
            size_t p_colon     = host_port.find(':', end_bracket + 1);
            if (p_colon != std::string::npos) {
                parsed.port = host_port.substr(p_colon + 1);
            }
        }
        else {
            size_t p_colon = host_port.find(':');
            if (p_colon != std::string::npos) {
                parsed.host = host_port.substr(0, p_colon);
                parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
    }

    return parsed;
}

std::optional<std::string> Url::hostname(const std::string& url) {
    UrlParsed parsed = parse(url);
    if (!parsed.valid)
        return std::nullopt;

    std::string host = parsed.host;
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);
    return Text::to_lower(host);
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    std::string ref = clean_reference(relative);
    if (ref.empty())
        return base;

    UrlParts b = split(base);
    UrlParts r = split(ref);

    // A reference in another scheme is never relative to the base.
    if (!r.scheme.empty() && r.scheme != b.scheme)
        return ref;

    UrlParts t;
    t.scheme   = b.scheme;
    t.fragment = r.fragment;

    if (r.has_authority) {
        t.has_authority = true;
        t.authority     = r.authority;
        t.path          = r.path;
        t.query         = r.query;
        return recompose(t);
    }

    t.has_authority = b.has_authority;
    t.authority     = b.authority;
    if (r.path.empty()) {
        t.path  = b.path;
        t.query = r.query.empty() ? b.query : r.query;
    }
    else {
        if (r.path[0] == '/')
            t.path = remove_dot_segments(r.path);
        else
            t.path = remove_dot_segments(merge_paths(b, r.path));
        t.query = r.query;
    }

    return recompose(t);
}

std::string Url::normalize(const std::string& url) {
    size_t frag = url.find('#');
    if (frag == std::string::npos)
        return url;
    return url.substr(0, frag);
}

}  // namespace Utils
}  // namespace Clawweb
