#include "filter.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Clawweb {
namespace Engine {

using namespace Clawweb::Core;
using namespace Clawweb::Utils;

PrefixFilter::PrefixFilter(std::optional<std::string> prefix) : prefix_(std::move(prefix)) {
}

std::string PrefixFilter::name() const {
    return "prefix";
}

FilterResult PrefixFilter::evaluate(const std::string& url) const {
    FilterResult result;
    result.passed = !prefix_ || Text::starts_with(url, *prefix_);
    return result;
}

ExclusionFilter::ExclusionFilter(std::vector<std::string> prefixes)
    : prefixes_(std::move(prefixes)) {
}

std::string ExclusionFilter::name() const {
    return "exclude";
}

FilterResult ExclusionFilter::evaluate(const std::string& url) const {
    FilterResult result;
    for (const auto& prefix : prefixes_) {
        if (Text::starts_with(url, prefix)) {
            result.passed = false;
            break;
        }
    }
    return result;
}

VisitedFilter::VisitedFilter(const std::unordered_set<std::string>& visited) : visited_(visited) {
}

std::string VisitedFilter::name() const {
    return "not-visited";
}

FilterResult VisitedFilter::evaluate(const std::string& url) const {
    FilterResult result;
    result.passed = visited_.find(url) == visited_.end();
    return result;
}

HostFilter::HostFilter(std::string root_host) : root_host_(std::move(root_host)) {
}

std::string HostFilter::name() const {
    return "same-host";
}

FilterResult HostFilter::evaluate(const std::string& url) const {
    FilterResult result;
    auto         host = Url::hostname(url);
    if (!host) {
        result.passed = false;
        result.kind   = ErrorKind::HostResolution;
        result.error  = "Can't process url '" + url + "' (" + Url::parse(url).error + ")";
        Logger::error(result.error);
        return result;
    }
    result.passed = *host == root_host_;
    return result;
}

void FilterPipeline::add(std::unique_ptr<Filter> filter) {
    filters_.push_back(std::move(filter));
}

PipelineResult FilterPipeline::evaluate(const std::string& url) const {
    PipelineResult result;
    for (const auto& filter : filters_) {
        FilterResult r = filter->evaluate(url);
        if (r.passed)
            continue;

        result.passed = false;
        result.rejected_by.push_back(filter->name());
        if (r.kind != ErrorKind::None && result.kind == ErrorKind::None) {
            result.kind  = r.kind;
            result.error = r.error;
        }
    }
    return result;
}

size_t FilterPipeline::size() const {
    return filters_.size();
}

bool FilterPipeline::empty() const {
    return filters_.empty();
}

}  // namespace Engine
}  // namespace Clawweb
