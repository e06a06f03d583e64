#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "../../core/types/error_kind.hpp"

namespace Clawweb {
namespace Engine {

struct FilterResult {
    bool            passed = true;
    Core::ErrorKind kind   = Core::ErrorKind::None;
    std::string     error;
};

class Filter {
public:
    virtual ~Filter() = default;

    virtual std::string  name() const                         = 0;
    virtual FilterResult evaluate(const std::string& url) const = 0;
};

// Passes everything when no prefix is configured.
class PrefixFilter : public Filter {
public:
    explicit PrefixFilter(std::optional<std::string> prefix);

    std::string  name() const override;
    FilterResult evaluate(const std::string& url) const override;

private:
    const std::optional<std::string> prefix_;
};

class ExclusionFilter : public Filter {
public:
    explicit ExclusionFilter(std::vector<std::string> prefixes);

    std::string  name() const override;
    FilterResult evaluate(const std::string& url) const override;

private:
    const std::vector<std::string> prefixes_;
};

// Observes the crawler's visited set; the set must outlive the filter.
class VisitedFilter : public Filter {
public:
    explicit VisitedFilter(const std::unordered_set<std::string>& visited);

    std::string  name() const override;
    FilterResult evaluate(const std::string& url) const override;

private:
    const std::unordered_set<std::string>& visited_;
};

class HostFilter : public Filter {
public:
    explicit HostFilter(std::string root_host);

    std::string  name() const override;
    FilterResult evaluate(const std::string& url) const override;

private:
    const std::string root_host_;
};

struct PipelineResult {
    bool                     passed = true;
    std::vector<std::string> rejected_by;
    Core::ErrorKind          kind = Core::ErrorKind::None;
    std::string              error;
};

// Logical AND over an ordered list of filters. Every filter is evaluated so
// that the result names all of the ones that rejected the URL.
class FilterPipeline {
public:
    FilterPipeline() = default;
    FilterPipeline(FilterPipeline&&) noexcept            = default;
    FilterPipeline& operator=(FilterPipeline&&) noexcept = default;

    void           add(std::unique_ptr<Filter> filter);
    PipelineResult evaluate(const std::string& url) const;
    size_t         size() const;
    bool           empty() const;

private:
    std::vector<std::unique_ptr<Filter>> filters_;
};

}  // namespace Engine
}  // namespace Clawweb
