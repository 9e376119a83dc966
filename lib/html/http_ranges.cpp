#include "mediaserv/html/http_ranges.hpp"
#include "mediaserv/util/misc.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <charconv>
#include <limits>
#include <optional>

namespace mediaserv::html {

namespace detail {

inline constexpr std::string_view unit_prefix = "bytes=";

enum class parse_status
{
    ok,
    malformed
};

// Digits only; values past 64 bits saturate so that an absurd start is simply
// out of range and an absurd end is clamped.
static parse_status parse_number(std::string_view str, std::uint64_t& value)
{
    if (str.empty())
        return parse_status::malformed;
    for (char c : str) {
        if (c < '0' || c > '9')
            return parse_status::malformed;
    }
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec == std::errc::result_out_of_range) {
        value = std::numeric_limits<std::uint64_t>::max();
        return parse_status::ok;
    }
    if (ec != std::errc {} || ptr != str.data() + str.size())
        return parse_status::malformed;
    return parse_status::ok;
}

struct range_spec
{
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
};

static parse_status parse_spec(std::string_view spec, range_spec& out)
{
    auto dash = spec.find('-');
    if (dash == std::string_view::npos)
        return parse_status::malformed;

    auto first_str = boost::trim_copy(spec.substr(0, dash));
    auto last_str  = boost::trim_copy(spec.substr(dash + 1));
    if (first_str.empty() && last_str.empty())
        return parse_status::malformed;

    if (!first_str.empty()) {
        std::uint64_t v = 0;
        if (parse_number(first_str, v) != parse_status::ok)
            return parse_status::malformed;
        out.first = v;
    }
    if (!last_str.empty()) {
        std::uint64_t v = 0;
        if (parse_number(last_str, v) != parse_status::ok)
            return parse_status::malformed;
        out.last = v;
    }
    return parse_status::ok;
}

// Applies the per sub-range rules. Returns nullopt when the sub-range is dropped.
static std::optional<byte_range> resolve_spec(const range_spec& spec, std::uint64_t length)
{
    if (!spec.first) {
        // suffix form: the last N bytes
        auto suffix = *spec.last;
        if (suffix == 0)
            return std::nullopt;
        if (suffix > length)
            suffix = length;
        return byte_range {length - suffix, length - 1, length};
    }

    auto start = *spec.first;
    auto end   = spec.last ? *spec.last : length - 1;
    if (start > end)
        return std::nullopt;
    if (start >= length)
        return std::nullopt;
    if (end >= length)
        end = length - 1;
    return byte_range {start, end, length};
}

} // namespace detail

range_outcome::range_outcome(kind k, std::vector<byte_range>&& ranges, std::uint64_t resource_length)
    : kind_(k)
    , ranges_(std::move(ranges))
    , resource_length_(resource_length)
{
}

range_outcome range_outcome::full_content(std::uint64_t resource_length)
{
    return range_outcome(kind::full_content, {}, resource_length);
}

range_outcome range_outcome::partial_content(std::vector<byte_range>&& ranges,
                                             std::uint64_t resource_length)
{
    return range_outcome(kind::partial_content, std::move(ranges), resource_length);
}

range_outcome range_outcome::unsatisfiable(std::uint64_t resource_length)
{
    return range_outcome(kind::unsatisfiable, {}, resource_length);
}

range_outcome http_ranges::parse(std::string_view range_str, std::uint64_t resource_length)
{
    range_str = boost::trim_copy(range_str);
    if (range_str.empty() || resource_length == 0)
        return range_outcome::full_content(resource_length);

    if (range_str.size() < detail::unit_prefix.size() ||
        !boost::algorithm::iequals(range_str.substr(0, detail::unit_prefix.size()),
                                   detail::unit_prefix))
    {
        return range_outcome::full_content(resource_length);
    }
    range_str.remove_prefix(detail::unit_prefix.size());

    std::vector<detail::range_spec> specs;
    for (const auto& element : util::split(range_str, ",")) {
        if (element.empty())
            continue;

        detail::range_spec spec;
        if (detail::parse_spec(element, spec) != detail::parse_status::ok)
            return range_outcome::full_content(resource_length);

        specs.push_back(spec);
        if (specs.size() > max_ranges)
            return range_outcome::full_content(resource_length);
    }
    if (specs.empty())
        return range_outcome::full_content(resource_length);

    std::vector<byte_range> ranges;
    ranges.reserve(specs.size());
    for (const auto& spec : specs) {
        if (auto range = detail::resolve_spec(spec, resource_length); range)
            ranges.push_back(*range);
    }
    if (ranges.empty())
        return range_outcome::unsatisfiable(resource_length);

    return range_outcome::partial_content(std::move(ranges), resource_length);
}

} // namespace mediaserv::html
