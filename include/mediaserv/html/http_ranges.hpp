#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace mediaserv::html {

// Inclusive byte interval [start, end] of a resource that was `length` bytes long
// when the range was resolved.
struct byte_range
{
    std::uint64_t start  = 0;
    std::uint64_t end    = 0;
    std::uint64_t length = 0;

    std::uint64_t size() const { return end - start + 1; }

    bool operator==(const byte_range&) const = default;
};

class range_outcome
{
public:
    enum class kind
    {
        full_content,
        partial_content,
        unsatisfiable
    };

    static range_outcome full_content(std::uint64_t resource_length);
    static range_outcome partial_content(std::vector<byte_range>&& ranges,
                                         std::uint64_t resource_length);
    static range_outcome unsatisfiable(std::uint64_t resource_length);

public:
    kind type() const { return kind_; }
    bool is_full_content() const { return kind_ == kind::full_content; }
    bool is_partial_content() const { return kind_ == kind::partial_content; }
    bool is_unsatisfiable() const { return kind_ == kind::unsatisfiable; }

    // Non-empty only for partial_content, in the order the client asked for.
    const std::vector<byte_range>& ranges() const { return ranges_; }
    std::uint64_t resource_length() const { return resource_length_; }

private:
    range_outcome(kind k, std::vector<byte_range>&& ranges, std::uint64_t resource_length);

    kind kind_;
    std::vector<byte_range> ranges_;
    std::uint64_t resource_length_ = 0;
};

class http_ranges
{
public:
    // Headers asking for more sub-ranges than this are ignored.
    static constexpr std::size_t max_ranges = 32;

    /**
     * Interprets a Range header value against the current resource length.
     *
     * A missing, malformed or non-"bytes" header yields full_content. Sub-ranges
     * that cannot be served are dropped and the remaining ones are clamped to the
     * resource; when nothing is left the outcome is unsatisfiable. Sub-ranges are
     * never merged or reordered.
     */
    static range_outcome parse(std::string_view range_str, std::uint64_t resource_length);
};

} // namespace mediaserv::html
