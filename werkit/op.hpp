#pragma once

#include <variant>

#include "common.hpp"

// Half-open byte range into the owning text.
struct Span
{
    size_t start;
    size_t end;

    bool operator==(const Span &other) const { return (start == other.start) && (end == other.end); }
    bool operator!=(const Span &other) const { return !(*this == other); }
};

struct Match
{
    string ref_text;
    string hyp_text;
    size_t ref_idx;
    size_t hyp_idx;
    Span ref_span;
    Span hyp_span;
};

struct Insert
{
    string hyp_text;
    size_t hyp_idx;
    Span hyp_span;
};

struct Delete
{
    string ref_text;
    size_t ref_idx;
    Span ref_span;
};

struct Substitute
{
    string ref_text;
    string hyp_text;
    size_t ref_idx;
    size_t hyp_idx;
    Span ref_span;
    Span hyp_span;
};

// Alternatives are listed in OpType order.
using Op = std::variant<Match, Insert, Delete, Substitute>;

enum class OpType : int
{
    MATCH,
    INSERT,
    DELETE,
    SUBSTITUTE
};

constexpr size_t NUM_OP_TYPES = 4;

namespace op
{
    OpType type_of(const Op &);
    bool is_match(const Op &);

    // Fields shared by several alternatives. Empty for alternatives that lack them.
    std::optional<size_t> ref_idx(const Op &);
    std::optional<size_t> hyp_idx(const Op &);
    std::optional<Span> ref_span(const Op &);
    std::optional<Span> hyp_span(const Op &);
    const string *ref_text(const Op &);
    const string *hyp_text(const Op &);

    bool equal(const Op &, const Op &);
} // namespace op

string to_string(OpType);
string to_string(const Op &);
