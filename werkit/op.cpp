#include "op.hpp"

#include <type_traits>

namespace
{
    template <class T>
    constexpr bool has_ref = !std::is_same_v<T, Insert>;

    template <class T>
    constexpr bool has_hyp = !std::is_same_v<T, Delete>;

    string quoted(const string *s) { return "\"" + *s + "\""; }
} // namespace

OpType op::type_of(const Op &o) { return static_cast<OpType>(o.index()); }

bool op::is_match(const Op &o) { return std::holds_alternative<Match>(o); }

std::optional<size_t> op::ref_idx(const Op &o)
{
    return std::visit([](const auto &alt) -> std::optional<size_t> {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (has_ref<T>)
            return alt.ref_idx;
        else
            return std::nullopt;
    },
                      o);
}

std::optional<size_t> op::hyp_idx(const Op &o)
{
    return std::visit([](const auto &alt) -> std::optional<size_t> {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (has_hyp<T>)
            return alt.hyp_idx;
        else
            return std::nullopt;
    },
                      o);
}

std::optional<Span> op::ref_span(const Op &o)
{
    return std::visit([](const auto &alt) -> std::optional<Span> {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (has_ref<T>)
            return alt.ref_span;
        else
            return std::nullopt;
    },
                      o);
}

std::optional<Span> op::hyp_span(const Op &o)
{
    return std::visit([](const auto &alt) -> std::optional<Span> {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (has_hyp<T>)
            return alt.hyp_span;
        else
            return std::nullopt;
    },
                      o);
}

const string *op::ref_text(const Op &o)
{
    return std::visit([](const auto &alt) -> const string * {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (has_ref<T>)
            return &alt.ref_text;
        else
            return nullptr;
    },
                      o);
}

const string *op::hyp_text(const Op &o)
{
    return std::visit([](const auto &alt) -> const string * {
        using T = std::decay_t<decltype(alt)>;
        if constexpr (has_hyp<T>)
            return &alt.hyp_text;
        else
            return nullptr;
    },
                      o);
}

bool op::equal(const Op &a, const Op &b)
{
    if (a.index() != b.index())
        return false;
    const auto *ar = ref_text(a);
    const auto *br = ref_text(b);
    const auto *ah = hyp_text(a);
    const auto *bh = hyp_text(b);
    return (ref_idx(a) == ref_idx(b)) && (hyp_idx(a) == hyp_idx(b)) &&
           (ref_span(a) == ref_span(b)) && (hyp_span(a) == hyp_span(b)) &&
           ((ar == nullptr) || (*ar == *br)) && ((ah == nullptr) || (*ah == *bh));
}

string to_string(OpType type)
{
    switch (type)
    {
    case OpType::MATCH:
        return "MATCH";
    case OpType::INSERT:
        return "INSERT";
    case OpType::DELETE:
        return "DELETE";
    case OpType::SUBSTITUTE:
        return "SUBSTITUTE";
    }
    return "UNKNOWN";
}

string to_string(const Op &o)
{
    auto type = op::type_of(o);
    auto ret = "Op(" + to_string(type) + ": ";
    switch (type)
    {
    case OpType::DELETE:
        ret += quoted(op::ref_text(o));
        break;
    case OpType::INSERT:
        ret += quoted(op::hyp_text(o));
        break;
    case OpType::SUBSTITUTE:
        ret += quoted(op::hyp_text(o)) + " -> " + quoted(op::ref_text(o));
        break;
    case OpType::MATCH:
        ret += quoted(op::hyp_text(o)) + " == " + quoted(op::ref_text(o));
        break;
    }
    return ret + ")";
}
