#include "alignment_builder.hpp"

namespace
{
    string describe(size_t pos, const EditOp &e)
    {
        auto fmt_idx = [](const std::optional<size_t> &i) { return i.has_value() ? std::to_string(*i) : string("none"); };
        return "edit #" + std::to_string(pos) + " (" + to_string(e.kind) + ", " + fmt_idx(e.ref_idx) + ", " + fmt_idx(e.hyp_idx) + ")";
    }

    size_t require(const std::optional<size_t> &idx, size_t bound, size_t pos, const EditOp &e, const char *side)
    {
        if (!idx.has_value())
            throw AlignmentContractError(describe(pos, e) + " is missing its " + side + " index.");
        if (*idx >= bound)
            throw AlignmentContractError(describe(pos, e) + " has " + side + " index out of range (" + std::to_string(bound) + " tokens).");
        return *idx;
    }
} // namespace

EditKind edit_kind_from_string(const string &name)
{
    if ((name == "substitute") || (name == "replace"))
        return EditKind::SUBSTITUTE;
    if (name == "insert")
        return EditKind::INSERT;
    if (name == "delete")
        return EditKind::DELETE;
    throw AlignmentContractError("Unknown operation type: " + name);
}

EditOp make_edit_op(const string &name, std::optional<size_t> ref_idx, std::optional<size_t> hyp_idx)
{
    return EditOp{edit_kind_from_string(name), ref_idx, hyp_idx};
}

string to_string(EditKind kind)
{
    switch (kind)
    {
    case EditKind::SUBSTITUTE:
        return "substitute";
    case EditKind::INSERT:
        return "insert";
    case EditKind::DELETE:
        return "delete";
    }
    return "unknown(" + std::to_string(static_cast<int>(kind)) + ")";
}

void AlignmentBuilder::check_untouched(const vec<Slot> &slots, size_t idx, size_t pos, const char *side)
{
    if (slots[idx].role != Slot::Role::UNTOUCHED)
        throw AlignmentContractError("The " + string(side) + " index " + std::to_string(idx) + " is touched by more than one edit (again by edit #" + std::to_string(pos) + ").");
}

Alignment AlignmentBuilder::build(const vec<string> &ref_texts,
                                  const vec<Span> &ref_spans,
                                  const vec<string> &hyp_texts,
                                  const vec<Span> &hyp_spans,
                                  const EditScript &script)
{
    if ((ref_texts.size() != ref_spans.size()) || (hyp_texts.size() != hyp_spans.size()))
        throw std::invalid_argument("Token texts and spans differ in length.");
    size_t n = ref_texts.size();
    size_t m = hyp_texts.size();
    auto ref_slots = vec<Slot>(n);
    auto hyp_slots = vec<Slot>(m);

    // Mark every position the script touches.
    for (size_t pos = 0; pos < script.size(); ++pos)
    {
        const auto &e = script[pos];
        switch (e.kind)
        {
        case EditKind::SUBSTITUTE:
        {
            size_t r = require(e.ref_idx, n, pos, e, "reference");
            size_t h = require(e.hyp_idx, m, pos, e, "hypothesis");
            check_untouched(ref_slots, r, pos, "reference");
            check_untouched(hyp_slots, h, pos, "hypothesis");
            ref_slots[r] = Slot{Slot::Role::PAIRED, h, true, pos};
            hyp_slots[h] = Slot{Slot::Role::PAIRED, r, true, pos};
            break;
        }
        case EditKind::INSERT:
        {
            size_t h = require(e.hyp_idx, m, pos, e, "hypothesis");
            check_untouched(hyp_slots, h, pos, "hypothesis");
            hyp_slots[h] = Slot{Slot::Role::UNPAIRED, 0, false, pos};
            break;
        }
        case EditKind::DELETE:
        {
            size_t r = require(e.ref_idx, n, pos, e, "reference");
            check_untouched(ref_slots, r, pos, "reference");
            ref_slots[r] = Slot{Slot::Role::UNPAIRED, 0, false, pos};
            break;
        }
        default:
            throw AlignmentContractError("Unknown operation type in " + describe(pos, e) + ".");
        }
    }

    // Untouched positions form the common subsequence; pair them in order.
    auto match_ref = vec<size_t>();
    auto match_hyp = vec<size_t>();
    for (size_t i = 0; i < n; ++i)
        if (ref_slots[i].role == Slot::Role::UNTOUCHED)
            match_ref.push_back(i);
    for (size_t j = 0; j < m; ++j)
        if (hyp_slots[j].role == Slot::Role::UNTOUCHED)
            match_hyp.push_back(j);
    if (match_ref.size() != match_hyp.size())
        throw AlignmentContractError("Mismatch in match indices: " + std::to_string(match_ref.size()) +
                                     " untouched reference positions but " + std::to_string(match_hyp.size()) +
                                     " untouched hypothesis positions.");
    for (size_t k = 0; k < match_ref.size(); ++k)
    {
        ref_slots[match_ref[k]] = Slot{Slot::Role::PAIRED, match_hyp[k], false, 0};
        hyp_slots[match_hyp[k]] = Slot{Slot::Role::PAIRED, match_ref[k], false, 0};
    }

    // Walk both sequences left to right. Unpaired positions are emitted as soon as they are reached;
    // when a deletion and an insertion are both pending, the one listed first in the script goes first.
    auto ops = vec<Op>();
    ops.reserve(n + m);
    size_t i = 0;
    size_t j = 0;
    while ((i < n) || (j < m))
    {
        bool del_pending = (i < n) && (ref_slots[i].role == Slot::Role::UNPAIRED);
        bool ins_pending = (j < m) && (hyp_slots[j].role == Slot::Role::UNPAIRED);
        if (del_pending && ((!ins_pending) || (ref_slots[i].script_pos < hyp_slots[j].script_pos)))
        {
            ops.push_back(Delete{ref_texts[i], i, ref_spans[i]});
            ++i;
            continue;
        }
        if (ins_pending)
        {
            ops.push_back(Insert{hyp_texts[j], j, hyp_spans[j]});
            ++j;
            continue;
        }
        if ((i == n) || (j == m) || (ref_slots[i].partner != j))
            throw AlignmentContractError("Edit script pairs positions out of order near reference index " +
                                         std::to_string(i) + " and hypothesis index " + std::to_string(j) + ".");
        if (ref_slots[i].substituted)
            ops.push_back(Substitute{ref_texts[i], hyp_texts[j], i, j, ref_spans[i], hyp_spans[j]});
        else
            ops.push_back(Match{ref_texts[i], hyp_texts[j], i, j, ref_spans[i], hyp_spans[j]});
        ++i;
        ++j;
    }

    auto ret = Alignment(std::move(ops));
    SPDLOG_DEBUG("AlignmentBuilder: {0} ops from {1} edits ({2} ref, {3} hyp tokens).", ret.size(), script.size(), n, m);
    return ret;
}

Alignment AlignmentBuilder::build(const TokenList &ref_tokens,
                                  const TokenList &hyp_tokens,
                                  const EditScript &script,
                                  TextForm form)
{
    auto spans_of = [](const TokenList &tokens) {
        auto ret = vec<Span>();
        ret.reserve(tokens.size());
        for (const auto &token : tokens)
            ret.push_back(Span{token.start, token.end});
        return ret;
    };
    return build(ref_tokens.texts(form), spans_of(ref_tokens), hyp_tokens.texts(form), spans_of(hyp_tokens), script);
}
