#pragma once

#include "common.hpp"
#include "errors.hpp"
#include "alignment.hpp"
#include "token.hpp"

enum class EditKind : int
{
    SUBSTITUTE,
    INSERT,
    DELETE
};

// One entry of a sparse edit script. An insertion needs `hyp_idx`, a deletion `ref_idx`, a
// substitution both. The other index, when supplied, is accepted and ignored.
struct EditOp
{
    EditKind kind;
    std::optional<size_t> ref_idx;
    std::optional<size_t> hyp_idx;
};

using EditScript = vec<EditOp>;

// Parse an edit kind as reported by an edit-distance primitive ("replace" is accepted for substitute).
EditKind edit_kind_from_string(const string &);
EditOp make_edit_op(const string &, std::optional<size_t>, std::optional<size_t>);
string to_string(EditKind);

// Turns a sparse edit script (edits only) into a total alignment that also covers the matched
// positions the script leaves out.
class AlignmentBuilder
{
    // Per-position bookkeeping on one side of the alignment.
    struct Slot
    {
        enum class Role : int
        {
            UNTOUCHED,
            PAIRED,
            UNPAIRED
        };

        Role role = Role::UNTOUCHED;
        size_t partner = 0;
        bool substituted = false;
        size_t script_pos = 0;
    };

    static void check_untouched(const vec<Slot> &, size_t, size_t, const char *);

public:
    // Build from token texts and spans. `ref_spans` and `hyp_spans` run parallel to the texts.
    static Alignment build(const vec<string> &,
                           const vec<Span> &,
                           const vec<string> &,
                           const vec<Span> &,
                           const EditScript &);
    static Alignment build(const TokenList &, const TokenList &, const EditScript &, TextForm = TextForm::NORMALIZED);
};
