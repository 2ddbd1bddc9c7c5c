#pragma once

#include "common.hpp"
#include "errors.hpp"
#include "memo.hpp"
#include "op.hpp"
#include "alignment_index.hpp"

class Example;

// An ordered sequence of ops. It can be appended to until it is sealed; sealing is permanent and
// optionally binds the alignment to the example it was computed for.
class Alignment
{
    vec<Op> ops;
    array<size_t, NUM_OP_TYPES> counts{};
    bool sealed = false;
    const Example *src = nullptr;
    OnceCell<AlignmentIndex> index_cell;

    void check_unsealed(const char *) const;
    void count(const Op &);

public:
    Alignment() = default;
    explicit Alignment(vec<Op>);

    Alignment(Alignment &&) = default;
    Alignment &operator=(Alignment &&) = default;
    Alignment(const Alignment &) = delete;
    Alignment &operator=(const Alignment &) = delete;

    void append(Op);
    void extend(const vec<Op> &);
    void seal(const Example * = nullptr);
    bool is_sealed() const;
    const Example *get_source() const;

    size_t size() const;
    bool empty() const;
    const Op &operator[](size_t) const;
    vec<Op>::const_iterator begin() const;
    vec<Op>::const_iterator end() const;
    const vec<Op> &get_ops() const;

    size_t num_matches() const;
    size_t num_substitutions() const;
    size_t num_insertions() const;
    size_t num_deletions() const;
    size_t num_edits() const;

    // Built on first use. Appending before sealing discards it.
    const AlignmentIndex &index() const;
    // Op whose reference span starts (ends) at the given byte offset, or nullptr.
    const Op *start_index_to_op(size_t) const;
    const Op *end_index_to_op(size_t) const;

    // The op carrying reference index `start`.
    Alignment ops_from_ref_index(size_t) const;
    // All ops from the one carrying reference index `start` through the one carrying `stop`, inclusive,
    // together with any insertions between them. Throws RefIndexError if either index is absent or
    // `stop < start`.
    Alignment ops_from_ref_index(size_t, size_t) const;

    // Unsealed copy of `[begin, end)`.
    Alignment slice(size_t, size_t) const;
    // Unsealed concatenation. Neither operand may be sealed.
    Alignment concat(const Alignment &) const;

    string str() const;
};
