#pragma once

#include "common.hpp"
#include "op.hpp"

// Lookup tables over a finished sequence of ops. Offsets refer to reference-side spans; ops without
// a reference side (insertions) are not reachable by offset or by reference index.
class AlignmentIndex
{
    map<size_t, size_t> start2op;
    map<size_t, size_t> end2op;
    map<size_t, size_t> ref2op;

public:
    explicit AlignmentIndex(const vec<Op> &);

    // Position of the op whose reference span starts (ends) at the given byte offset.
    std::optional<size_t> op_at_start(size_t) const;
    std::optional<size_t> op_at_end(size_t) const;
    // Position of the op carrying the given reference token index.
    std::optional<size_t> op_at_ref_idx(size_t) const;

    size_t num_ref_ops() const;
};
