#include "alignment_index.hpp"

namespace
{
    std::optional<size_t> find(const map<size_t, size_t> &mapping, size_t key)
    {
        auto it = mapping.find(key);
        if (it == mapping.end())
            return std::nullopt;
        return it->second;
    }
} // namespace

AlignmentIndex::AlignmentIndex(const vec<Op> &ops)
{
    for (size_t i = 0; i < ops.size(); ++i)
    {
        auto span = op::ref_span(ops[i]);
        if (!span.has_value())
            continue;
        start2op[span->start] = i;
        end2op[span->end] = i;
        ref2op[*op::ref_idx(ops[i])] = i;
    }
    SPDLOG_TRACE("AlignmentIndex: indexed {0} of {1} ops.", ref2op.size(), ops.size());
}

std::optional<size_t> AlignmentIndex::op_at_start(size_t offset) const { return find(start2op, offset); }

std::optional<size_t> AlignmentIndex::op_at_end(size_t offset) const { return find(end2op, offset); }

std::optional<size_t> AlignmentIndex::op_at_ref_idx(size_t ref_idx) const { return find(ref2op, ref_idx); }

size_t AlignmentIndex::num_ref_ops() const { return ref2op.size(); }
