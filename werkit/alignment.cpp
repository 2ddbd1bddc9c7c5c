#include "alignment.hpp"

Alignment::Alignment(vec<Op> ops) : ops(std::move(ops))
{
    for (const auto &o : this->ops)
        count(o);
}

void Alignment::check_unsealed(const char *action) const
{
    if (sealed)
        throw SealedAlignmentError(string("Cannot ") + action + " an Alignment after it has been sealed.");
}

void Alignment::count(const Op &o) { ++counts[o.index()]; }

void Alignment::append(Op o)
{
    check_unsealed("modify");
    count(o);
    ops.push_back(std::move(o));
    index_cell.reset();
}

void Alignment::extend(const vec<Op> &others)
{
    check_unsealed("modify");
    ops.reserve(ops.size() + others.size());
    for (const auto &o : others)
    {
        count(o);
        ops.push_back(o);
    }
    index_cell.reset();
}

void Alignment::seal(const Example *example)
{
    check_unsealed("seal");
    sealed = true;
    src = example;
}

bool Alignment::is_sealed() const { return sealed; }
const Example *Alignment::get_source() const { return src; }

size_t Alignment::size() const { return ops.size(); }
bool Alignment::empty() const { return ops.empty(); }
const Op &Alignment::operator[](size_t i) const { return ops[i]; }
vec<Op>::const_iterator Alignment::begin() const { return ops.begin(); }
vec<Op>::const_iterator Alignment::end() const { return ops.end(); }
const vec<Op> &Alignment::get_ops() const { return ops; }

size_t Alignment::num_matches() const { return counts[static_cast<size_t>(OpType::MATCH)]; }
size_t Alignment::num_substitutions() const { return counts[static_cast<size_t>(OpType::SUBSTITUTE)]; }
size_t Alignment::num_insertions() const { return counts[static_cast<size_t>(OpType::INSERT)]; }
size_t Alignment::num_deletions() const { return counts[static_cast<size_t>(OpType::DELETE)]; }
size_t Alignment::num_edits() const { return num_substitutions() + num_insertions() + num_deletions(); }

const AlignmentIndex &Alignment::index() const
{
    return index_cell.get([this]() { return AlignmentIndex(ops); });
}

const Op *Alignment::start_index_to_op(size_t char_index) const
{
    auto i = index().op_at_start(char_index);
    return i.has_value() ? &ops[*i] : nullptr;
}

const Op *Alignment::end_index_to_op(size_t char_index) const
{
    auto i = index().op_at_end(char_index);
    return i.has_value() ? &ops[*i] : nullptr;
}

Alignment Alignment::ops_from_ref_index(size_t start) const { return ops_from_ref_index(start, start); }

Alignment Alignment::ops_from_ref_index(size_t start, size_t stop) const
{
    const auto &idx = index();
    auto first = idx.op_at_ref_idx(start);
    if (!first.has_value())
        throw RefIndexError("Start index " + std::to_string(start) + " not found in alignment.");
    if (stop < start)
        throw RefIndexError("Stop index must be greater than or equal to start index, got start=" +
                            std::to_string(start) + " and stop=" + std::to_string(stop) + ".");
    auto last = idx.op_at_ref_idx(stop);
    if (!last.has_value())
        throw RefIndexError("Stop index " + std::to_string(stop) + " not found in alignment.");
    if (*last < *first)
        throw RefIndexError("Reference index " + std::to_string(stop) + " precedes reference index " +
                            std::to_string(start) + " in alignment.");
    return slice(*first, *last + 1);
}

Alignment Alignment::slice(size_t begin, size_t end) const
{
    if ((begin > end) || (end > ops.size()))
        throw std::out_of_range("Invalid alignment slice [" + std::to_string(begin) + ", " + std::to_string(end) +
                                ") over " + std::to_string(ops.size()) + " ops.");
    return Alignment(vec<Op>(ops.begin() + begin, ops.begin() + end));
}

Alignment Alignment::concat(const Alignment &other) const
{
    if (sealed || other.sealed)
        throw SealedAlignmentError("Cannot concatenate sealed Alignments.");
    auto joined = ops;
    joined.insert(joined.end(), other.ops.begin(), other.ops.end());
    return Alignment(std::move(joined));
}

string Alignment::str() const
{
    auto lines = vec<string>();
    for (size_t i = 0; (i < ops.size()) && (i < 60); ++i)
        lines.push_back(to_string(ops[i]));
    if (ops.size() > 60)
        lines.push_back("...");
    return "Alignment([\n " + str::join(lines, ",\n ") + "]\n)";
}
