#pragma once

#include "test_harness.hpp"
#include "fixtures.hpp"

namespace tests
{
    // a x b c against a b c: Match(0), Insert, Match(1), Match(2). Reference spans a[0,1) b[2,3) c[4,5).
    inline Alignment with_insertion() { return build({"a", "b", "c"}, {"a", "x", "b", "c"}, {ins(1)}); }

    bool single_reference_index()
    {
        auto almt = with_insertion();
        for (size_t i = 0; i < 3; ++i)
        {
            auto one = almt.ops_from_ref_index(i);
            EXPECT(one.size() == 1, "Exactly one op per reference index");
            EXPECT(*op::ref_idx(one[0]) == i, "The op should carry the requested index");
            auto same = almt.ops_from_ref_index(i, i);
            EXPECT(same.size() == 1 && op::equal(same[0], one[0]), "A one-element range is the single op");
        }
        return true;
    }

    bool ranges_include_interleaved_insertions()
    {
        auto almt = with_insertion();
        auto range = almt.ops_from_ref_index(0, 1);
        EXPECT(range.size() == 3, "Range over two reference tokens plus the insertion between them");
        EXPECT(op::type_of(range[1]) == OpType::INSERT, "Insertion should be kept");
        EXPECT(range.num_matches() == 2 && range.num_insertions() == 1, "Range counts");
        EXPECT(!range.is_sealed(), "Ranges are fresh alignments");
        EXPECT(almt.ops_from_ref_index(1, 2).num_edits() == 0, "No edits after the insertion");
        EXPECT(almt.ops_from_ref_index(0, 2).size() == almt.size(), "The full range is everything");
        return true;
    }

    bool bad_reference_ranges_raise()
    {
        auto almt = with_insertion();
        EXPECT_THROW(almt.ops_from_ref_index(2, 1), RefIndexError, "stop < start");
        EXPECT_THROW(almt.ops_from_ref_index(5), RefIndexError, "Absent start index");
        EXPECT_THROW(almt.ops_from_ref_index(0, 9), RefIndexError, "Absent stop index");
        auto deletions = build({"a", "b"}, {"a"}, {del(1)});
        EXPECT(deletions.ops_from_ref_index(1).num_deletions() == 1, "Deletions carry reference indices");
        auto inserts = build({}, {"x"}, {ins(0)});
        EXPECT_THROW(inserts.ops_from_ref_index(0), RefIndexError, "Insertions are not reachable by reference index");
        try
        {
            almt.ops_from_ref_index(7);
        }
        catch (const RefIndexError &e)
        {
            EXPECT(string(e.what()).find("Start index 7 not found") == 0, "Message should name the start index");
        }
        try
        {
            almt.ops_from_ref_index(0, 8);
        }
        catch (const RefIndexError &e)
        {
            EXPECT(string(e.what()).find("Stop index 8 not found") == 0, "Message should name the stop index");
        }
        return true;
    }

    bool offset_lookups()
    {
        auto almt = with_insertion();
        const auto *b = almt.start_index_to_op(2);
        EXPECT(b != nullptr && *op::ref_text(*b) == "b", "Op found by reference start offset");
        EXPECT(almt.end_index_to_op(5) == &almt[3], "Op found by reference end offset");
        EXPECT(almt.start_index_to_op(1) == nullptr, "No reference token starts there");
        EXPECT(almt.end_index_to_op(2) == nullptr, "No reference token ends there");
        return true;
    }

    bool index_is_idempotent()
    {
        auto almt = build({"w0", "w1", "w2", "w3"}, {"x", "w1", "y", "w2"}, {sub(0, 0), ins(2), del(3)});
        auto first = AlignmentIndex(almt.get_ops());
        auto second = AlignmentIndex(almt.get_ops());
        EXPECT(first.num_ref_ops() == 4 && second.num_ref_ops() == 4, "Every reference token is indexed");
        for (size_t k = 0; k < 20; ++k)
        {
            EXPECT(first.op_at_start(k) == second.op_at_start(k), "Start lookups should agree");
            EXPECT(first.op_at_end(k) == second.op_at_end(k), "End lookups should agree");
            EXPECT(first.op_at_ref_idx(k) == second.op_at_ref_idx(k), "Reference lookups should agree");
        }
        EXPECT(&almt.index() == &almt.index(), "The index is built once");
        return true;
    }

    bool sealing_freezes()
    {
        auto almt = Alignment();
        almt.append(Match{"a", "a", 0, 0, Span{0, 1}, Span{0, 1}});
        EXPECT_THROW(almt.ops_from_ref_index(1), RefIndexError, "Not appended yet");
        almt.extend({Delete{"b", 1, Span{2, 3}}, Insert{"y", 1, Span{2, 3}}});
        EXPECT(almt.ops_from_ref_index(1).num_deletions() == 1, "Appending rebuilds the index");
        EXPECT(almt.num_matches() == 1 && almt.num_deletions() == 1 && almt.num_insertions() == 1, "Counts follow appends");
        auto tail = build({"c"}, {"c"}, {});
        auto joined = almt.concat(tail);
        EXPECT(joined.size() == 4 && joined.num_matches() == 2, "Concatenation");
        almt.seal();
        EXPECT(almt.is_sealed() && almt.get_source() == nullptr, "Sealed without an example");
        EXPECT_THROW(almt.append(Insert{"z", 2, Span{4, 5}}), SealedAlignmentError, "No appends after sealing");
        EXPECT_THROW(almt.extend({}), SealedAlignmentError, "No extends after sealing");
        EXPECT_THROW(almt.seal(), SealedAlignmentError, "Sealing happens once");
        EXPECT_THROW(almt.concat(tail), SealedAlignmentError, "Sealed alignments cannot be concatenated");
        EXPECT(almt.slice(0, 2).size() == 2 && !almt.slice(0, 2).is_sealed(), "Slices of sealed alignments are open");
        EXPECT_THROW(almt.slice(2, 9), std::out_of_range, "Slices must stay inside");
        return true;
    }

    bool rendering_truncates()
    {
        auto almt = with_insertion();
        EXPECT(almt.str().find("Op(INSERT: \"x\")") != string::npos, "Ops should be listed");
        auto ref = vec<string>(70, "w");
        auto big = build(ref, ref, {});
        auto text = big.str();
        EXPECT(text.find("...") != string::npos, "Long alignments are cut");
        return true;
    }

    void run_alignment_tests()
    {
        SUBCAT("Reference ranges");
        RUN_TEST(single_reference_index);
        RUN_TEST(ranges_include_interleaved_insertions);
        RUN_TEST(bad_reference_ranges_raise);
        SUBCAT("Offsets");
        RUN_TEST(offset_lookups);
        RUN_TEST(index_is_idempotent);
        SUBCAT("Lifecycle");
        RUN_TEST(sealing_freezes);
        RUN_TEST(rendering_truncates);
    }
} // namespace tests
