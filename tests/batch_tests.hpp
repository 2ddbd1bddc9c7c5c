#pragma once

#include "test_harness.hpp"
#include "fixtures.hpp"
#include "../werkit/batch.hpp"
#include "../werkit/timer.hpp"

namespace tests
{
    inline void fill(Dataset &dataset, int n)
    {
        for (int i = 0; i < n; ++i)
        {
            auto text = "Word" + std::to_string(i) + " common Tail";
            dataset.add(text, text, KeywordTerms{{"kw", {"common"}}});
        }
    }

    bool batch_matches_serial()
    {
        auto table = ScriptTable();
        auto dataset = Dataset();
        register_pipelines(dataset.get_pipelines());
        dataset.set_edit_script_source(table.source());
        fill(dataset, 20);
        auto opt = BatchOpt();
        opt.num_threads = 4;
        auto aligner = BatchAligner(opt);
        auto alignments = aligner.align(dataset);
        EXPECT(alignments.size() == 20, "One alignment per example");
        for (size_t i = 0; i < alignments.size(); ++i)
        {
            EXPECT(alignments[i] == &dataset[i].alignment(), "Workers fill the same caches the caller reads");
            EXPECT(alignments[i]->num_matches() == 3, "Identical texts align without edits");
        }
        EXPECT(table.calls == 20, "Each example is aligned once");
        auto stats = aligner.keyword_stats(dataset, "kw");
        EXPECT(stats.num_keywords == 20 && stats.num_errors == 0, "Keyword totals");
        auto raw = aligner.keyword_stats(dataset, "kw", TextForm::RAW);
        EXPECT(raw.num_keywords == 20 && raw.num_errors == 0, "Keyword totals against raw alignments");
        EXPECT(table.calls == 40, "Raw alignments are built separately");
        return true;
    }

    bool workers_see_the_callers_configuration()
    {
        auto table = ScriptTable();
        auto dataset = Dataset();
        register_pipelines(dataset.get_pipelines());
        dataset.set_edit_script_source(table.source());
        fill(dataset, 12);
        auto opt = BatchOpt();
        opt.num_threads = 3;
        auto aligner = BatchAligner(opt);
        PipelineScope scope(pipeline::DEFAULT, pipeline::DEFAULT, "lower");
        auto alignments = aligner.align(dataset);
        EXPECT(std::get<Match>((*alignments[0])[0]).ref_text == "word0", "Workers should normalize with the active normalizer");
        for (size_t i = 0; i < alignments.size(); ++i)
            EXPECT(alignments[i] == &dataset[i].alignment(), "Results are cached under the caller's configuration");
        EXPECT(table.calls == 12, "Nothing recomputed on the calling thread");
        EXPECT(pipeline::current() == PipelineKey(pipeline::DEFAULT, pipeline::DEFAULT, "lower"), "The caller's configuration is untouched");
        return true;
    }

    bool batch_errors_propagate()
    {
        auto dataset = Dataset();
        register_pipelines(dataset.get_pipelines());
        fill(dataset, 5);
        auto opt = BatchOpt();
        opt.num_threads = 2;
        auto aligner = BatchAligner(opt);
        EXPECT_THROW(aligner.align(dataset), EditScriptSourceError, "Worker exceptions should reach the caller");
        auto serial = BatchAligner();
        EXPECT_THROW(serial.align(dataset), EditScriptSourceError, "Serial runs raise the same way");
        auto bad = BatchOpt();
        bad.num_threads = 0;
        EXPECT_THROW(BatchAligner{bad}, std::invalid_argument, "At least one thread");
        return true;
    }

    bool timer_accumulates_sections()
    {
        auto timer = Timer();
        for (int i = 0; i < 3; ++i)
            auto scope = timer.start("loop");
        timer.disable();
        {
            auto scope = timer.start("off");
        }
        EXPECT(timer.runs("loop") == 3, "Every scope is one run");
        EXPECT(timer.seconds("loop") >= 0.0, "Elapsed time is never negative");
        EXPECT(timer.runs("off") == 0, "A disabled timer records nothing");
        return true;
    }

    void run_batch_tests()
    {
        SUBCAT("Batches");
        RUN_TEST(batch_matches_serial);
        RUN_TEST(workers_see_the_callers_configuration);
        RUN_TEST(batch_errors_propagate);
        RUN_TEST(timer_accumulates_sections);
    }
} // namespace tests
