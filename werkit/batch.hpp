#pragma once

#include <future>

#include "common.hpp"
#include "dataset.hpp"

struct BatchOpt
{
    // Jobs run on the calling thread when this is 1.
    int num_threads = 1;
};

// Computes alignments and keyword statistics for every example of a dataset, optionally on a thread
// pool. Each job runs under the configuration that was active when the batch call was made.
class BatchAligner
{
    std::unique_ptr<Pool> tp;

    template <class F>
    void for_each(size_t, F) const;

public:
    const BatchOpt opt;

    explicit BatchAligner(const BatchOpt & = BatchOpt());

    // Alignments in example order. Exceptions raised by any job are rethrown here.
    vec<const Alignment *> align(const Dataset &, TextForm = TextForm::NORMALIZED) const;
    KeywordStats keyword_stats(const Dataset &, const string &, TextForm = TextForm::NORMALIZED) const;
};
