#include "batch.hpp"

BatchAligner::BatchAligner(const BatchOpt &opt) : opt(opt)
{
    if (opt.num_threads < 1)
        throw std::invalid_argument("BatchAligner needs at least one thread.");
    if (opt.num_threads > 1)
        tp = std::make_unique<Pool>(opt.num_threads);
}

template <class F>
void BatchAligner::for_each(size_t n, F job) const
{
    if (tp == nullptr)
    {
        for (size_t i = 0; i < n; ++i)
            job(i);
        return;
    }

    vec<std::future<void>> results(n);
    for (size_t i = 0; i < n; ++i)
        results[i] = tp->push(pipeline::bind([&job, i](int) { job(i); }));
    // Wait for everything before rethrowing so that no job outlives `job`.
    for (auto &result : results)
        result.wait();
    for (auto &result : results)
        result.get();
}

vec<const Alignment *> BatchAligner::align(const Dataset &dataset, TextForm form) const
{
    SPDLOG_DEBUG("BatchAligner: aligning {0} examples under {1}...", dataset.size(), pipeline::current().str());
    auto ret = vec<const Alignment *>(dataset.size(), nullptr);
    for_each(dataset.size(), [&dataset, &ret, form](size_t i) { ret[i] = &dataset[i].alignment(form); });
    SPDLOG_DEBUG("BatchAligner: aligned.");
    return ret;
}

KeywordStats BatchAligner::keyword_stats(const Dataset &dataset, const string &vocab, TextForm form) const
{
    auto per_example = vec<KeywordStats>(dataset.size());
    for_each(dataset.size(), [&dataset, &per_example, &vocab, form](size_t i) { per_example[i] = dataset[i].keyword_stats(vocab, form); });
    auto ret = KeywordStats();
    for (const auto &stats : per_example)
        ret += stats;
    return ret;
}
