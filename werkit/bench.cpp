#include <cctype>
#include <random>

#include "dataset.hpp"
#include "batch.hpp"
#include "timer.hpp"
#include "spdlog/sinks/basic_file_sink.h"
#include "cxxopts.hpp"

namespace
{
    std::mt19937 rng;

    inline float randf(float high) { return std::uniform_real_distribution<float>(0.0, high)(rng); }

    inline int randint(int high) { return std::uniform_int_distribution<int>(0, high - 1)(rng); }

    vec<TokenSpan> split_whitespace(const string &text)
    {
        auto ret = vec<TokenSpan>();
        size_t i = 0;
        while (i < text.size())
        {
            while ((i < text.size()) && std::isspace(static_cast<unsigned char>(text[i])))
                ++i;
            size_t start = i;
            while ((i < text.size()) && !std::isspace(static_cast<unsigned char>(text[i])))
                ++i;
            if (i > start)
                ret.push_back(TokenSpan{text.substr(start, i - start), start, i});
        }
        return ret;
    }

    string lowercase(const string &text)
    {
        auto ret = text;
        for (auto &c : ret)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return ret;
    }

    string randw(int vocab_size) { return "W" + std::to_string(randint(vocab_size)); }

    // A hypothesis derived from `ref` by random edits, together with the edit script that derives it.
    struct Sample
    {
        vec<string> ref;
        vec<string> hyp;
        EditScript script;
    };

    Sample rands(int ref_len, int vocab_size, float edit_rate)
    {
        auto sample = Sample();
        for (int i = 0; i < ref_len; ++i)
            sample.ref.push_back(randw(vocab_size));
        size_t j = 0;
        for (size_t i = 0; i < sample.ref.size(); ++i)
        {
            float r = randf(1.0);
            if (r < edit_rate / 3.0)
                sample.script.push_back(EditOp{EditKind::DELETE, i, j});
            else if (r < edit_rate * 2.0 / 3.0)
            {
                auto word = sample.ref[i] + "x";
                sample.script.push_back(EditOp{EditKind::SUBSTITUTE, i, j});
                sample.hyp.push_back(word);
                ++j;
            }
            else
            {
                if (r < edit_rate)
                {
                    sample.script.push_back(EditOp{EditKind::INSERT, i, j});
                    sample.hyp.push_back(randw(vocab_size) + "y");
                    ++j;
                }
                sample.hyp.push_back(sample.ref[i]);
                ++j;
            }
        }
        return sample;
    }

    string script_key(const vec<string> &ref, const vec<string> &hyp) { return str::join(ref, " ") + "\n" + str::join(hyp, " "); }
} // namespace

template <class T>
void add_argument(cxxopts::Options &options, const std::string &name, const std::string &desc, const std::string &default_v)
{
    options.add_options()(name, desc, cxxopts::value<T>()->default_value(default_v));
}

void add_flag(cxxopts::Options &options, const std::string &name, const std::string &desc)
{
    options.add_options()(name, desc);
}

int main(int argc, char *argv[])
{
    cxxopts::Options parser("werkit_bench", "Align synthetic reference/hypothesis pairs and report keyword errors.");
    add_argument<int>(parser, "num_threads", "Number of threads", "1");
    add_argument<int>(parser, "num_examples", "Number of examples", "1000");
    add_argument<int>(parser, "ref_len", "Number of tokens per reference", "20");
    add_argument<int>(parser, "vocab_size", "Number of distinct words", "50");
    add_argument<float>(parser, "edit_rate", "Probability that a reference token is edited", "0.2");
    add_argument<unsigned>(parser, "random_seed", "Random seed", "0");
    add_flag(parser, "log_to_file", "Flag to log to file");
    add_flag(parser, "quiet", "Set log level to error to disable info logging.");
    add_flag(parser, "help", "Print usage.");

    auto args = parser.parse(argc, argv);
    if (args.count("help"))
    {
        std::cout << parser.help() << '\n';
        return 0;
    }
    const int num_threads = args["num_threads"].as<int>();
    const int num_examples = args["num_examples"].as<int>();
    const int ref_len = args["ref_len"].as<int>();
    const int vocab_size = args["vocab_size"].as<int>();
    const float edit_rate = args["edit_rate"].as<float>();
    const unsigned random_seed = args["random_seed"].as<unsigned>();
    const bool log_to_file = args["log_to_file"].as<bool>();
    const bool quiet = args["quiet"].as<bool>();

    if ((num_threads < 1) || (num_examples < 0) || (ref_len < 1) || (vocab_size < 1) || (edit_rate < 0.0) || (edit_rate > 1.0))
    {
        std::cerr << "Invalid arguments.\n"
                  << parser.help() << '\n';
        return 1;
    }

    rng.seed(random_seed);

    spdlog::level::level_enum level = spdlog::level::info;
    if (SPDLOG_ACTIVE_LEVEL <= SPDLOG_LEVEL_TRACE)
        level = spdlog::level::trace;
    else if (SPDLOG_ACTIVE_LEVEL <= SPDLOG_LEVEL_DEBUG)
        level = spdlog::level::debug;
    if (quiet)
        level = spdlog::level::err;
    spdlog::set_level(level);
    if (log_to_file)
    {
        auto logger = spdlog::basic_logger_mt("default", "log.txt", true);
        spdlog::set_default_logger(logger);
        logger->flush_on(level);
    }
    SPDLOG_INFO("num threads {}", num_threads);

    auto timer = Timer();
    auto dataset = Dataset();
    auto &pipelines = dataset.get_pipelines();
    pipelines.add_standardizer(pipeline::DEFAULT, [](const string &text) { return text; });
    pipelines.add_tokenizer(pipeline::DEFAULT, split_whitespace);
    pipelines.add_normalizer(pipeline::DEFAULT, [](const string &text) { return text; });
    pipelines.add_normalizer("lower", lowercase);

    // Normalized texts are looked up as well, so that the lowercasing configuration finds its scripts too.
    auto scripts = map<string, EditScript>();
    {
        auto scope = timer.start("generate");
        for (int i = 0; i < num_examples; ++i)
        {
            auto sample = rands(ref_len, vocab_size, edit_rate);
            scripts[script_key(sample.ref, sample.hyp)] = sample.script;
            auto lower_ref = vec<string>();
            auto lower_hyp = vec<string>();
            for (const auto &word : sample.ref)
                lower_ref.push_back(lowercase(word));
            for (const auto &word : sample.hyp)
                lower_hyp.push_back(lowercase(word));
            scripts[script_key(lower_ref, lower_hyp)] = sample.script;

            size_t start = randint(ref_len);
            size_t stop = std::min(start + 1 + randint(2), static_cast<size_t>(ref_len));
            auto term = str::join(vec<string>(sample.ref.begin() + start, sample.ref.begin() + stop), " ");
            dataset.add(str::join(sample.ref, " "), str::join(sample.hyp, " "), KeywordTerms{{"kw", {term}}});
        }
    }
    dataset.set_edit_script_source([&scripts](const vec<string> &ref, const vec<string> &hyp) {
        auto it = scripts.find(script_key(ref, hyp));
        if (it == scripts.end())
            throw EditScriptSourceError("No edit script generated for this pair.");
        return it->second;
    });
    SPDLOG_INFO("Generated {}.", dataset.str());
    show_size(scripts, "#edit scripts");

    auto batch_opt = BatchOpt();
    batch_opt.num_threads = num_threads;
    auto aligner = BatchAligner(batch_opt);
    for (const auto &normalizer : vec<string>{pipeline::DEFAULT, "lower"})
    {
        PipelineScope scope(pipeline::DEFAULT, pipeline::DEFAULT, normalizer);
        vec<const Alignment *> alignments;
        {
            auto ts = timer.start("align:" + normalizer);
            alignments = aligner.align(dataset);
        }
        size_t num_edits = 0;
        size_t num_ref = 0;
        for (const auto *almt : alignments)
        {
            num_edits += almt->num_edits();
            num_ref += almt->num_matches() + almt->num_substitutions() + almt->num_deletions();
        }
        KeywordStats stats;
        KeywordStats raw_stats;
        {
            auto ts = timer.start("keywords:" + normalizer);
            stats = aligner.keyword_stats(dataset, "kw");
            raw_stats = aligner.keyword_stats(dataset, "kw", TextForm::RAW);
        }
        SPDLOG_INFO("Normalizer '{0}': {1} edits over {2} reference tokens.", normalizer, num_edits, num_ref);
        SPDLOG_INFO("Normalizer '{0}': {1}/{2} keywords wrong, rate {3}.", normalizer, stats.num_errors, stats.num_keywords, stats.rate());
        SPDLOG_INFO("Normalizer '{0}': {1}/{2} keywords wrong against raw alignments.", normalizer, raw_stats.num_errors, raw_stats.num_keywords);
        if (!alignments.empty())
            SPDLOG_DEBUG("First alignment: {}", alignments.front()->str());
    }
    timer.show_stats();
}
