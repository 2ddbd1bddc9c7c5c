#include "dataset.hpp"

float KeywordStats::rate() const
{
    if (num_keywords == 0)
        return static_cast<float>(num_errors);
    return static_cast<float>(num_errors) / static_cast<float>(num_keywords);
}

KeywordStats &KeywordStats::operator+=(const KeywordStats &other)
{
    num_keywords += other.num_keywords;
    num_errors += other.num_errors;
    return *this;
}

/* ------------------------------------------------------------ */
/*                            Example                           */
/* ------------------------------------------------------------ */

Example::Example(const Dataset *src,
                 size_t index,
                 const string &ref_raw,
                 const string &hyp_raw,
                 const KeywordTerms &terms,
                 bool drop_missing) : src(src),
                                      index(index),
                                      ref(ref_raw, TextType::REF, this),
                                      hyp(hyp_raw, TextType::HYP, this)
{
    for (const auto &item : terms)
    {
        auto kept = vec<const Keyword *>();
        for (const auto &term : item.second)
        {
            if (drop_missing && (ref.raw.find(term) == string::npos))
            {
                SPDLOG_WARN("Keyword '{0}' not found in reference for example {1}. Will not be included.", term, index);
                continue;
            }
            keyword_store.emplace_back(term, this);
            kept.push_back(&keyword_store.back());
        }
        if (!kept.empty())
            keywords[item.first] = std::move(kept);
    }
}

const Dataset *Example::get_source() const { return src; }

const Pipelines *Example::get_pipelines() const { return (src == nullptr) ? nullptr : &src->get_pipelines(); }

bool Example::has_vocab(const string &vocab) const { return keywords.contains(vocab); }

const vec<const Keyword *> &Example::get_keywords(const string &vocab) const
{
    static const vec<const Keyword *> none = vec<const Keyword *>();
    auto it = keywords.find(vocab);
    return (it == keywords.end()) ? none : it->second;
}

vec<string> Example::get_vocabs() const
{
    auto ret = vec<string>();
    for (const auto &item : keywords)
        ret.push_back(item.first);
    std::sort(ret.begin(), ret.end());
    return ret;
}

const Alignment &Example::alignment(TextForm form) const
{
    const auto &full = pipeline::current();
    bool raw = (form == TextForm::RAW);
    auto key = raw ? full.prefix(Stage::TOKENIZE) : full;
    auto &cache = raw ? raw_alignments : normalized_alignments;
    return cache.get(key, [this, form, &key]() {
        if (src == nullptr)
            throw NoRegistryError("Example " + std::to_string(index) + " is not attached to a dataset.");
        const auto &source = src->get_edit_script_source();
        const auto &ref_tokens = ref.tokens();
        const auto &hyp_tokens = hyp.tokens();
        auto script = source(ref_tokens.texts(form), hyp_tokens.texts(form));
        auto ret = AlignmentBuilder::build(ref_tokens, hyp_tokens, script, form);
        ret.seal(this);
        SPDLOG_DEBUG("Example {0}: {1} alignment under {2} has {3} edits.", index, str::from(form), key.str(), ret.num_edits());
        return ret;
    });
}

KeywordStats Example::keyword_stats(const string &vocab, TextForm form) const
{
    auto stats = KeywordStats();
    const auto &terms = get_keywords(vocab);
    if (terms.empty())
        return stats;
    // Keywords are always located on normalized tokens. `form` picks the alignment they are scored against.
    const auto &almt = alignment(form);
    for (const auto *keyword : terms)
        for (const auto &found : keyword->find_in_ref(TextForm::NORMALIZED))
        {
            ++stats.num_keywords;
            auto ops = almt.ops_from_ref_index(found.front().index, found.back().index);
            if (ops.num_matches() != ops.size())
                ++stats.num_errors;
        }
    return stats;
}

string Example::str() const
{
    return "Example(ref=\"" + str::clip(ref.raw, 45) + "\", hyp=\"" + str::clip(hyp.raw, 45) + "\")";
}

/* ------------------------------------------------------------ */
/*                            Dataset                           */
/* ------------------------------------------------------------ */

Dataset::Dataset(const DatasetOpt &opt) : opt(opt) {}

Pipelines &Dataset::get_pipelines() { return pipelines; }
const Pipelines &Dataset::get_pipelines() const { return pipelines; }

void Dataset::set_edit_script_source(EditScriptSource source) { edit_script_source = std::move(source); }

const EditScriptSource &Dataset::get_edit_script_source() const
{
    if (!edit_script_source)
        throw EditScriptSourceError("No edit script source installed on the dataset.");
    return edit_script_source;
}

Example &Dataset::add(const string &ref, const string &hyp, const KeywordTerms &terms)
{
    auto example = std::unique_ptr<Example>(new Example(this, examples.size(), ref, hyp, terms, opt.drop_missing_keywords));
    examples.push_back(std::move(example));
    return *examples.back();
}

size_t Dataset::size() const { return examples.size(); }
bool Dataset::empty() const { return examples.empty(); }
const Example &Dataset::operator[](size_t i) const { return *examples[i]; }
const Example &Dataset::at(size_t i) const { return *examples.at(i); }

KeywordStats Dataset::keyword_stats(const string &vocab, TextForm form) const
{
    auto stats = KeywordStats();
    for (const auto &example : examples)
        stats += example->keyword_stats(vocab, form);
    return stats;
}

string Dataset::str() const { return "Dataset(" + std::to_string(examples.size()) + " examples)"; }
