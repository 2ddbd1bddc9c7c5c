#pragma once

#include <deque>
#include <functional>

#include "common.hpp"
#include "pipeline.hpp"
#include "text.hpp"
#include "keyword.hpp"
#include "alignment.hpp"
#include "alignment_builder.hpp"

// Produces the sparse edit script between two token text sequences (reference first).
using EditScriptSource = std::function<EditScript(const vec<string> &, const vec<string> &)>;

using KeywordTerms = map<string, vec<string>>;

struct DatasetOpt
{
    // Drop (with a warning) keyword terms that do not occur in the raw reference.
    bool drop_missing_keywords = true;
};

// Keyword occurrences in references and how many of them the hypotheses got wrong.
struct KeywordStats
{
    size_t num_keywords = 0;
    size_t num_errors = 0;

    // Errors per keyword occurrence. With no occurrences at all, the error count itself.
    float rate() const;
    KeywordStats &operator+=(const KeywordStats &);
};

class Dataset;

class Example
{
    friend class Dataset;

    const Dataset *src;
    std::deque<Keyword> keyword_store;
    map<string, vec<const Keyword *>> keywords;
    mutable StageCache<Alignment> raw_alignments;
    mutable StageCache<Alignment> normalized_alignments;

    Example(const Dataset *, size_t, const string &, const string &, const KeywordTerms &, bool);

public:
    Example(const Example &) = delete;
    Example &operator=(const Example &) = delete;

    const size_t index;
    const Text ref;
    const Text hyp;

    const Dataset *get_source() const;
    const Pipelines *get_pipelines() const;

    bool has_vocab(const string &) const;
    const vec<const Keyword *> &get_keywords(const string &) const;
    vec<string> get_vocabs() const;

    // Alignment of the reference and hypothesis tokens under the active configuration, sealed to this
    // example.
    const Alignment &alignment(TextForm = TextForm::NORMALIZED) const;
    // A keyword occurrence counts as an error unless every op over its reference tokens is a match.
    KeywordStats keyword_stats(const string &, TextForm = TextForm::NORMALIZED) const;

    string str() const;
};

class Dataset
{
    Pipelines pipelines;
    EditScriptSource edit_script_source;
    vec<std::unique_ptr<Example>> examples;

public:
    explicit Dataset(const DatasetOpt & = DatasetOpt());

    Dataset(const Dataset &) = delete;
    Dataset &operator=(const Dataset &) = delete;

    const DatasetOpt opt;

    Pipelines &get_pipelines();
    const Pipelines &get_pipelines() const;

    void set_edit_script_source(EditScriptSource);
    // Throws EditScriptSourceError if none has been installed.
    const EditScriptSource &get_edit_script_source() const;

    Example &add(const string &, const string &, const KeywordTerms & = KeywordTerms());

    size_t size() const;
    bool empty() const;
    const Example &operator[](size_t) const;
    const Example &at(size_t) const;

    KeywordStats keyword_stats(const string &, TextForm = TextForm::NORMALIZED) const;
    string str() const;
};
