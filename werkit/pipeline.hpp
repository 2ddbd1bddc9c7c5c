#pragma once

#include <functional>

#include "common.hpp"
#include "errors.hpp"

// Pipeline stages in the order they are applied. Each stage consumes the output of the previous one.
enum class Stage : int
{
    STANDARDIZE,
    TOKENIZE,
    NORMALIZE
};

constexpr size_t NUM_STAGES = 3;

namespace pipeline
{
    inline const string DEFAULT = "default";
};

// A token as reported by a tokenizer: the matched text and its byte range in the tokenized string.
struct TokenSpan
{
    string raw;
    size_t start;
    size_t end;
};

using Standardizer = std::function<string(const string &)>;
using Tokenizer = std::function<vec<TokenSpan>(const string &)>;
using Normalizer = std::function<string(const string &)>;

// The active function name for every stage.
class PipelineKey
{
    array<string, NUM_STAGES> names;

    PipelineKey(const array<string, NUM_STAGES> &);

public:
    PipelineKey();
    PipelineKey(const string &, const string &, const string &);

    const string &name_at(Stage) const;
    inline const string &standardizer() const { return name_at(Stage::STANDARDIZE); }
    inline const string &tokenizer() const { return name_at(Stage::TOKENIZE); }
    inline const string &normalizer() const { return name_at(Stage::NORMALIZE); }

    // Key for a value derived at `stage`. Names of later stages are blanked out since they cannot affect it.
    PipelineKey prefix(Stage) const;
    // Number of stages that carry a name.
    size_t depth() const;
    size_t hash() const;
    string str() const;

    bool operator==(const PipelineKey &) const;
    bool operator!=(const PipelineKey &) const;

    void swap(PipelineKey &) noexcept;
};

namespace std
{
    template <>
    class hash<PipelineKey>
    {
    public:
        inline size_t operator()(const PipelineKey &k) const { return k.hash(); }
    };
}; // namespace std

namespace pipeline
{
    // The configuration active for the calling task.
    const PipelineKey &current();

    // Wrap `f` so that it runs under the configuration active right now, whichever thread ends up calling it.
    template <class F>
    auto bind(F f);
};

// Activates a configuration until the end of the enclosing block. The previous configuration is
// restored on every exit path, exceptions included. Scopes nest.
class PipelineScope
{
    PipelineKey saved;

public:
    explicit PipelineScope(const PipelineKey &);
    PipelineScope(const string &standardizer, const string &tokenizer, const string &normalizer);
    ~PipelineScope();

    PipelineScope(const PipelineScope &) = delete;
    PipelineScope &operator=(const PipelineScope &) = delete;
};

template <class F>
auto pipeline::bind(F f)
{
    auto key = pipeline::current();
    return [key, f](auto &&...args) mutable {
        PipelineScope scope(key);
        return f(std::forward<decltype(args)>(args)...);
    };
}

// Named functions for every stage. Strings are only used to find an entry; callers hold on to the
// returned function for the actual work.
class Pipelines
{
    map<string, Standardizer> standardizers;
    map<string, Tokenizer> tokenizers;
    map<string, Normalizer> normalizers;

public:
    void add_standardizer(const string &, Standardizer);
    void add_tokenizer(const string &, Tokenizer);
    void add_normalizer(const string &, Normalizer);

    const Standardizer &get_standardizer(const string &) const;
    const Tokenizer &get_tokenizer(const string &) const;
    const Normalizer &get_normalizer(const string &) const;

    bool contains(Stage, const string &) const;
    size_t size(Stage) const;
};

string to_string(Stage);
