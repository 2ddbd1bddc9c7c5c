#pragma once

#include <deque>

#include "common.hpp"
#include "memo.hpp"

class Text;
class Pipelines;

// A contiguous slice of a standardized text. Offsets are byte offsets, half-open.
class Token
{
    friend class TokenList;

    const Text *src;
    // The standardized text the offsets refer to.
    const string *context;
    mutable StageCache<string> normalized_cache;

public:
    Token(const string &, size_t, size_t, size_t, const Text * = nullptr, const string * = nullptr);

    Token(const Token &) = delete;
    Token &operator=(const Token &) = delete;

    const string raw;
    const size_t start;
    const size_t end;
    // Position in the owning token list.
    const size_t index;

    const Text *get_source() const;
    // Registries reachable through the owning text, or nullptr.
    const Pipelines *get_pipelines() const;

    // Output of the active normalizer on `raw`.
    const string &normalized() const;
    const string &text(TextForm) const;
    // The token with up to `width` bytes on either side, taken from the standardized text it was cut from.
    string inctx(size_t width = 20, bool add_ellipsis = true) const;
    string str() const;

    // Structural: `index` and the owner do not take part.
    bool operator==(const Token &) const;
    bool operator!=(const Token &) const;
};

class TokenSlice;

using PositionIndex = map<string, set<size_t>>;

// An ordered sequence of tokens. Tokens never move once the list is built, so pointers and
// references into it stay valid for the list's lifetime.
class TokenList
{
    std::deque<Token> tokens;

    OnceCell<map<size_t, size_t>> start_mapping;
    OnceCell<map<size_t, size_t>> end_mapping;
    OnceCell<PositionIndex> raw_positions;
    mutable StageCache<PositionIndex> normalized_positions;

    const PositionIndex &position_index(TextForm) const;

public:
    TokenList() = default;
    TokenList(TokenList &&) = default;
    TokenList &operator=(TokenList &&) = default;

    // `standardized` is the string the spans index into. It must outlive the list.
    static TokenList from_spans(const vec<TokenSpan> &, const Text * = nullptr, const string *standardized = nullptr);

    using const_iterator = std::deque<Token>::const_iterator;

    size_t size() const;
    bool empty() const;
    const Token &operator[](size_t) const;
    const Token &at(size_t) const;
    const Token &front() const;
    const Token &back() const;
    const_iterator begin() const;
    const_iterator end() const;

    vec<string> raw() const;
    vec<string> normalized() const;
    vec<string> texts(TextForm) const;

    // Token starting (ending) at the given byte offset, or nullptr.
    const Token *start_index_to_token(size_t) const;
    const Token *end_index_to_token(size_t) const;

    // All positions whose token text equals `text`. The raw mapping is built once; the normalized
    // one once per active configuration.
    const set<size_t> &indices(const string &, TextForm = TextForm::NORMALIZED) const;

    vec<string> ngrams(int, TextForm = TextForm::NORMALIZED) const;
    vec<vec<string>> ngram_tokens(int, TextForm = TextForm::NORMALIZED) const;

    TokenSlice slice(size_t, size_t) const;
    TokenSlice all() const;
};

// A contiguous run `[start, stop)` of a token list.
class TokenSlice
{
    const TokenList *list;

public:
    TokenSlice(const TokenList *, size_t, size_t);

    const size_t start;
    const size_t stop;

    const TokenList &get_list() const;
    size_t size() const;
    bool empty() const;
    const Token &operator[](size_t) const;
    const Token &front() const;
    const Token &back() const;

    vec<string> raw() const;
    vec<string> texts(TextForm) const;
    // Token texts separated by a single space wherever the source text had a gap between them.
    string joined(TextForm = TextForm::NORMALIZED) const;

    bool operator==(const TokenSlice &) const;
};
