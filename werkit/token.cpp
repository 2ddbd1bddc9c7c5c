#include "token.hpp"
#include "text.hpp"

Token::Token(const string &raw,
             size_t start,
             size_t end,
             size_t index,
             const Text *src,
             const string *context) : src(src),
                                      context(context),
                                      raw(raw),
                                      start(start),
                                      end(end),
                                      index(index)
{
    if (start > end)
        throw std::invalid_argument("Token '" + raw + "' ends (" + std::to_string(end) + ") before it starts (" + std::to_string(start) + ").");
}

const Text *Token::get_source() const { return src; }

const Pipelines *Token::get_pipelines() const { return (src == nullptr) ? nullptr : src->get_pipelines(); }

const string &Token::normalized() const
{
    const auto &key = pipeline::current();
    return normalized_cache.get(key, [this, &key]() {
        const auto &normalizer = require_pipelines(src, Stage::NORMALIZE).get_normalizer(key.normalizer());
        return normalizer(raw);
    });
}

const string &Token::text(TextForm form) const { return (form == TextForm::RAW) ? raw : normalized(); }

string Token::inctx(size_t width, bool add_ellipsis) const
{
    if (context == nullptr)
        throw DetachedSourceError("Source text is not set. Cannot get context for token '" + raw + "'.");
    const auto &whole = *context;
    if (end > whole.size())
        throw std::out_of_range("Token '" + raw + "' ends past its source text.");
    width = std::min(width, whole.size());
    size_t lo = (start > width) ? start - width : 0;
    size_t hi = std::min(whole.size(), end + width);
    auto ret = whole.substr(lo, hi - lo);
    if (add_ellipsis)
    {
        if (start > width)
            ret = "..." + ret;
        if (end + width < whole.size())
            ret += "...";
    }
    return ret;
}

string Token::str() const { return "Token(\"" + raw + "\")"; }

bool Token::operator==(const Token &other) const
{
    return (start == other.start) && (end == other.end) && (raw == other.raw);
}

bool Token::operator!=(const Token &other) const { return !(*this == other); }

/* ------------------------------------------------------------ */
/*                           TokenList                          */
/* ------------------------------------------------------------ */

TokenList TokenList::from_spans(const vec<TokenSpan> &spans, const Text *src, const string *standardized)
{
    auto ret = TokenList();
    for (size_t i = 0; i < spans.size(); ++i)
        ret.tokens.emplace_back(spans[i].raw, spans[i].start, spans[i].end, i, src, standardized);
    return ret;
}

size_t TokenList::size() const { return tokens.size(); }
bool TokenList::empty() const { return tokens.empty(); }
const Token &TokenList::operator[](size_t i) const { return tokens[i]; }
const Token &TokenList::at(size_t i) const { return tokens.at(i); }
const Token &TokenList::front() const { return tokens.front(); }
const Token &TokenList::back() const { return tokens.back(); }
TokenList::const_iterator TokenList::begin() const { return tokens.begin(); }
TokenList::const_iterator TokenList::end() const { return tokens.end(); }

vec<string> TokenList::raw() const { return texts(TextForm::RAW); }

vec<string> TokenList::normalized() const { return texts(TextForm::NORMALIZED); }

vec<string> TokenList::texts(TextForm form) const
{
    auto ret = vec<string>();
    ret.reserve(tokens.size());
    for (const auto &token : tokens)
        ret.push_back(token.text(form));
    return ret;
}

const Token *TokenList::start_index_to_token(size_t char_index) const
{
    const auto &mapping = start_mapping.get([this]() {
        auto ret = map<size_t, size_t>();
        for (size_t i = 0; i < tokens.size(); ++i)
            ret[tokens[i].start] = i;
        return ret;
    });
    auto it = mapping.find(char_index);
    return (it == mapping.end()) ? nullptr : &tokens[it->second];
}

const Token *TokenList::end_index_to_token(size_t char_index) const
{
    const auto &mapping = end_mapping.get([this]() {
        auto ret = map<size_t, size_t>();
        for (size_t i = 0; i < tokens.size(); ++i)
            ret[tokens[i].end] = i;
        return ret;
    });
    auto it = mapping.find(char_index);
    return (it == mapping.end()) ? nullptr : &tokens[it->second];
}

const PositionIndex &TokenList::position_index(TextForm form) const
{
    auto build = [this, form]() {
        auto ret = PositionIndex();
        for (size_t i = 0; i < tokens.size(); ++i)
            ret[tokens[i].text(form)].insert(i);
        return ret;
    };
    if (form == TextForm::RAW)
        return raw_positions.get(build);
    return normalized_positions.get(pipeline::current(), build);
}

const set<size_t> &TokenList::indices(const string &text, TextForm form) const
{
    static const set<size_t> none = set<size_t>();
    const auto &mapping = position_index(form);
    auto it = mapping.find(text);
    return (it == mapping.end()) ? none : it->second;
}

vec<string> TokenList::ngrams(int n, TextForm form) const
{
    if (n < 1)
        throw std::invalid_argument("n must be a positive integer, got " + std::to_string(n) + ".");
    if (n == 1)
        return texts(form);
    auto ret = vec<string>();
    for (size_t i = 0; i + n <= tokens.size(); ++i)
        ret.push_back(slice(i, i + n).joined(form));
    return ret;
}

vec<vec<string>> TokenList::ngram_tokens(int n, TextForm form) const
{
    if (n < 1)
        throw std::invalid_argument("n must be a positive integer, got " + std::to_string(n) + ".");
    auto ret = vec<vec<string>>();
    for (size_t i = 0; i + n <= tokens.size(); ++i)
        ret.push_back(slice(i, i + n).texts(form));
    return ret;
}

TokenSlice TokenList::slice(size_t start, size_t stop) const { return TokenSlice(this, start, stop); }

TokenSlice TokenList::all() const { return TokenSlice(this, 0, tokens.size()); }

/* ------------------------------------------------------------ */
/*                          TokenSlice                          */
/* ------------------------------------------------------------ */

TokenSlice::TokenSlice(const TokenList *list,
                       size_t start,
                       size_t stop) : list(list),
                                      start(start),
                                      stop(stop)
{
    if ((start > stop) || (stop > list->size()))
        throw std::out_of_range("Invalid token slice [" + std::to_string(start) + ", " + std::to_string(stop) +
                                ") over " + std::to_string(list->size()) + " tokens.");
}

const TokenList &TokenSlice::get_list() const { return *list; }
size_t TokenSlice::size() const { return stop - start; }
bool TokenSlice::empty() const { return start == stop; }
const Token &TokenSlice::operator[](size_t i) const { return (*list)[start + i]; }
const Token &TokenSlice::front() const { return (*list)[start]; }
const Token &TokenSlice::back() const { return (*list)[stop - 1]; }

vec<string> TokenSlice::raw() const { return texts(TextForm::RAW); }

vec<string> TokenSlice::texts(TextForm form) const
{
    auto ret = vec<string>();
    ret.reserve(size());
    for (size_t i = start; i < stop; ++i)
        ret.push_back((*list)[i].text(form));
    return ret;
}

string TokenSlice::joined(TextForm form) const
{
    string ret;
    size_t prev_end = 0;
    for (size_t i = start; i < stop; ++i)
    {
        const auto &token = (*list)[i];
        if ((i > start) && (token.start > prev_end))
            ret += ' ';
        ret += token.text(form);
        prev_end = token.end;
    }
    return ret;
}

bool TokenSlice::operator==(const TokenSlice &other) const
{
    return (list == other.list) && (start == other.start) && (stop == other.stop);
}
