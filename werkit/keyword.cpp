#include "keyword.hpp"
#include "dataset.hpp"

vec<TokenSlice> find_keyword(const vec<string> &keyword, const TokenList &haystack, TextForm form)
{
    if (keyword.empty())
        return vec<TokenSlice>();

    // Candidate starts are positions of the first token; every further token at relative offset `o`
    // keeps only the starts `p` for which `p + o` carries that token.
    const auto &first = haystack.indices(keyword[0], form);
    auto candidates = set<size_t>(first.begin(), first.end());
    for (size_t offset = 1; offset < keyword.size(); ++offset)
    {
        if (candidates.empty())
            break;
        const auto &positions = haystack.indices(keyword[offset], form);
        auto kept = set<size_t>();
        for (size_t p : candidates)
            if (positions.contains(p + offset))
                kept.insert(p);
        candidates = std::move(kept);
    }
    if (candidates.empty())
    {
        SPDLOG_TRACE("find_keyword: no match for \"{}\".", str::join(keyword, " "));
        return vec<TokenSlice>();
    }

    auto starts = vec<size_t>(candidates.begin(), candidates.end());
    std::sort(starts.begin(), starts.end());
    auto ret = vec<TokenSlice>();
    ret.reserve(starts.size());
    for (size_t start : starts)
        ret.push_back(haystack.slice(start, start + keyword.size()));
    return ret;
}

Keyword::Keyword(const string &raw, const Example *src) : Text(raw, TextType::KEYWORD, src) {}

vec<TokenSlice> Keyword::find_in_tokens(const TokenList &haystack, TextForm form) const
{
    return find_keyword(tokens().texts(form), haystack, form);
}

const vec<TokenSlice> &Keyword::find_in_ref(TextForm form) const
{
    const auto *example = get_source();
    if (example == nullptr)
        throw DetachedSourceError("Source example is not set. Cannot search reference tokens for " + str() + ".");
    const auto &full = pipeline::current();
    auto key = (form == TextForm::RAW) ? full.prefix(Stage::TOKENIZE) : full;
    return found_in_ref.get(key, [this, example, form]() { return find_in_tokens(example->ref.tokens(), form); });
}
