#pragma once

#include "common.hpp"
#include "text.hpp"

// Every start position at which `keyword` occurs contiguously in `haystack`, as slices sorted by start.
// An empty keyword occurs nowhere.
vec<TokenSlice> find_keyword(const vec<string> &, const TokenList &, TextForm = TextForm::NORMALIZED);

// A keyword term attached to an example. Tokenized with the same pipeline as the texts it is searched in.
class Keyword : public Text
{
    mutable StageCache<vec<TokenSlice>> found_in_ref;

public:
    explicit Keyword(const string &, const Example * = nullptr);

    vec<TokenSlice> find_in_tokens(const TokenList &, TextForm = TextForm::NORMALIZED) const;
    // Occurrences in the source example's reference tokens, cached per configuration. Only the
    // normalized form depends on the active normalizer.
    const vec<TokenSlice> &find_in_ref(TextForm = TextForm::NORMALIZED) const;
};
