#pragma once

#include "common.hpp"
#include "memo.hpp"
#include "token.hpp"

class Example;

enum class TextType : int
{
    REF,
    HYP,
    KEYWORD
};

// A reference, hypothesis or keyword string together with everything derived from it.
class Text
{
    const Example *src = nullptr;

    mutable StageCache<string> standardized_cache;
    mutable StageCache<TokenList> tokens_cache;

public:
    Text(const string &, TextType, const Example * = nullptr);

    Text(const Text &) = delete;
    Text &operator=(const Text &) = delete;

    const string raw;
    const TextType type;

    const Example *get_source() const;
    // Attach to a parent example. A text can be attached only once.
    void set_source(const Example *);
    const Pipelines *get_pipelines() const;

    // Output of the active standardizer on `raw`.
    const string &standardized() const;
    // Output of the active tokenizer on `standardized()`.
    const TokenList &tokens() const;
    string joined(TextForm = TextForm::NORMALIZED) const;
    string str() const;
};

string to_string(TextType);

// Registries reachable from `text`, or throw NoRegistryError naming the stage that needed them.
const Pipelines &require_pipelines(const Text *, Stage);
