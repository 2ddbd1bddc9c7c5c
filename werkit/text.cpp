#include "text.hpp"
#include "dataset.hpp"

Text::Text(const string &raw,
           TextType type,
           const Example *src) : src(src),
                                 raw(raw),
                                 type(type) {}

const Example *Text::get_source() const { return src; }

void Text::set_source(const Example *example)
{
    if (src != nullptr)
        throw SourceAlreadySetError("Source already set for " + str() + ".");
    src = example;
}

const Pipelines *Text::get_pipelines() const { return (src == nullptr) ? nullptr : src->get_pipelines(); }

const string &Text::standardized() const
{
    auto key = pipeline::current().prefix(Stage::STANDARDIZE);
    return standardized_cache.get(key, [this, &key]() {
        const auto &standardizer = require_pipelines(this, Stage::STANDARDIZE).get_standardizer(key.standardizer());
        return standardizer(raw);
    });
}

const TokenList &Text::tokens() const
{
    auto key = pipeline::current().prefix(Stage::TOKENIZE);
    return tokens_cache.get(key, [this, &key]() {
        const auto &tokenizer = require_pipelines(this, Stage::TOKENIZE).get_tokenizer(key.tokenizer());
        const auto &standardized_text = standardized();
        auto ret = TokenList::from_spans(tokenizer(standardized_text), this, &standardized_text);
        SPDLOG_TRACE("Text: tokenized {0} into {1} tokens under {2}.", str(), ret.size(), key.str());
        return ret;
    });
}

string Text::joined(TextForm form) const { return tokens().all().joined(form); }

string Text::str() const
{
    auto name = (type == TextType::KEYWORD) ? "Keyword" : "Text";
    return string(name) + "(\"" + str::clip(raw, 46) + "\")";
}

string to_string(TextType type)
{
    switch (type)
    {
    case TextType::REF:
        return "ref";
    case TextType::HYP:
        return "hyp";
    case TextType::KEYWORD:
        return "keyword";
    }
    return "unknown";
}

const Pipelines &require_pipelines(const Text *text, Stage stage)
{
    const Pipelines *pipelines = (text == nullptr) ? nullptr : text->get_pipelines();
    if (pipelines == nullptr)
        throw NoRegistryError("No " + to_string(stage) + "s found in pipelines: the text is not attached to a dataset.");
    return *pipelines;
}
