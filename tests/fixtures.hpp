#pragma once

#include <atomic>
#include <cmath>
#include <cctype>

#include "../werkit/dataset.hpp"

namespace tests
{
    inline vec<TokenSpan> split_whitespace(const string &text)
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

    // Every non-space byte is its own token.
    inline vec<TokenSpan> split_chars(const string &text)
    {
        auto ret = vec<TokenSpan>();
        for (size_t i = 0; i < text.size(); ++i)
            if (!std::isspace(static_cast<unsigned char>(text[i])))
                ret.push_back(TokenSpan{text.substr(i, 1), i, i + 1});
        return ret;
    }

    inline string lowercase(const string &text)
    {
        auto ret = text;
        for (auto &c : ret)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return ret;
    }

    inline string identity(const string &text) { return text; }

    // Invocation counts of the counting pipelines registered by `register_pipelines`.
    struct Counters
    {
        std::atomic<int> standardize{0};
        std::atomic<int> tokenize{0};
        std::atomic<int> normalize{0};
    };

    // "default" is the identity (whitespace tokenizer), "lower" lowercases, "chars" splits bytes and
    // "counting" is the default counted in `counters`.
    inline void register_pipelines(Pipelines &pipelines, Counters *counters = nullptr)
    {
        pipelines.add_standardizer(pipeline::DEFAULT, identity);
        pipelines.add_standardizer("lower", lowercase);
        pipelines.add_tokenizer(pipeline::DEFAULT, split_whitespace);
        pipelines.add_tokenizer("chars", split_chars);
        pipelines.add_normalizer(pipeline::DEFAULT, identity);
        pipelines.add_normalizer("lower", lowercase);
        if (counters == nullptr)
            return;
        pipelines.add_standardizer("counting", [counters](const string &text) { ++counters->standardize; return text; });
        pipelines.add_tokenizer("counting", [counters](const string &text) { ++counters->tokenize; return split_whitespace(text); });
        pipelines.add_normalizer("counting", [counters](const string &text) { ++counters->normalize; return text; });
    }

    // Byte spans of `texts` laid out with single spaces in between.
    inline vec<Span> spans_of(const vec<string> &texts)
    {
        auto ret = vec<Span>();
        size_t offset = 0;
        for (const auto &text : texts)
        {
            ret.push_back(Span{offset, offset + text.size()});
            offset += text.size() + 1;
        }
        return ret;
    }

    inline Alignment build(const vec<string> &ref, const vec<string> &hyp, const EditScript &script)
    {
        return AlignmentBuilder::build(ref, spans_of(ref), hyp, spans_of(hyp), script);
    }

    inline EditOp sub(size_t r, size_t h) { return EditOp{EditKind::SUBSTITUTE, r, h}; }
    inline EditOp ins(size_t h) { return EditOp{EditKind::INSERT, std::nullopt, h}; }
    inline EditOp del(size_t r) { return EditOp{EditKind::DELETE, r, std::nullopt}; }

    inline string pair_key(const vec<string> &ref, const vec<string> &hyp) { return str::join(ref, " ") + "|" + str::join(hyp, " "); }

    // An edit script source answering from a fixed table keyed by the joined token texts. Pairs that
    // are not in the table are treated as identical sequences.
    struct ScriptTable
    {
        map<string, EditScript> scripts;
        std::atomic<int> calls{0};

        void add(const vec<string> &ref, const vec<string> &hyp, const EditScript &script) { scripts[pair_key(ref, hyp)] = script; }

        EditScriptSource source()
        {
            return [this](const vec<string> &ref, const vec<string> &hyp) {
                ++calls;
                auto it = scripts.find(pair_key(ref, hyp));
                return (it == scripts.end()) ? EditScript() : it->second;
            };
        }
    };

    // Reference-side texts (inserts skipped) and hypothesis-side texts (deletes skipped).
    inline pair<vec<string>, vec<string>> sides(const Alignment &almt)
    {
        auto ref = vec<string>();
        auto hyp = vec<string>();
        for (const auto &o : almt)
        {
            if (const auto *r = op::ref_text(o))
                ref.push_back(*r);
            if (const auto *h = op::hyp_text(o))
                hyp.push_back(*h);
        }
        return {ref, hyp};
    }
} // namespace tests
