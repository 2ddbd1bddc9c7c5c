#include "pipeline.hpp"

namespace
{
    void check_name(const string &name)
    {
        if (name.empty())
            throw std::invalid_argument("Pipeline names must be non-empty.");
    }

    thread_local PipelineKey active = PipelineKey();

    template <class F>
    const F &lookup(const map<string, F> &registry, const string &name, Stage stage)
    {
        auto it = registry.find(name);
        if (it == registry.end())
            throw PipelineNotFoundError("'" + name + "' not found in " + to_string(stage) + "s.");
        return it->second;
    }

    template <class F>
    void insert(map<string, F> &registry, const string &name, F func, Stage stage)
    {
        check_name(name);
        if (!func)
            throw std::invalid_argument("Cannot register an empty " + to_string(stage) + " under '" + name + "'.");
        registry[name] = std::move(func);
        SPDLOG_DEBUG("Pipelines: registered {0} '{1}'.", to_string(stage), name);
    }
} // namespace

PipelineKey::PipelineKey() : names{pipeline::DEFAULT, pipeline::DEFAULT, pipeline::DEFAULT} {}

PipelineKey::PipelineKey(const array<string, NUM_STAGES> &names) : names(names) {}

PipelineKey::PipelineKey(const string &standardizer,
                         const string &tokenizer,
                         const string &normalizer) : names{standardizer, tokenizer, normalizer}
{
    for (const auto &name : names)
        check_name(name);
}

const string &PipelineKey::name_at(Stage stage) const { return names[static_cast<size_t>(stage)]; }

PipelineKey PipelineKey::prefix(Stage stage) const
{
    auto ret = names;
    for (size_t i = static_cast<size_t>(stage) + 1; i < NUM_STAGES; ++i)
        ret[i].clear();
    return PipelineKey(ret);
}

size_t PipelineKey::depth() const
{
    size_t ret = 0;
    while ((ret < NUM_STAGES) && (!names[ret].empty()))
        ++ret;
    return ret;
}

size_t PipelineKey::hash() const { return boost::hash_range(names.begin(), names.end()); }

string PipelineKey::str() const
{
    auto parts = vec<string>();
    for (size_t i = 0; i < depth(); ++i)
        parts.push_back(names[i]);
    return "(" + str::join(parts, ", ") + ")";
}

bool PipelineKey::operator==(const PipelineKey &other) const { return names == other.names; }

bool PipelineKey::operator!=(const PipelineKey &other) const { return names != other.names; }

void PipelineKey::swap(PipelineKey &other) noexcept { names.swap(other.names); }

const PipelineKey &pipeline::current() { return active; }

PipelineScope::PipelineScope(const PipelineKey &key) : saved(key)
{
    saved.swap(active);
    SPDLOG_TRACE("PipelineScope: activated {0}, saved {1}.", active.str(), saved.str());
}

PipelineScope::PipelineScope(const string &standardizer,
                             const string &tokenizer,
                             const string &normalizer) : PipelineScope(PipelineKey(standardizer, tokenizer, normalizer)) {}

PipelineScope::~PipelineScope() { saved.swap(active); }

void Pipelines::add_standardizer(const string &name, Standardizer func) { insert(standardizers, name, std::move(func), Stage::STANDARDIZE); }
void Pipelines::add_tokenizer(const string &name, Tokenizer func) { insert(tokenizers, name, std::move(func), Stage::TOKENIZE); }
void Pipelines::add_normalizer(const string &name, Normalizer func) { insert(normalizers, name, std::move(func), Stage::NORMALIZE); }

const Standardizer &Pipelines::get_standardizer(const string &name) const { return lookup(standardizers, name, Stage::STANDARDIZE); }
const Tokenizer &Pipelines::get_tokenizer(const string &name) const { return lookup(tokenizers, name, Stage::TOKENIZE); }
const Normalizer &Pipelines::get_normalizer(const string &name) const { return lookup(normalizers, name, Stage::NORMALIZE); }

bool Pipelines::contains(Stage stage, const string &name) const
{
    switch (stage)
    {
    case Stage::STANDARDIZE:
        return standardizers.contains(name);
    case Stage::TOKENIZE:
        return tokenizers.contains(name);
    case Stage::NORMALIZE:
        return normalizers.contains(name);
    }
    return false;
}

size_t Pipelines::size(Stage stage) const
{
    switch (stage)
    {
    case Stage::STANDARDIZE:
        return standardizers.size();
    case Stage::TOKENIZE:
        return tokenizers.size();
    case Stage::NORMALIZE:
        return normalizers.size();
    }
    return 0;
}

string to_string(Stage stage)
{
    switch (stage)
    {
    case Stage::STANDARDIZE:
        return "standardizer";
    case Stage::TOKENIZE:
        return "tokenizer";
    case Stage::NORMALIZE:
        return "normalizer";
    }
    return "unknown stage";
}
