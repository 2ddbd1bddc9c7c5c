#pragma once

#include <stdexcept>
#include <string>

// The edit script handed to the alignment builder is malformed. This is a bug in
// whatever produced the script, never a property of the data being aligned.
class AlignmentContractError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// Mutating or re-binding an alignment that has been sealed.
class SealedAlignmentError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// Re-binding a text, token or keyword that already belongs to a parent.
class SourceAlreadySetError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// An operation needs the parent of a detached object.
class DetachedSourceError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// A reference token index (or index range) that the alignment cannot answer for.
class RefIndexError : public std::out_of_range
{
public:
    using std::out_of_range::out_of_range;
};

class PipelineError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The object was never attached to anything that owns pipeline registries.
class NoRegistryError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

// A registry is reachable but has no entry under the requested name.
class PipelineNotFoundError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

class EditScriptSourceError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
