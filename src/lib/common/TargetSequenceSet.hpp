#pragma once

#include "common/namespace.hpp"

#include <boost/optional.hpp>

#include <cstddef>
#include <stdint.h>
#include <string>
#include <vector>

BEGIN_NAMESPACE(bamkit)

struct TargetSequence {
    TargetSequence()
        : length(0)
    {}

    TargetSequence(std::string const& name, uint64_t length)
        : name(name)
        , length(length)
    {}

    bool operator==(TargetSequence const& rhs) const {
        return name == rhs.name && length == rhs.length;
    }

    bool operator!=(TargetSequence const& rhs) const {
        return !(*this == rhs);
    }

    std::string name;
    uint64_t length;
};

// The ordered reference sequences alignments are reported against. A
// sequence's index is its position in this list. Immutable once built.
class TargetSequenceSet {
public:
    typedef std::vector<TargetSequence>::const_iterator const_iterator;

    TargetSequenceSet();

    // header_text is the verbatim text header the set was read from, if
    // any. It is reproduced when the set is used to write a new stream.
    explicit TargetSequenceSet(
            std::vector<TargetSequence> const& sequences,
            std::string const& header_text = "");

    std::size_t size() const;
    bool empty() const;

    // Throws std::out_of_range if idx >= size().
    TargetSequence const& at(std::size_t idx) const;

    // Index of the first sequence called name.
    boost::optional<std::size_t> index_of(std::string const& name) const;

    boost::optional<std::string> name_of(std::size_t idx) const;
    boost::optional<uint64_t> length_of(std::size_t idx) const;

    std::string const& header_text() const;

    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(TargetSequenceSet const& rhs) const;
    bool operator!=(TargetSequenceSet const& rhs) const;

private:
    std::vector<TargetSequence> sequences_;
    std::string header_text_;
};

inline
std::size_t TargetSequenceSet::size() const {
    return sequences_.size();
}

inline
bool TargetSequenceSet::empty() const {
    return sequences_.empty();
}

inline
std::string const& TargetSequenceSet::header_text() const {
    return header_text_;
}

inline
TargetSequenceSet::const_iterator TargetSequenceSet::begin() const {
    return sequences_.begin();
}

inline
TargetSequenceSet::const_iterator TargetSequenceSet::end() const {
    return sequences_.end();
}

END_NAMESPACE(bamkit)
