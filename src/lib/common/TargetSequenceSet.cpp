#include "TargetSequenceSet.hpp"

#include <boost/format.hpp>

#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(bamkit)

TargetSequenceSet::TargetSequenceSet()
{
}

TargetSequenceSet::TargetSequenceSet(
        std::vector<TargetSequence> const& sequences,
        std::string const& header_text)
    : sequences_(sequences)
    , header_text_(header_text)
{
}

TargetSequence const& TargetSequenceSet::at(std::size_t idx) const {
    if (idx >= sequences_.size()) {
        throw std::out_of_range(str(format(
            "Target sequence index %1% out of range (%2% sequences)"
            ) % idx % sequences_.size()));
    }
    return sequences_[idx];
}

boost::optional<std::size_t> TargetSequenceSet::index_of(std::string const& name) const {
    for (std::size_t i = 0; i < sequences_.size(); ++i) {
        if (sequences_[i].name == name)
            return i;
    }
    return boost::none;
}

boost::optional<std::string> TargetSequenceSet::name_of(std::size_t idx) const {
    if (idx >= sequences_.size())
        return boost::none;
    return sequences_[idx].name;
}

boost::optional<uint64_t> TargetSequenceSet::length_of(std::size_t idx) const {
    if (idx >= sequences_.size())
        return boost::none;
    return sequences_[idx].length;
}

bool TargetSequenceSet::operator==(TargetSequenceSet const& rhs) const {
    return sequences_ == rhs.sequences_;
}

bool TargetSequenceSet::operator!=(TargetSequenceSet const& rhs) const {
    return !(*this == rhs);
}

END_NAMESPACE(bamkit)
