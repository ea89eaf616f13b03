#include "SplicedLocation.hpp"

#include <stdexcept>

BEGIN_NAMESPACE(bamkit)

SplicedLocation::SplicedLocation(std::vector<Interval> const& segments, strand_e strand)
    : segments_(segments)
    , strand_(strand)
{
    if (segments_.empty())
        throw std::invalid_argument("SplicedLocation needs at least one segment");

    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (segments_[i].end <= segments_[i].start)
            throw std::invalid_argument("SplicedLocation segments must not be empty");
        if (i > 0 && segments_[i].start < segments_[i - 1].end)
            throw std::invalid_argument("SplicedLocation segments must be ordered and disjoint");
    }
}

uint64_t SplicedLocation::length() const {
    uint64_t rv = 0;
    for (std::size_t i = 0; i < segments_.size(); ++i)
        rv += segments_[i].length();
    return rv;
}

bool SplicedLocation::operator==(SplicedLocation const& rhs) const {
    return strand_ == rhs.strand_ && segments_ == rhs.segments_;
}

bool SplicedLocation::operator!=(SplicedLocation const& rhs) const {
    return !(*this == rhs);
}

boost::optional<SplicedLocation> cigar_to_spliced_location(
        uint64_t position,
        Cigar const& cigar,
        strand_e strand)
{
    std::vector<Interval> segments;
    uint64_t cursor = position;
    Interval current(position, position);

    for (Cigar::const_iterator i = cigar.begin(); i != cigar.end(); ++i) {
        switch (i->op) {
            case CIGAR_MATCH:
            case CIGAR_DEL:
            case CIGAR_SEQ_MATCH:
            case CIGAR_SEQ_MISMATCH:
                cursor += i->length;
                current.end = cursor;
                break;

            case CIGAR_REF_SKIP:
                if (current.length() > 0)
                    segments.push_back(current);
                cursor += i->length;
                current = Interval(cursor, cursor);
                break;

            default:
                break;
        }
    }

    if (current.length() > 0)
        segments.push_back(current);

    if (segments.empty())
        return boost::none;

    return SplicedLocation(segments, strand);
}

std::ostream& operator<<(std::ostream& stream, Interval const& iv) {
    return stream << iv.start << "-" << iv.end;
}

std::ostream& operator<<(std::ostream& stream, SplicedLocation const& loc) {
    std::vector<Interval> const& segs = loc.segments();
    for (std::size_t i = 0; i < segs.size(); ++i) {
        if (i > 0)
            stream << ",";
        stream << segs[i];
    }
    return stream << "(" << strand_char(loc.strand()) << ")";
}

std::ostream& operator<<(std::ostream& stream, SeqLocation const& loc) {
    return stream << loc.seq_name << ":" << loc.location;
}

END_NAMESPACE(bamkit)
