#pragma once

#include "common/Cigar.hpp"
#include "common/ReadFlags.hpp"
#include "common/namespace.hpp"

#include <boost/optional.hpp>

#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

BEGIN_NAMESPACE(bamkit)

// 0-based, half open
struct Interval {
    Interval()
        : start(0)
        , end(0)
    {}

    Interval(uint64_t start, uint64_t end)
        : start(start)
        , end(end)
    {}

    uint64_t length() const {
        return end - start;
    }

    bool operator==(Interval const& rhs) const {
        return start == rhs.start && end == rhs.end;
    }

    bool operator!=(Interval const& rhs) const {
        return !(*this == rhs);
    }

    uint64_t start;
    uint64_t end;
};

// A location on one reference sequence made of one or more ordered,
// disjoint segments. Segments are never empty.
class SplicedLocation {
public:
    SplicedLocation(std::vector<Interval> const& segments, strand_e strand);

    std::vector<Interval> const& segments() const;
    strand_e strand() const;

    uint64_t start() const;
    uint64_t end() const;
    uint64_t length() const;

    bool operator==(SplicedLocation const& rhs) const;
    bool operator!=(SplicedLocation const& rhs) const;

private:
    std::vector<Interval> segments_;
    strand_e strand_;
};

struct SeqLocation {
    SeqLocation(std::string const& seq_name, SplicedLocation const& location)
        : seq_name(seq_name)
        , location(location)
    {}

    bool operator==(SeqLocation const& rhs) const {
        return seq_name == rhs.seq_name && location == rhs.location;
    }

    std::string seq_name;
    SplicedLocation location;
};

// Reference footprint of an alignment starting at position. Matches and
// deletions extend the current segment, reference skips start a new one
// and the remaining operations leave the reference cursor alone. Returns
// none when the footprint is empty.
boost::optional<SplicedLocation> cigar_to_spliced_location(
        uint64_t position,
        Cigar const& cigar,
        strand_e strand);

std::ostream& operator<<(std::ostream& stream, Interval const& iv);
std::ostream& operator<<(std::ostream& stream, SplicedLocation const& loc);
std::ostream& operator<<(std::ostream& stream, SeqLocation const& loc);

inline
std::vector<Interval> const& SplicedLocation::segments() const {
    return segments_;
}

inline
strand_e SplicedLocation::strand() const {
    return strand_;
}

inline
uint64_t SplicedLocation::start() const {
    return segments_.front().start;
}

inline
uint64_t SplicedLocation::end() const {
    return segments_.back().end;
}

END_NAMESPACE(bamkit)
