#pragma once

#include "common/namespace.hpp"

#include <boost/array.hpp>

#include <stdint.h>
#include <string>

BEGIN_NAMESPACE(bamkit)

enum strand_e {
    FWD = 0,
    REV = 1
};

// The named bits of the SAM flag word, in bit order.
enum SamFlag {
    PAIRED = 0,
    PROPER_PAIR,
    UNMAPPED,
    MATE_UNMAPPED,
    REVERSE,
    MATE_REVERSE,
    READ1,
    READ2,
    SECONDARY,
    QC_FAIL,
    DUPLICATE,
    NUM_SAM_FLAGS
};

template<typename T>
struct PerFlagArray {
    typedef boost::array<T, NUM_SAM_FLAGS> type;
};

struct FlagValues {
    FlagValues();

    uint16_t operator[](SamFlag idx) const;
    std::string const& string_name(SamFlag flag) const;

private:
    PerFlagArray<uint16_t>::type values_;
    PerFlagArray<std::string>::type strings_;
};

inline
uint16_t FlagValues::operator[](SamFlag idx) const {
    return values_[int(idx)];
}

extern const FlagValues FLAG_VALUES;

inline
bool flag_set(uint16_t sam_flag, SamFlag flag) {
    return sam_flag & FLAG_VALUES[flag];
}

// Names of the set bits joined by '|', e.g. "PAIRED|REVERSE|READ1".
// Bits above DUPLICATE are ignored. An empty word gives "NONE".
std::string describe_flags(uint16_t sam_flag);

inline
char strand_char(strand_e strand) {
    return strand == REV ? '-' : '+';
}

END_NAMESPACE(bamkit)
