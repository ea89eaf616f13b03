#include "ReadFlags.hpp"

extern "C" {
    #include <bam.h>
}

BEGIN_NAMESPACE(bamkit)

FlagValues::FlagValues() {
    values_[PAIRED] = BAM_FPAIRED;
    values_[PROPER_PAIR] = BAM_FPROPER_PAIR;
    values_[UNMAPPED] = BAM_FUNMAP;
    values_[MATE_UNMAPPED] = BAM_FMUNMAP;
    values_[REVERSE] = BAM_FREVERSE;
    values_[MATE_REVERSE] = BAM_FMREVERSE;
    values_[READ1] = BAM_FREAD1;
    values_[READ2] = BAM_FREAD2;
    values_[SECONDARY] = BAM_FSECONDARY;
    values_[QC_FAIL] = BAM_FQCFAIL;
    values_[DUPLICATE] = BAM_FDUP;

    strings_[PAIRED] = "PAIRED";
    strings_[PROPER_PAIR] = "PROPER_PAIR";
    strings_[UNMAPPED] = "UNMAPPED";
    strings_[MATE_UNMAPPED] = "MATE_UNMAPPED";
    strings_[REVERSE] = "REVERSE";
    strings_[MATE_REVERSE] = "MATE_REVERSE";
    strings_[READ1] = "READ1";
    strings_[READ2] = "READ2";
    strings_[SECONDARY] = "SECONDARY";
    strings_[QC_FAIL] = "QC_FAIL";
    strings_[DUPLICATE] = "DUPLICATE";
}

std::string const& FlagValues::string_name(SamFlag flag) const {
    return strings_[static_cast<int>(flag)];
}

std::string describe_flags(uint16_t sam_flag) {
    std::string rv;
    for (int i = 0; i < NUM_SAM_FLAGS; ++i) {
        SamFlag flag = static_cast<SamFlag>(i);
        if (!flag_set(sam_flag, flag))
            continue;

        if (!rv.empty())
            rv += '|';
        rv += FLAG_VALUES.string_name(flag);
    }

    if (rv.empty())
        rv = "NONE";

    return rv;
}

const FlagValues FLAG_VALUES;

END_NAMESPACE(bamkit)
