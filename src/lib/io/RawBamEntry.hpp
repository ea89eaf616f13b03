#pragma once

#include "common/namespace.hpp"
#include "io/SamFile.hpp"

#include <new>

BEGIN_NAMESPACE(bamkit)

// Scratch bam1_t that samread() fills and samwrite() drains. Passes as a
// bam1_t* wherever samtools wants one.
class RawBamEntry {
public:
    RawBamEntry()
        : entry_(bam_init1())
    {
        if (!entry_)
            throw std::bad_alloc();
    }

    operator bam1_t const*() const {
        return entry_.get();
    }

    operator bam1_t*() {
        return entry_.get();
    }

    bam1_t const* operator->() const {
        return entry_.get();
    }

    bam1_t* operator->() {
        return entry_.get();
    }

private:
    BamEntryPtr entry_;
};

END_NAMESPACE(bamkit)
