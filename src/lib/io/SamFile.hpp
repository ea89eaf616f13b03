#pragma once

#include "common/namespace.hpp"

#include <memory>

extern "C" {
    #include <sam.h>
    #include <bam.h>
}

BEGIN_NAMESPACE(bamkit)

enum FileFormat {
    SAM_TEXT,
    BAM_BINARY
};

struct SamFileCloser {
    void operator()(samfile_t* fp) const {
        samclose(fp);
    }
};

struct BamHeaderDeleter {
    void operator()(bam_header_t* header) const {
        bam_header_destroy(header);
    }
};

struct BamEntryDeleter {
    void operator()(bam1_t* entry) const {
        bam_destroy1(entry);
    }
};

typedef std::unique_ptr<samfile_t, SamFileCloser> SamFilePtr;
typedef std::unique_ptr<bam_header_t, BamHeaderDeleter> BamHeaderPtr;
typedef std::unique_ptr<bam1_t, BamEntryDeleter> BamEntryPtr;

// samopen() modes. Text output always carries a header.
inline
char const* read_mode(FileFormat format) {
    return format == BAM_BINARY ? "rb" : "r";
}

inline
char const* write_mode(FileFormat format) {
    return format == BAM_BINARY ? "wb" : "wh";
}

END_NAMESPACE(bamkit)
