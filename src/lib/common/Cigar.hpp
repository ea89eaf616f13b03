#pragma once

#include "common/namespace.hpp"

#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

BEGIN_NAMESPACE(bamkit)

// Values are the 4-bit operation codes used in BAM cigar words.
enum CigarOpType {
    CIGAR_MATCH = 0,
    CIGAR_INS = 1,
    CIGAR_DEL = 2,
    CIGAR_REF_SKIP = 3,
    CIGAR_SOFT_CLIP = 4,
    CIGAR_HARD_CLIP = 5,
    CIGAR_PAD = 6,
    CIGAR_SEQ_MATCH = 7,
    CIGAR_SEQ_MISMATCH = 8,
    NUM_CIGAR_OPS
};

struct CigarOp {
    CigarOp()
        : op(CIGAR_MATCH)
        , length(0)
    {}

    CigarOp(CigarOpType op, uint32_t length)
        : op(op)
        , length(length)
    {}

    // Throws std::runtime_error for operation codes above CIGAR_SEQ_MISMATCH.
    static CigarOp from_bam(uint32_t word);
    // Throws std::length_error if length needs more than 28 bits.
    uint32_t to_bam() const;

    bool consumes_reference() const;
    bool consumes_query() const;

    bool operator==(CigarOp const& rhs) const {
        return op == rhs.op && length == rhs.length;
    }

    bool operator!=(CigarOp const& rhs) const {
        return !(*this == rhs);
    }

    CigarOpType op;
    uint32_t length;
};

typedef std::vector<CigarOp> Cigar;

char cigar_op_char(CigarOpType op);

// Parses SAM cigar text such as "20M30N20M". "*" and "" give an empty
// cigar. Throws std::runtime_error on anything else that does not parse.
Cigar parse_cigar(std::string const& text);
std::string cigar_string(Cigar const& cigar);

// Number of reference bases spanned, skips and deletions included.
uint64_t reference_span(Cigar const& cigar);

std::ostream& operator<<(std::ostream& stream, CigarOp const& op);

END_NAMESPACE(bamkit)
