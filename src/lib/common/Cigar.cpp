#include "Cigar.hpp"

#include <boost/format.hpp>

#include <cctype>
#include <sstream>
#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(bamkit)

namespace {
    // Indexed by CigarOpType
    char const CIGAR_CHARS[] = "MIDNSHP=X";

    uint32_t const CIGAR_SHIFT = 4;
    uint32_t const CIGAR_MASK = 0xf;
    uint64_t const MAX_CIGAR_LENGTH = 0x0fffffff;
}

CigarOp CigarOp::from_bam(uint32_t word) {
    uint32_t code = word & CIGAR_MASK;
    if (code >= NUM_CIGAR_OPS) {
        throw std::runtime_error(str(format(
            "Unknown cigar operation code %1%"
            ) % code));
    }
    return CigarOp(static_cast<CigarOpType>(code), word >> CIGAR_SHIFT);
}

uint32_t CigarOp::to_bam() const {
    if (length > MAX_CIGAR_LENGTH) {
        throw std::length_error(str(format(
            "Cigar operation length %1% does not fit in a BAM cigar word"
            ) % length));
    }
    return length << CIGAR_SHIFT | uint32_t(op);
}

bool CigarOp::consumes_reference() const {
    switch (op) {
        case CIGAR_MATCH:
        case CIGAR_DEL:
        case CIGAR_REF_SKIP:
        case CIGAR_SEQ_MATCH:
        case CIGAR_SEQ_MISMATCH:
            return true;
        default:
            return false;
    }
}

bool CigarOp::consumes_query() const {
    switch (op) {
        case CIGAR_MATCH:
        case CIGAR_INS:
        case CIGAR_SOFT_CLIP:
        case CIGAR_SEQ_MATCH:
        case CIGAR_SEQ_MISMATCH:
            return true;
        default:
            return false;
    }
}

char cigar_op_char(CigarOpType op) {
    return CIGAR_CHARS[int(op)];
}

Cigar parse_cigar(std::string const& text) {
    Cigar rv;
    if (text.empty() || text == "*")
        return rv;

    uint64_t length = 0;
    bool have_digits = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            length = length * 10 + (c - '0');
            if (length > MAX_CIGAR_LENGTH) {
                throw std::runtime_error(str(format(
                    "Cigar operation length too large in '%1%'"
                    ) % text));
            }
            have_digits = true;
            continue;
        }

        char const* found = std::char_traits<char>::find(
            CIGAR_CHARS, NUM_CIGAR_OPS, c);
        if (!found || !have_digits) {
            throw std::runtime_error(str(format(
                "Invalid cigar string '%1%'"
                ) % text));
        }

        rv.push_back(CigarOp(
            static_cast<CigarOpType>(found - CIGAR_CHARS), uint32_t(length)));
        length = 0;
        have_digits = false;
    }

    if (have_digits) {
        throw std::runtime_error(str(format(
            "Cigar string '%1%' ends without an operation"
            ) % text));
    }

    return rv;
}

std::string cigar_string(Cigar const& cigar) {
    if (cigar.empty())
        return "*";

    std::stringstream ss;
    for (Cigar::const_iterator i = cigar.begin(); i != cigar.end(); ++i)
        ss << *i;
    return ss.str();
}

uint64_t reference_span(Cigar const& cigar) {
    uint64_t rv = 0;
    for (Cigar::const_iterator i = cigar.begin(); i != cigar.end(); ++i) {
        if (i->consumes_reference())
            rv += i->length;
    }
    return rv;
}

std::ostream& operator<<(std::ostream& stream, CigarOp const& op) {
    return stream << op.length << cigar_op_char(op.op);
}

END_NAMESPACE(bamkit)
