#pragma once

#include "common/Cigar.hpp"
#include "common/ReadFlags.hpp"
#include "common/SplicedLocation.hpp"
#include "common/TargetSequenceSet.hpp"
#include "common/namespace.hpp"
#include "io/AuxFields.hpp"

#include <boost/optional.hpp>

#include <cstddef>
#include <stdint.h>
#include <string>
#include <vector>

extern "C" {
    #include <sam.h>
    #include <bam.h>
}

BEGIN_NAMESPACE(bamkit)

// The fixed-width fields of a record, with the samtools conventions: -1
// for an absent target or position.
struct AlignmentCore {
    AlignmentCore();

    bool operator==(AlignmentCore const& rhs) const;
    bool operator!=(AlignmentCore const& rhs) const;

    int32_t tid;
    int32_t pos;
    uint16_t flag;
    uint8_t map_quality;
    int32_t mtid;
    int32_t mpos;
    int32_t isize;
};

// An immutable, fully decoded alignment record.
//
// Target and mate target names and lengths are resolved on demand through
// the TargetSequenceSet the record was read or built against. The record
// does not own that set; it must outlive the record.
class Alignment {
public:
    // Decodes record. Throws std::runtime_error if the cigar or optional
    // fields cannot be decoded.
    Alignment(bam1_t const* record, TargetSequenceSet const& targets);

    // Builds a record for writing. sequence is SAM sequence text ("" or
    // "*" for none). qualities are raw Phred scores, either empty or one
    // per base.
    Alignment(
            TargetSequenceSet const& targets,
            AlignmentCore const& core,
            std::string const& query_name,
            Cigar const& cigar,
            std::string const& sequence = "",
            std::vector<uint8_t> const& qualities = std::vector<uint8_t>(),
            AuxFields const& aux = AuxFields());

    TargetSequenceSet const& targets() const;
    AlignmentCore const& core() const;

    boost::optional<std::size_t> target_id() const;
    boost::optional<std::string> target_name() const;
    boost::optional<uint64_t> target_len() const;
    boost::optional<uint64_t> position() const;

    uint16_t sam_flag() const;
    bool is_paired() const;
    bool is_proper_pair() const;
    bool is_unmapped() const;
    bool is_mate_unmapped() const;
    bool is_reverse() const;
    bool is_mate_reverse() const;
    bool is_read1() const;
    bool is_read2() const;
    bool is_secondary() const;
    bool is_qc_fail() const;
    bool is_duplicate() const;
    strand_e strand() const;

    uint8_t map_quality() const;
    Cigar const& cigar() const;
    std::string const& query_name() const;
    boost::optional<uint64_t> query_length() const;

    // Throws std::runtime_error if a base is stored with a code other than
    // A, C, G, T or N.
    boost::optional<std::string> query_sequence() const;
    // Phred+33 text, none when the record carries no qualities.
    boost::optional<std::string> quality_string() const;

    boost::optional<std::size_t> mate_target_id() const;
    boost::optional<std::string> mate_target_name() const;
    boost::optional<uint64_t> mate_target_len() const;
    boost::optional<uint64_t> mate_position() const;
    // None unless positive.
    boost::optional<int64_t> insert_size() const;

    AuxFields const& aux_fields() const;
    AuxValue const* aux(std::string const& key) const;
    boost::optional<int64_t> n_mismatch() const;
    boost::optional<int64_t> n_hits() const;
    boost::optional<std::string> match_descriptor() const;

    // Reference footprint of a mapped record with a cigar, otherwise none.
    boost::optional<SplicedLocation> ref_spliced_location() const;
    // ref_spliced_location() on the named target sequence.
    boost::optional<SeqLocation> ref_seq_location() const;

    // Fills entry with the binary form of this record, replacing its
    // contents.
    void to_bam(bam1_t* entry) const;

    bool operator==(Alignment const& rhs) const;
    bool operator!=(Alignment const& rhs) const;

private:
    boost::optional<std::size_t> resolve_tid(int32_t tid) const;

private: // Data
    TargetSequenceSet const* targets_;
    AlignmentCore core_;
    std::string query_name_;
    Cigar cigar_;
    std::vector<uint8_t> seq_; // one 4-bit code per base
    std::vector<uint8_t> qual_;
    AuxFields aux_;
};

inline
TargetSequenceSet const& Alignment::targets() const {
    return *targets_;
}

inline
AlignmentCore const& Alignment::core() const {
    return core_;
}

inline
uint16_t Alignment::sam_flag() const {
    return core_.flag;
}

inline
bool Alignment::is_paired() const {
    return sam_flag() & BAM_FPAIRED;
}

inline
bool Alignment::is_proper_pair() const {
    return sam_flag() & BAM_FPROPER_PAIR;
}

inline
bool Alignment::is_unmapped() const {
    return sam_flag() & BAM_FUNMAP;
}

inline
bool Alignment::is_mate_unmapped() const {
    return sam_flag() & BAM_FMUNMAP;
}

inline
bool Alignment::is_reverse() const {
    return sam_flag() & BAM_FREVERSE;
}

inline
bool Alignment::is_mate_reverse() const {
    return sam_flag() & BAM_FMREVERSE;
}

inline
bool Alignment::is_read1() const {
    return sam_flag() & BAM_FREAD1;
}

inline
bool Alignment::is_read2() const {
    return sam_flag() & BAM_FREAD2;
}

inline
bool Alignment::is_secondary() const {
    return sam_flag() & BAM_FSECONDARY;
}

inline
bool Alignment::is_qc_fail() const {
    return sam_flag() & BAM_FQCFAIL;
}

inline
bool Alignment::is_duplicate() const {
    return sam_flag() & BAM_FDUP;
}

inline
strand_e Alignment::strand() const {
    return is_reverse() ? REV : FWD;
}

inline
uint8_t Alignment::map_quality() const {
    return core_.map_quality;
}

inline
Cigar const& Alignment::cigar() const {
    return cigar_;
}

inline
std::string const& Alignment::query_name() const {
    return query_name_;
}

inline
AuxFields const& Alignment::aux_fields() const {
    return aux_;
}

inline
AuxValue const* Alignment::aux(std::string const& key) const {
    return aux_.find(key);
}

END_NAMESPACE(bamkit)
