#include "Alignment.hpp"

#include <boost/array.hpp>
#include <boost/format.hpp>

#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(bamkit)

namespace {
    // 4-bit base codes we know how to print. Zero marks codes we refuse to
    // decode.
    boost::array<char, 16> make_base_table() {
        boost::array<char, 16> rv;
        rv.fill(0);
        rv[1] = 'A';
        rv[2] = 'C';
        rv[4] = 'G';
        rv[8] = 'T';
        rv[15] = 'N';
        return rv;
    }

    boost::array<char, 16> const BASE_CHARS = make_base_table();

    uint8_t const NO_QUALITY = 0xff;
}

AlignmentCore::AlignmentCore()
    : tid(-1)
    , pos(-1)
    , flag(0)
    , map_quality(0)
    , mtid(-1)
    , mpos(-1)
    , isize(0)
{
}

bool AlignmentCore::operator==(AlignmentCore const& rhs) const {
    return tid == rhs.tid
        && pos == rhs.pos
        && flag == rhs.flag
        && map_quality == rhs.map_quality
        && mtid == rhs.mtid
        && mpos == rhs.mpos
        && isize == rhs.isize;
}

bool AlignmentCore::operator!=(AlignmentCore const& rhs) const {
    return !(*this == rhs);
}

Alignment::Alignment(bam1_t const* record, TargetSequenceSet const& targets)
    : targets_(&targets)
    , query_name_(bam1_qname(record))
{
    bam1_core_t const& c = record->core;
    core_.tid = c.tid;
    core_.pos = c.pos;
    core_.flag = c.flag;
    core_.map_quality = c.qual;
    core_.mtid = c.mtid;
    core_.mpos = c.mpos;
    core_.isize = c.isize;

    uint32_t const* cigar = bam1_cigar(record);
    cigar_.reserve(c.n_cigar);
    for (uint32_t i = 0; i < c.n_cigar; ++i)
        cigar_.push_back(CigarOp::from_bam(cigar[i]));

    if (c.l_qseq > 0) {
        uint8_t const* seq = bam1_seq(record);
        seq_.resize(c.l_qseq);
        for (int32_t i = 0; i < c.l_qseq; ++i)
            seq_[i] = bam1_seqi(seq, i);

        uint8_t const* qual = bam1_qual(record);
        qual_.assign(qual, qual + c.l_qseq);
    }

    uint8_t const* aux = bam1_aux(record);
    aux_ = AuxFields::parse(aux, record->data + record->data_len);
}

Alignment::Alignment(
        TargetSequenceSet const& targets,
        AlignmentCore const& core,
        std::string const& query_name,
        Cigar const& cigar,
        std::string const& sequence,
        std::vector<uint8_t> const& qualities,
        AuxFields const& aux)
    : targets_(&targets)
    , core_(core)
    , query_name_(query_name)
    , cigar_(cigar)
    , qual_(qualities)
    , aux_(aux)
{
    if (sequence != "*") {
        seq_.reserve(sequence.size());
        for (std::size_t i = 0; i < sequence.size(); ++i)
            seq_.push_back(bam_nt16_table[static_cast<unsigned char>(sequence[i])]);
    }

    if (qual_.empty()) {
        qual_.assign(seq_.size(), NO_QUALITY);
    }
    else if (qual_.size() != seq_.size()) {
        throw std::invalid_argument(str(format(
            "Read %1% has %2% bases but %3% quality values"
            ) % query_name % seq_.size() % qual_.size()));
    }
}

boost::optional<std::size_t> Alignment::resolve_tid(int32_t tid) const {
    if (tid < 0)
        return boost::none;
    return std::size_t(tid);
}

boost::optional<std::size_t> Alignment::target_id() const {
    return resolve_tid(core_.tid);
}

boost::optional<std::string> Alignment::target_name() const {
    boost::optional<std::size_t> tid = target_id();
    if (!tid)
        return boost::none;
    return targets_->name_of(*tid);
}

boost::optional<uint64_t> Alignment::target_len() const {
    boost::optional<std::size_t> tid = target_id();
    if (!tid)
        return boost::none;
    return targets_->length_of(*tid);
}

boost::optional<uint64_t> Alignment::position() const {
    if (core_.pos < 0)
        return boost::none;
    return uint64_t(core_.pos);
}

boost::optional<uint64_t> Alignment::query_length() const {
    if (seq_.empty())
        return boost::none;
    return uint64_t(seq_.size());
}

boost::optional<std::string> Alignment::query_sequence() const {
    if (seq_.empty())
        return boost::none;

    std::string rv(seq_.size(), 'N');
    for (std::size_t i = 0; i < seq_.size(); ++i) {
        char base = BASE_CHARS[seq_[i] & 0xf];
        if (!base) {
            throw std::runtime_error(str(format(
                "Unknown base code %1% at position %2% of read %3%"
                ) % int(seq_[i]) % i % query_name_));
        }
        rv[i] = base;
    }
    return rv;
}

boost::optional<std::string> Alignment::quality_string() const {
    if (qual_.empty() || qual_[0] == NO_QUALITY)
        return boost::none;

    std::string rv(qual_.size(), '!');
    for (std::size_t i = 0; i < qual_.size(); ++i)
        rv[i] = char(qual_[i] + 33);
    return rv;
}

boost::optional<std::size_t> Alignment::mate_target_id() const {
    return resolve_tid(core_.mtid);
}

boost::optional<std::string> Alignment::mate_target_name() const {
    boost::optional<std::size_t> mtid = mate_target_id();
    if (!mtid)
        return boost::none;
    return targets_->name_of(*mtid);
}

boost::optional<uint64_t> Alignment::mate_target_len() const {
    boost::optional<std::size_t> mtid = mate_target_id();
    if (!mtid)
        return boost::none;
    return targets_->length_of(*mtid);
}

boost::optional<uint64_t> Alignment::mate_position() const {
    if (core_.mpos < 0)
        return boost::none;
    return uint64_t(core_.mpos);
}

boost::optional<int64_t> Alignment::insert_size() const {
    if (core_.isize < 1)
        return boost::none;
    return int64_t(core_.isize);
}

boost::optional<int64_t> Alignment::n_mismatch() const {
    if (AuxValue const* nm = aux("NM"))
        return nm->as_int();
    return boost::none;
}

boost::optional<int64_t> Alignment::n_hits() const {
    if (AuxValue const* nh = aux("NH"))
        return nh->as_int();
    return boost::none;
}

boost::optional<std::string> Alignment::match_descriptor() const {
    if (AuxValue const* md = aux("MD"))
        return md->as_string();
    return boost::none;
}

boost::optional<SplicedLocation> Alignment::ref_spliced_location() const {
    boost::optional<uint64_t> pos = position();
    if (is_unmapped() || !target_id() || !pos || cigar_.empty())
        return boost::none;

    return cigar_to_spliced_location(*pos, cigar_, strand());
}

boost::optional<SeqLocation> Alignment::ref_seq_location() const {
    boost::optional<std::string> name = target_name();
    if (!name)
        return boost::none;

    boost::optional<SplicedLocation> loc = ref_spliced_location();
    if (!loc)
        return boost::none;

    return SeqLocation(*name, *loc);
}

void Alignment::to_bam(bam1_t* entry) const {
    if (query_name_.size() > 254) {
        throw std::length_error(str(format(
            "Read name %1% is longer than 254 characters"
            ) % query_name_));
    }
    if (cigar_.size() > 0xffff) {
        throw std::length_error(str(format(
            "Read %1% has more than 65535 cigar operations"
            ) % query_name_));
    }

    std::size_t l_qname = query_name_.size() + 1;
    std::size_t l_cigar = cigar_.size() * sizeof(uint32_t);
    std::size_t l_seq = (seq_.size() + 1) / 2;
    std::size_t l_aux = aux_.encoded_size();
    std::size_t data_len = l_qname + l_cigar + l_seq + qual_.size() + l_aux;

    if (std::size_t(entry->m_data) < data_len) {
        uint8_t* data = static_cast<uint8_t*>(std::realloc(entry->data, data_len));
        if (!data)
            throw std::bad_alloc();
        entry->data = data;
        entry->m_data = int(data_len);
    }
    entry->data_len = int(data_len);
    entry->l_aux = int(l_aux);

    bam1_core_t& c = entry->core;
    c.tid = core_.tid;
    c.pos = core_.pos;
    c.qual = core_.map_quality;
    c.flag = core_.flag;
    c.mtid = core_.mtid;
    c.mpos = core_.mpos;
    c.isize = core_.isize;
    c.l_qname = uint8_t(l_qname);
    c.n_cigar = uint16_t(cigar_.size());
    c.l_qseq = int32_t(seq_.size());

    uint64_t span = reference_span(cigar_);
    c.bin = bam_reg2bin(c.pos, c.pos + (span > 0 ? uint32_t(span) : 1));

    std::memcpy(bam1_qname(entry), query_name_.c_str(), l_qname);

    uint32_t* cigar = bam1_cigar(entry);
    for (std::size_t i = 0; i < cigar_.size(); ++i)
        cigar[i] = cigar_[i].to_bam();

    uint8_t* seq = bam1_seq(entry);
    std::memset(seq, 0, l_seq);
    for (std::size_t i = 0; i < seq_.size(); ++i)
        seq[i >> 1] |= (seq_[i] & 0xf) << ((~i & 1) << 2);

    if (!qual_.empty())
        std::memcpy(bam1_qual(entry), qual_.data(), qual_.size());

    aux_.encode(bam1_aux(entry));
}

bool Alignment::operator==(Alignment const& rhs) const {
    return core_ == rhs.core_
        && query_name_ == rhs.query_name_
        && cigar_ == rhs.cigar_
        && seq_ == rhs.seq_
        && qual_ == rhs.qual_
        && aux_ == rhs.aux_
        && *targets_ == *rhs.targets_;
}

bool Alignment::operator!=(Alignment const& rhs) const {
    return !(*this == rhs);
}

END_NAMESPACE(bamkit)
