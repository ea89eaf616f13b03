#include "BamHeader.hpp"

#include <boost/format.hpp>

#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <sstream>
#include <stdexcept>
#include <vector>

using boost::format;

BEGIN_NAMESPACE(bamkit)

namespace {
    char* copy_cstr(std::string const& s) {
        char* rv = static_cast<char*>(std::malloc(s.size() + 1));
        if (!rv)
            throw std::bad_alloc();
        std::memcpy(rv, s.c_str(), s.size() + 1);
        return rv;
    }

    bool has_sq_lines(std::string const& text) {
        return text.compare(0, 3, "@SQ") == 0
            || text.find("\n@SQ") != std::string::npos;
    }

    std::string sq_lines(TargetSequenceSet const& targets) {
        std::stringstream ss;
        for (TargetSequenceSet::const_iterator i = targets.begin(); i != targets.end(); ++i)
            ss << "@SQ\tSN:" << i->name << "\tLN:" << i->length << "\n";
        return ss.str();
    }
}

TargetSequenceSet targets_from_header(bam_header_t const* header) {
    std::vector<TargetSequence> seqs;
    seqs.reserve(header->n_targets);
    for (int32_t i = 0; i < header->n_targets; ++i)
        seqs.push_back(TargetSequence(header->target_name[i], header->target_len[i]));

    std::string text;
    if (header->text && header->l_text > 0) {
        text.assign(header->text, header->l_text);
        std::string::size_type nul = text.find('\0');
        if (nul != std::string::npos)
            text.erase(nul);
    }

    return TargetSequenceSet(seqs, text);
}

BamHeaderPtr header_from_targets(TargetSequenceSet const& targets) {
    if (targets.size() > std::size_t(std::numeric_limits<int32_t>::max()))
        throw std::length_error("Too many target sequences for a BAM header");

    BamHeaderPtr rv(bam_header_init());
    if (!rv)
        throw std::bad_alloc();

    int32_t n = int32_t(targets.size());
    rv->target_name = static_cast<char**>(std::calloc(n > 0 ? n : 1, sizeof(char*)));
    rv->target_len = static_cast<uint32_t*>(std::calloc(n > 0 ? n : 1, sizeof(uint32_t)));
    if (!rv->target_name || !rv->target_len)
        throw std::bad_alloc();

    // n_targets only counts names already copied so a throw part way
    // through leaves a header bam_header_destroy can free.
    for (int32_t i = 0; i < n; ++i) {
        TargetSequence const& seq = targets.at(i);
        if (seq.length > std::numeric_limits<uint32_t>::max()) {
            throw std::out_of_range(str(format(
                "Target sequence %1% is too long for a BAM header (%2%)"
                ) % seq.name % seq.length));
        }
        rv->target_name[i] = copy_cstr(seq.name);
        rv->target_len[i] = uint32_t(seq.length);
        rv->n_targets = i + 1;
    }

    // Text with no @SQ lines, as read from SAM whose targets came from an
    // index file, gets them appended.
    std::string text = targets.header_text();
    if (!has_sq_lines(text)) {
        if (!text.empty() && text[text.size() - 1] != '\n')
            text += '\n';
        text += sq_lines(targets);
    }

    rv->text = copy_cstr(text);
    rv->l_text = text.size();

    return rv;
}

END_NAMESPACE(bamkit)
