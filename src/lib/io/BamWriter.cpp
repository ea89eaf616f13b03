#include "BamWriter.hpp"

#include "io/BamHeader.hpp"
#include "io/RawBamEntry.hpp"

#include <boost/format.hpp>

#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(bamkit)

namespace {
    void check_tid(int32_t tid, std::size_t n_targets, char const* what,
            std::string const& read, std::string const& path)
    {
        if (tid >= 0 && std::size_t(tid) >= n_targets) {
            throw std::out_of_range(str(format(
                "%1% index %2% of read %3% is not in the header of %4% (%5% sequences)"
                ) % what % tid % read % path % n_targets));
        }
    }
}

BamWriter::BamWriter(
        std::string const& path,
        FileFormat file_format,
        boost::shared_ptr<TargetSequenceSet const> const& targets)
    : path_(path)
    , targets_(targets)
    , header_(header_from_targets(*targets))
    , out_(samopen(path.c_str(), write_mode(file_format), header_.get()))
{
    if (!out_) {
        throw std::runtime_error(str(format(
            "Failed to open output file %1%"
            ) % path));
    }
}

BamWriter::~BamWriter() {
    close();
}

void BamWriter::write(Alignment const& aln) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!out_) {
        throw std::runtime_error(str(format(
            "Output %1% is closed"
            ) % path_));
    }

    AlignmentCore const& core = aln.core();
    check_tid(core.tid, targets_->size(), "Target", aln.query_name(), path_);
    check_tid(core.mtid, targets_->size(), "Mate target", aln.query_name(), path_);

    RawBamEntry entry;
    aln.to_bam(entry);
    if (samwrite(out_, entry) <= 0) {
        throw std::runtime_error(str(format(
            "Error writing to %1%"
            ) % path_));
    }
}

// samclose does not free the header of a file opened for writing, so
// header_ is released here, after the file.
void BamWriter::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_) {
        samclose(out_);
        out_ = 0;
        header_.reset();
    }
}

bool BamWriter::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_ != 0;
}

END_NAMESPACE(bamkit)
