#pragma once

#include "common/TargetSequenceSet.hpp"
#include "common/namespace.hpp"
#include "io/Alignment.hpp"
#include "io/SamFile.hpp"

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include <mutex>
#include <string>

BEGIN_NAMESPACE(bamkit)

// Writes alignments to a SAM (with header) or BAM file whose header lists
// targets. Safe to share between threads; records never interleave.
class BamWriter : public boost::noncopyable {
public:
    BamWriter(
            std::string const& path,
            FileFormat file_format,
            boost::shared_ptr<TargetSequenceSet const> const& targets);
    ~BamWriter();


    // The record's target set is not checked against the writer's; only
    // that its target indices exist in the writer's header. Throws
    // std::runtime_error if the write fails or the writer is closed.
    void write(Alignment const& aln);

    void close();
    bool is_open() const;

    boost::shared_ptr<TargetSequenceSet const> const& targets() const;
    std::string const& path() const;

private:
    std::string path_;
    boost::shared_ptr<TargetSequenceSet const> targets_;
    BamHeaderPtr header_;
    samfile_t* out_;
    mutable std::mutex mutex_;
};

inline
boost::shared_ptr<TargetSequenceSet const> const& BamWriter::targets() const {
    return targets_;
}

inline
std::string const& BamWriter::path() const {
    return path_;
}

END_NAMESPACE(bamkit)
