#pragma once

#include "common/TargetSequenceSet.hpp"
#include "common/namespace.hpp"
#include "io/Alignment.hpp"
#include "io/SamFile.hpp"

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>

#include <mutex>
#include <string>

BEGIN_NAMESPACE(bamkit)

// Reads alignments from a SAM or BAM file.
//
// All members are safe to call from several threads at once. Each call to
// next() transfers exactly one record while holding the reader's lock, so
// concurrent readers share out the records of the file between them.
class BamReader : public boost::noncopyable {
public:
    // target_index names a file listing target sequence names and lengths
    // (a .fai works) for SAM text without @SQ header lines. It is ignored
    // for BAM. Throws std::runtime_error if the file or its header cannot
    // be read.
    BamReader(
            std::string const& path,
            FileFormat file_format,
            std::string const& target_index = "");
    ~BamReader();


    // The next alignment, or none at the end of the file. Throws
    // std::runtime_error if the file is malformed, and on every call after
    // that, or if the reader has been closed.
    boost::optional<Alignment> next();

    // Releases the file. Further calls do nothing. The target sequences
    // stay available.
    void close();
    bool is_open() const;

    boost::shared_ptr<TargetSequenceSet const> const& targets() const;
    std::string const& path() const;

private:
    std::string path_;
    samfile_t* in_;
    bool failed_;
    boost::shared_ptr<TargetSequenceSet const> targets_;
    mutable std::mutex mutex_;
};

inline
boost::shared_ptr<TargetSequenceSet const> const& BamReader::targets() const {
    return targets_;
}

inline
std::string const& BamReader::path() const {
    return path_;
}

END_NAMESPACE(bamkit)
