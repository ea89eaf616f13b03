#include "BamReader.hpp"

#include "io/BamHeader.hpp"
#include "io/RawBamEntry.hpp"

#include <boost/format.hpp>

#include <iostream>
#include <stdexcept>

using boost::format;

BEGIN_NAMESPACE(bamkit)

BamReader::BamReader(
        std::string const& path,
        FileFormat file_format,
        std::string const& target_index)
    : path_(path)
    , in_(0)
    , failed_(false)
{
    void const* aux = target_index.empty() ? 0 : target_index.c_str();
    SamFilePtr in(samopen(path.c_str(), read_mode(file_format), aux));
    if (!in) {
        throw std::runtime_error(str(format(
            "Failed to open samfile %1%"
            ) % path));
    }

    if (!in->header) {
        throw std::runtime_error(str(format(
            "Failed to read header from %1%"
            ) % path));
    }

    targets_.reset(new TargetSequenceSet(targets_from_header(in->header)));
    if (targets_->empty())
        std::cerr << "Warning: no target sequences in header of " << path << "\n";

    in_ = in.release();
}

BamReader::~BamReader() {
    close();
}

boost::optional<Alignment> BamReader::next() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!in_) {
        throw std::runtime_error(str(format(
            "Input %1% is closed"
            ) % path_));
    }

    if (failed_) {
        throw std::runtime_error(str(format(
            "Input %1% cannot be read past an earlier error"
            ) % path_));
    }

    RawBamEntry entry;
    int rv = samread(in_, entry);
    if (rv < -1) {
        failed_ = true;
        throw std::runtime_error(str(format(
            "Error reading from %1% (status %2%)"
            ) % path_ % rv));
    }

    if (rv < 0)
        return boost::none;

    try {
        return Alignment(entry, *targets_);
    }
    catch (std::runtime_error const& e) {
        failed_ = true;
        throw std::runtime_error(str(format(
            "Error decoding record from %1%: %2%"
            ) % path_ % e.what()));
    }
}

void BamReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_) {
        samclose(in_);
        in_ = 0;
    }
}

bool BamReader::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_ != 0;
}

END_NAMESPACE(bamkit)
