#include "BamIo.hpp"

#include "common/utility.hpp"

BEGIN_NAMESPACE(bamkit)

std::unique_ptr<BamReader> openTamIn(std::string const& path) {
    return make_unique_<BamReader>(path, SAM_TEXT);
}

std::unique_ptr<BamReader> openTamInWithIndex(
        std::string const& path,
        std::string const& index_path)
{
    return make_unique_<BamReader>(path, SAM_TEXT, index_path);
}

std::unique_ptr<BamReader> openBamIn(std::string const& path) {
    return make_unique_<BamReader>(path, BAM_BINARY);
}

std::unique_ptr<BamWriter> openTamOut(
        std::string const& path,
        boost::shared_ptr<TargetSequenceSet const> const& targets)
{
    return make_unique_<BamWriter>(path, SAM_TEXT, targets);
}

std::unique_ptr<BamWriter> openBamOut(
        std::string const& path,
        boost::shared_ptr<TargetSequenceSet const> const& targets)
{
    return make_unique_<BamWriter>(path, BAM_BINARY, targets);
}

END_NAMESPACE(bamkit)
