#pragma once

#include "common/TargetSequenceSet.hpp"
#include "common/namespace.hpp"
#include "io/BamReader.hpp"
#include "io/BamWriter.hpp"

#include <boost/shared_ptr.hpp>

#include <memory>
#include <string>

BEGIN_NAMESPACE(bamkit)

// SAM text whose @SQ lines give the target sequences.
std::unique_ptr<BamReader> openTamIn(std::string const& path);

// SAM text whose target sequences are listed in index_path instead.
std::unique_ptr<BamReader> openTamInWithIndex(
        std::string const& path,
        std::string const& index_path);

std::unique_ptr<BamReader> openBamIn(std::string const& path);

// SAM text, header included.
std::unique_ptr<BamWriter> openTamOut(
        std::string const& path,
        boost::shared_ptr<TargetSequenceSet const> const& targets);

std::unique_ptr<BamWriter> openBamOut(
        std::string const& path,
        boost::shared_ptr<TargetSequenceSet const> const& targets);

END_NAMESPACE(bamkit)
