#pragma once

#include "common/TargetSequenceSet.hpp"
#include "common/namespace.hpp"
#include "io/SamFile.hpp"

BEGIN_NAMESPACE(bamkit)

TargetSequenceSet targets_from_header(bam_header_t const* header);

// Builds a header samopen() can write. When the stored header text has no
// @SQ lines, lines generated from the sequence list are appended to it.
BamHeaderPtr header_from_targets(TargetSequenceSet const& targets);

END_NAMESPACE(bamkit)
