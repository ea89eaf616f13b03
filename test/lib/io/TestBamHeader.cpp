#include "io/BamHeader.hpp"

#include <boost/optional/optional_io.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bamkit;
using namespace std;

namespace {
    vector<TargetSequence> twoTargets() {
        vector<TargetSequence> seqs;
        seqs.push_back(TargetSequence("chr1", 1000));
        seqs.push_back(TargetSequence("chr2", 2000));
        return seqs;
    }
}

TEST(TestBamHeader, generated_text) {
    TargetSequenceSet targets(twoTargets());
    BamHeaderPtr header = header_from_targets(targets);

    ASSERT_EQ(2, header->n_targets);
    EXPECT_STREQ("chr1", header->target_name[0]);
    EXPECT_STREQ("chr2", header->target_name[1]);
    EXPECT_EQ(1000u, header->target_len[0]);
    EXPECT_EQ(2000u, header->target_len[1]);

    string expected = "@SQ\tSN:chr1\tLN:1000\n@SQ\tSN:chr2\tLN:2000\n";
    EXPECT_EQ(expected.size(), header->l_text);
    EXPECT_EQ(expected, string(header->text, header->l_text));
}

TEST(TestBamHeader, stored_text) {
    string text = "@HD\tVN:1.0\n@SQ\tSN:chr1\tLN:1000\n@SQ\tSN:chr2\tLN:2000\n@PG\tID:x\n";
    TargetSequenceSet targets(twoTargets(), text);
    BamHeaderPtr header = header_from_targets(targets);
    EXPECT_EQ(text, string(header->text, header->l_text));

    TargetSequenceSet back = targets_from_header(header.get());
    EXPECT_EQ(targets, back);
    EXPECT_EQ(text, back.header_text());
    EXPECT_EQ(boost::optional<size_t>(1), back.index_of("chr2"));
}

TEST(TestBamHeader, stored_text_without_sq_lines) {
    TargetSequenceSet targets(twoTargets(), "@HD\tVN:1.0\n@CO\tno targets here");
    BamHeaderPtr header = header_from_targets(targets);

    EXPECT_EQ(
        "@HD\tVN:1.0\n@CO\tno targets here\n"
        "@SQ\tSN:chr1\tLN:1000\n@SQ\tSN:chr2\tLN:2000\n",
        string(header->text, header->l_text));
    EXPECT_EQ(2, header->n_targets);
}

TEST(TestBamHeader, empty) {
    TargetSequenceSet targets;
    BamHeaderPtr header = header_from_targets(targets);
    EXPECT_EQ(0, header->n_targets);
    EXPECT_EQ(0u, header->l_text);

    EXPECT_TRUE(targets_from_header(header.get()).empty());
}

TEST(TestBamHeader, target_too_long) {
    vector<TargetSequence> seqs = twoTargets();
    seqs.push_back(TargetSequence("huge", 1ull << 33));
    EXPECT_THROW(header_from_targets(TargetSequenceSet(seqs)), std::out_of_range);
}

TEST(TestBamHeader, text_stops_at_nul) {
    BamHeaderPtr header(bam_header_init());
    char const raw[] = "@CO\tfirst\n\0garbage";
    header->l_text = sizeof(raw) - 1;
    header->text = static_cast<char*>(malloc(sizeof(raw)));
    memcpy(header->text, raw, sizeof(raw));

    TargetSequenceSet targets = targets_from_header(header.get());
    EXPECT_TRUE(targets.empty());
    EXPECT_EQ("@CO\tfirst\n", targets.header_text());
}
