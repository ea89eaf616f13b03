#include "io/BamReader.hpp"

#include "io/BamIo.hpp"

#include "TestData.hpp"

#include <boost/optional/optional_io.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bamkit;
using namespace std;

namespace {
    string locationString(Alignment const& aln) {
        boost::optional<SeqLocation> loc = aln.ref_seq_location();
        if (!loc)
            return "*";
        stringstream ss;
        ss << *loc;
        return ss.str();
    }

    vector<Alignment> readAll(BamReader& reader) {
        vector<Alignment> rv;
        while (boost::optional<Alignment> aln = reader.next())
            rv.push_back(*aln);
        return rv;
    }
}

class TestBamReader : public ::testing::Test {
    protected:
        void SetUp() {
            sam_path = writeTempFile(".sam", fixtureSam());
        }

        void TearDown() {
            for (size_t i = 0; i < cleanup.size(); ++i)
                bfs::remove(cleanup[i]);
            bfs::remove(sam_path);
        }

        // The fixture converted to BAM.
        string makeBam() {
            string bam_path = tempPath("bamkit-unit-test", ".bam");
            cleanup.push_back(bam_path);

            unique_ptr<BamReader> in(openTamIn(sam_path));
            unique_ptr<BamWriter> out(openBamOut(bam_path, in->targets()));
            while (boost::optional<Alignment> aln = in->next())
                out->write(*aln);
            out->close();
            return bam_path;
        }

        string sam_path;
        vector<string> cleanup;
};

TEST_F(TestBamReader, targets) {
    unique_ptr<BamReader> reader(openTamIn(sam_path));
    EXPECT_EQ(sam_path, reader->path());
    EXPECT_TRUE(reader->is_open());

    TargetSequenceSet const& targets = *reader->targets();
    ASSERT_EQ(2u, targets.size());
    EXPECT_EQ("chr1", targets.at(0).name);
    EXPECT_EQ(1000u, targets.at(0).length);
    EXPECT_EQ("chr2", targets.at(1).name);
    EXPECT_EQ(2000u, targets.at(1).length);
    EXPECT_EQ(fixtureSamHeader(), targets.header_text());
}

TEST_F(TestBamReader, records) {
    unique_ptr<BamReader> reader(openTamIn(sam_path));
    vector<Alignment> alns = readAll(*reader);
    ASSERT_EQ(5u, alns.size());

    Alignment const& r1a = alns[0];
    EXPECT_EQ("r1", r1a.query_name());
    EXPECT_EQ(99, r1a.sam_flag());
    EXPECT_TRUE(r1a.is_paired());
    EXPECT_TRUE(r1a.is_read1());
    EXPECT_TRUE(r1a.is_mate_reverse());
    EXPECT_EQ(FWD, r1a.strand());
    EXPECT_EQ(boost::optional<string>("chr1"), r1a.target_name());
    EXPECT_EQ(boost::optional<uint64_t>(1000), r1a.target_len());
    EXPECT_EQ(boost::optional<uint64_t>(100), r1a.position());
    EXPECT_EQ(60, r1a.map_quality());
    EXPECT_EQ("10M", cigar_string(r1a.cigar()));
    EXPECT_EQ(boost::optional<string>("ACGTACGTAC"), r1a.query_sequence());
    EXPECT_EQ(boost::optional<string>("IIIIIIIIII"), r1a.quality_string());
    EXPECT_EQ(boost::optional<string>("chr1"), r1a.mate_target_name());
    EXPECT_EQ(boost::optional<uint64_t>(200), r1a.mate_position());
    EXPECT_EQ(boost::optional<int64_t>(110), r1a.insert_size());
    EXPECT_EQ(boost::optional<int64_t>(1), r1a.n_mismatch());
    EXPECT_EQ(boost::optional<int64_t>(1), r1a.n_hits());
    EXPECT_EQ(boost::optional<string>("4A5"), r1a.match_descriptor());
    EXPECT_EQ("chr1:100-110(+)", locationString(r1a));

    Alignment const& r1b = alns[1];
    EXPECT_EQ("r1", r1b.query_name());
    EXPECT_TRUE(r1b.is_read2());
    EXPECT_EQ(REV, r1b.strand());
    EXPECT_FALSE(r1b.insert_size());
    EXPECT_EQ(boost::optional<int64_t>(0), r1b.n_mismatch());
    EXPECT_EQ("chr1:200-210(-)", locationString(r1b));

    Alignment const& r2 = alns[2];
    EXPECT_EQ("r2", r2.query_name());
    EXPECT_FALSE(r2.quality_string());
    EXPECT_FALSE(r2.mate_target_id());
    EXPECT_FALSE(r2.mate_position());
    EXPECT_FALSE(r2.n_mismatch());
    EXPECT_EQ(boost::optional<int64_t>(2), r2.n_hits());
    EXPECT_EQ("chr2:100-104,110-114(+)", locationString(r2));

    Alignment const& r3 = alns[3];
    EXPECT_EQ(255, r3.map_quality());
    EXPECT_EQ(boost::optional<uint64_t>(0), r3.position());
    EXPECT_EQ(boost::optional<uint64_t>(10), r3.query_length());
    EXPECT_EQ("chr1:0-5(-)", locationString(r3));

    Alignment const& r4 = alns[4];
    EXPECT_TRUE(r4.is_unmapped());
    EXPECT_FALSE(r4.target_id());
    EXPECT_FALSE(r4.position());
    EXPECT_TRUE(r4.cigar().empty());
    EXPECT_EQ(boost::optional<string>("ACGTN"), r4.query_sequence());
    EXPECT_EQ(boost::optional<string>("IIIII"), r4.quality_string());
    EXPECT_EQ("*", locationString(r4));
}

TEST_F(TestBamReader, end_of_stream) {
    unique_ptr<BamReader> reader(openTamIn(sam_path));
    EXPECT_EQ(5u, readAll(*reader).size());
    EXPECT_FALSE(reader->next());
    EXPECT_FALSE(reader->next());
    EXPECT_TRUE(reader->is_open());
}

TEST_F(TestBamReader, target_index) {
    string headerless = writeTempFile(".sam", fixtureSamRecords());
    string index = writeTempFile(".fai", fixtureTargetIndex());
    cleanup.push_back(headerless);
    cleanup.push_back(index);

    unique_ptr<BamReader> reader(openTamInWithIndex(headerless, index));
    TargetSequenceSet const& targets = *reader->targets();
    ASSERT_EQ(2u, targets.size());
    EXPECT_EQ(boost::optional<size_t>(1), targets.index_of("chr2"));
    EXPECT_EQ(boost::optional<uint64_t>(2000), targets.length_of(1));

    vector<Alignment> alns = readAll(*reader);
    ASSERT_EQ(5u, alns.size());
    EXPECT_EQ("chr2:100-104,110-114(+)", locationString(alns[2]));
}

TEST_F(TestBamReader, bam) {
    string bam_path = makeBam();

    unique_ptr<BamReader> sam(openTamIn(sam_path));
    unique_ptr<BamReader> bam(openBamIn(bam_path));
    EXPECT_EQ(*sam->targets(), *bam->targets());
    EXPECT_EQ(sam->targets()->header_text(), bam->targets()->header_text());

    vector<Alignment> expected = readAll(*sam);
    vector<Alignment> observed = readAll(*bam);
    ASSERT_EQ(expected.size(), observed.size());
    for (size_t i = 0; i < expected.size(); ++i)
        EXPECT_TRUE(expected[i] == observed[i]) << "record " << i;
}

TEST_F(TestBamReader, truncated_bam) {
    string bam_path = makeBam();
    // Cut into the end-of-file block, after the last record.
    bfs::resize_file(bam_path, bfs::file_size(bam_path) - 10);

    unique_ptr<BamReader> reader(openBamIn(bam_path));
    for (size_t i = 0; i < 5; ++i)
        ASSERT_TRUE(reader->next()) << "record " << i;

    EXPECT_THROW(reader->next(), std::runtime_error);
    // Errors are not forgotten.
    EXPECT_THROW(reader->next(), std::runtime_error);
    EXPECT_TRUE(reader->is_open());
}

TEST_F(TestBamReader, open_failure) {
    string missing = tempPath("bamkit-unit-test", ".sam");
    EXPECT_THROW(openTamIn(missing), std::runtime_error);
    EXPECT_THROW(openBamIn(missing), std::runtime_error);
}

TEST_F(TestBamReader, close) {
    unique_ptr<BamReader> reader(openTamIn(sam_path));
    ASSERT_TRUE(reader->next());

    reader->close();
    EXPECT_FALSE(reader->is_open());
    reader->close();
    EXPECT_FALSE(reader->is_open());

    EXPECT_THROW(reader->next(), std::runtime_error);
    // Target sequences outlive the stream.
    EXPECT_EQ(2u, reader->targets()->size());
}

TEST_F(TestBamReader, records_outlive_reader) {
    vector<Alignment> alns;
    boost::shared_ptr<TargetSequenceSet const> targets;
    {
        BamReader reader(sam_path, SAM_TEXT);
        targets = reader.targets();
        alns = readAll(reader);
    }
    ASSERT_EQ(5u, alns.size());
    EXPECT_EQ(boost::optional<string>("chr2"), alns[2].target_name());
}
