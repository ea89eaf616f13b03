#include "io/BamIo.hpp"

#include "TestData.hpp"

#include <boost/format.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using boost::format;
using namespace bamkit;
using namespace std;

namespace {
    size_t const N_RECORDS = 2000;
    size_t const N_THREADS = 8;

    boost::shared_ptr<TargetSequenceSet const> twoTargets() {
        vector<TargetSequence> seqs;
        seqs.push_back(TargetSequence("chr1", 1000000));
        seqs.push_back(TargetSequence("chr2", 2000000));
        return boost::shared_ptr<TargetSequenceSet const>(new TargetSequenceSet(seqs));
    }

    Alignment numberedRecord(TargetSequenceSet const& targets, size_t i) {
        AlignmentCore core;
        core.tid = int32_t(i % 2);
        core.pos = int32_t(i * 10);
        core.flag = uint16_t(i % 2 ? 0x10 : 0);
        core.map_quality = 30;
        AuxFields aux;
        aux.push_back("XN", AuxValue::from_int(int32_t(i)));
        return Alignment(targets, core, str(format("read%1%") % i),
            parse_cigar("4M"), "ACGT", vector<uint8_t>(4, 25), aux);
    }
}

class TestConcurrency : public ::testing::Test {
    protected:
        void SetUp() {
            targets = twoTargets();
            path = tempPath("bamkit-unit-test", ".bam");
        }

        void TearDown() {
            bfs::remove(path);
        }

        void writeRecords() {
            unique_ptr<BamWriter> out(openBamOut(path, targets));
            for (size_t i = 0; i < N_RECORDS; ++i)
                out->write(numberedRecord(*targets, i));
            out->close();
        }

        boost::shared_ptr<TargetSequenceSet const> targets;
        string path;
};

TEST_F(TestConcurrency, readers_share_records) {
    writeRecords();
    unique_ptr<BamReader> reader(openBamIn(path));

    vector<vector<string> > seen(N_THREADS);
    vector<thread> threads;
    for (size_t t = 0; t < N_THREADS; ++t) {
        threads.push_back(thread([&reader, &seen, t]() {
            while (boost::optional<Alignment> aln = reader->next())
                seen[t].push_back(aln->query_name());
        }));
    }
    for (size_t t = 0; t < threads.size(); ++t)
        threads[t].join();

    set<string> names;
    size_t total = 0;
    for (size_t t = 0; t < seen.size(); ++t) {
        total += seen[t].size();
        names.insert(seen[t].begin(), seen[t].end());
    }

    EXPECT_EQ(N_RECORDS, total);
    EXPECT_EQ(N_RECORDS, names.size());
    for (size_t i = 0; i < N_RECORDS; ++i)
        EXPECT_EQ(1u, names.count(str(format("read%1%") % i)));
}

TEST_F(TestConcurrency, writers_do_not_interleave) {
    size_t const per_thread = N_RECORDS / N_THREADS;
    {
        unique_ptr<BamWriter> out(openBamOut(path, targets));
        vector<thread> threads;
        for (size_t t = 0; t < N_THREADS; ++t) {
            threads.push_back(thread([&out, this, t, per_thread]() {
                for (size_t i = t * per_thread; i < (t + 1) * per_thread; ++i)
                    out->write(numberedRecord(*targets, i));
            }));
        }
        for (size_t t = 0; t < threads.size(); ++t)
            threads[t].join();
        out->close();
    }

    unique_ptr<BamReader> reader(openBamIn(path));
    set<string> names;
    while (boost::optional<Alignment> aln = reader->next()) {
        ASSERT_TRUE(aln->aux("XN"));
        size_t i = size_t(*aln->aux("XN")->as_int());
        ASSERT_EQ(numberedRecord(*targets, i), *aln);
        names.insert(aln->query_name());
    }
    EXPECT_EQ(per_thread * N_THREADS, names.size());
}

TEST_F(TestConcurrency, close_while_reading) {
    writeRecords();
    unique_ptr<BamReader> reader(openBamIn(path));

    mutex count_mutex;
    size_t total = 0;
    vector<thread> threads;
    for (size_t t = 0; t < N_THREADS; ++t) {
        threads.push_back(thread([&]() {
            size_t n = 0;
            try {
                while (reader->next())
                    ++n;
            }
            catch (std::runtime_error const&) {
                // closed underneath us
            }
            lock_guard<mutex> lock(count_mutex);
            total += n;
        }));
    }

    reader->close();
    for (size_t t = 0; t < threads.size(); ++t)
        threads[t].join();

    EXPECT_FALSE(reader->is_open());
    EXPECT_LE(total, N_RECORDS);
    EXPECT_THROW(reader->next(), std::runtime_error);
    EXPECT_EQ(2u, reader->targets()->size());
}
