#include "Params.hpp"

#include "common/ReadFlags.hpp"
#include "io/BamIo.hpp"

#include <boost/optional.hpp>

#include <iostream>
#include <memory>
#include <string>

using namespace bamkit;

namespace {
    void print_location(std::ostream& out, Alignment const& aln) {
        out << aln.query_name() << "\t" << describe_flags(aln.sam_flag()) << "\t";
        boost::optional<SeqLocation> loc = aln.ref_seq_location();
        if (loc)
            out << *loc;
        else
            out << "*";
        out << "\n";
    }

    std::unique_ptr<BamReader> open_input(Params const& params) {
        if (!params.sam_input)
            return openBamIn(params.in_path);
        if (params.target_index.empty())
            return openTamIn(params.in_path);
        return openTamInWithIndex(params.in_path, params.target_index);
    }

    std::unique_ptr<BamWriter> open_output(
            Params const& params,
            boost::shared_ptr<TargetSequenceSet const> const& targets)
    {
        if (params.out_format == "sam")
            return openTamOut(params.out_path, targets);
        return openBamOut(params.out_path, targets);
    }
}

int main(int argc, char** argv) {
    try {
        Params params = parse_cmdline(argc, argv);

        std::unique_ptr<BamReader> in = open_input(params);

        std::unique_ptr<BamWriter> out;
        if (!params.out_path.empty())
            out = open_output(params, in->targets());

        std::size_t n_records = 0;
        while (boost::optional<Alignment> aln = in->next()) {
            ++n_records;
            if (params.locations)
                print_location(std::cout, *aln);
            if (out)
                out->write(*aln);
        }

        if (out)
            out->close();
        in->close();

        std::cerr << "Read " << n_records << " records from " << params.in_path << "\n";
    }
    catch (std::exception const& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
