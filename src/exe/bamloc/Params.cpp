#include "Params.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>

namespace po = boost::program_options;

Params parse_cmdline(int argc, char** argv) {
    Params rv;

    po::options_description opts;

    opts.add_options()
        ("help,h", "this message")

        ("sam,s"
            , po::bool_switch(&rv.sam_input)->default_value(false)
            , "Input is SAM text (default: BAM)")

        ("target-index,t"
            , po::value<std::string>(&rv.target_index)->default_value("")
            , "Target sequence list for SAM input without @SQ lines")

        ("output,o"
            , po::value<std::string>(&rv.out_path)->default_value("")
            , "Copy every record to this file (optional)")

        ("output-format,O"
            , po::value<std::string>(&rv.out_format)->default_value("bam")
            , "Format of --output: sam or bam")

        ("locations,l"
            , po::bool_switch(&rv.locations)->default_value(false)
            , "Print the reference location of each record")

        ("quiet,q"
            , po::bool_switch(&rv.quiet)->default_value(false)
            , "Only report the number of records read")

        ("input-file,i"
            , po::value<std::string>(&rv.in_path)
            , "Input file (positional argument works too)")
        ;

    po::positional_options_description pos_opts;
    pos_opts.add("input-file", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).
              options(opts).positional(pos_opts).run(), vm);
    po::notify(vm);

    if (vm.count("help") > 0) {
        std::cerr << "Usage: " << argv[0] << " [OPTIONS] in.bam\n";
        std::cerr << opts << "\n";
        std::exit(0);
    }

    if (vm.count("input-file") < 1) {
        std::cerr << "No input file given!\n";
        std::exit(1);
    }

    if (rv.out_format != "sam" && rv.out_format != "bam") {
        std::cerr << "Unknown output format '" << rv.out_format << "'\n";
        std::exit(1);
    }

    if (rv.quiet)
        rv.locations = false;

    return rv;
}
