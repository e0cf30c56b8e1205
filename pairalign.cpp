/*===========================================================================
*
*                            PUBLIC DOMAIN NOTICE
*               National Center for Biotechnology Information
*
*  This software/database is a "United States Government Work" under the
*  terms of the United States Copyright Act.  It was written as part of
*  the author's official duties as a United States Government employee and
*  thus cannot be copyrighted.  This software/database is freely available
*  to the public for use. The National Library of Medicine and the U.S.
*  Government have not placed any restriction on its use or reproduction.
*
*  Although all reasonable efforts have been taken to ensure the accuracy
*  and reliability of the software and data, the NLM and the U.S.
*  Government do not and cannot warrant the performance or results that
*  may be obtained by using this software or data. The NLM and the U.S.
*  Government disclaim all warranties, express or implied, including
*  warranties of performance, merchantability or fitness for any particular
*  purpose.
*
*  Please cite the author in any work or product based on this material.
*
* ===========================================================================
*
*/

#include <boost/program_options.hpp>

#include <iostream>
#include <fstream>
#include <vector>
#include <memory>
#include <boost/algorithm/string.hpp>

#include "common_util.hpp"
#include "aligners.hpp"
#include "seq_reader.hpp"
#include "output.hpp"
#include "batch_align.hpp"
#include "align_exception.hpp"

using namespace boost::program_options;
using namespace std;
using namespace PairAlign;

int main(int argc, const char* argv[]) {

    for(int n = 0; n < argc; ++n)
        cerr << argv[n] << " ";
    cerr << endl << endl;

    options_description general("General options");
    general.add_options()
        ("help,h", "Produce help message")
        ("version,v", "Print version")
        ("cores", value<int>()->default_value(0), "Number of cores to use (default all) [integer]");

    options_description input("Input/output options : seq1 (or query) and seq2 (or target) must be specified");
    input.add_options()
        ("seq1", value<string>(), "First sequence [string]")
        ("seq2", value<string>(), "Second sequence [string]")
        ("query", value<string>(), "Input fasta/fastq file with first sequences; every record is aligned to the target (could be gzipped, - for stdin) [string]")
        ("target", value<string>(), "Input fasta/fastq file with second sequence; first record is used (could be gzipped) [string]")
        ("output", value<string>(), "Output file (default stdout) [string]")
        ("format", value<string>()->default_value("pretty"), "Output format: pretty, tsv [string]");

    options_description alignment("Alignment options");
    alignment.add_options()
        ("algorithm", value<string>()->default_value("global"), "Algorithm: global, local, semiglobal, overlap, banded, hirschberg [string]")
        ("matrix", value<string>(), "Scoring matrix: BLOSUM45, BLOSUM50, BLOSUM62, BLOSUM80, BLOSUM90, PAM30, PAM70, PAM120, PAM250, DNA_SIMPLE, DNA_FULL (default BLOSUM62) [string]")
        ("match", value<double>(), "Score for match; builds a nucleotide matrix instead of --matrix (requires --mismatch) [float]")
        ("mismatch", value<double>(), "Score for mismatch (negative) [float]")
        ("gap_open", value<double>(), "Score for the first gap position (<= 0, default depends on algorithm) [float]")
        ("gap_extend", value<double>(), "Score for each additional gap position (<= 0, default -1) [float]")
        ("bandwidth", value<int>()->default_value(10), "Half-width of the band for banded alignment [integer]")
        ("min_score", value<double>()->default_value(0, "0"), "Minimal score of a local alignment [float]")
        ("gap_model", value<string>()->default_value("affine"), "Gap model for global and local alignment: affine, legacy [string]")
        ("no_case_normalize", "Don't trim and upper-case the sequences [flag]")
        ("normalize_score", "Divide the score by the alignment length [flag]");

    options_description benchmark("Benchmark options");
    benchmark.add_options()
        ("repeat", value<int>()->default_value(1), "Number of times each alignment is computed; mean time is reported [integer]");

    options_description all("");
    all.add(general).add(input).add(alignment).add(benchmark);

    CStopWatch timer;
    timer.Stop();
    try {
        variables_map argm;                                // boost arguments
        store(parse_command_line(argc, argv, all), argm);
        notify(argm);    

        if(argc == 1 || argm.count("help")) {
            cout << all << "\n";
            return 0;
        }

        if(argm.count("version")) {
            cout << "pairalign 1.0.0" << endl;
            return 0;
        }

        timer.Restart();

        if(argm.count("seq1") == argm.count("query")) {
            cerr << "Provide either --seq1 or --query" << endl;
            cerr << all << "\n";
            return 1;
        }
        if(argm.count("seq2") == argm.count("target")) {
            cerr << "Provide either --seq2 or --target" << endl;
            cerr << all << "\n";
            return 1;
        }

        ofstream out_file;
        if(argm.count("output")) {
            out_file.open(argm["output"].as<string>());
            if(!out_file.is_open()) {
                cerr << "Can't open file " << argm["output"].as<string>() << endl;
                exit(1);
            }
        }
        ostream& out = argm.count("output") ? out_file : cout;

        EOutputFormat format = ParseOutputFormat(argm["format"].as<string>());
        unique_ptr<CAligner> aligner = CreateAligner(argm["algorithm"].as<string>());
        SAlignmentOptions options = aligner->DefaultOptions();

        if(argm.count("match") != argm.count("mismatch")) {
            cerr << "Either specify both --match and --mismatch or neither" << endl;
            return 1;
        }
        if(argm.count("match")) {
            if(argm.count("matrix"))
                cerr << "WARNING: --matrix is ignored because --match and --mismatch are specified" << endl;
            options.m_matrix = CScoringMatrix(argm["match"].as<double>(), argm["mismatch"].as<double>());
        } else if(argm.count("matrix")) {
            options.m_matrix = GetMatrix(argm["matrix"].as<string>()).Name();
        }

        if(argm.count("gap_open"))
            options.m_gap_open = argm["gap_open"].as<double>();
        if(argm.count("gap_extend"))
            options.m_gap_extend = argm["gap_extend"].as<double>();
        if(options.m_gap_open > 0 || options.m_gap_extend > 0) {
            cerr << "Values of --gap_open and --gap_extend must be <= 0" << endl;
            exit(1);
        }
        options.m_bandwidth = argm["bandwidth"].as<int>();
        if(options.m_bandwidth < 0) {
            cerr << "Value of --bandwidth must be >= 0" << endl;
            exit(1);
        }
        options.m_min_score = argm["min_score"].as<double>();
        string gap_model = boost::algorithm::to_lower_copy(argm["gap_model"].as<string>());
        if(gap_model == "affine") {
            options.m_gap_model = eAffine;
        } else if(gap_model == "legacy") {
            options.m_gap_model = eDirectionRemembered;
        } else {
            cerr << "Value of --gap_model must be affine or legacy" << endl;
            exit(1);
        }
        options.m_case_normalize = !argm.count("no_case_normalize");
        options.m_score_normalize = argm.count("normalize_score");

        int repeat = argm["repeat"].as<int>();
        if(repeat <= 0) {
            cerr << "Value of --repeat must be > 0" << endl;
            exit(1);
        }

        int ncores = thread::hardware_concurrency();
        if(ncores <= 0)
            ncores = 1;
        if(argm["cores"].as<int>()) {
            int nc = argm["cores"].as<int>();
            if(nc < 0) {
                cerr << "Value of --cores must be >= 0" << endl;
                exit(1);
            } else if(nc > ncores) {
                cerr << "WARNING: number of cores was reduced to the hardware limit of " << ncores << " cores" << endl;
            } else if(nc > 0) {
                ncores = nc;
            }
        }

        vector<SSequenceRecord> queries;
        if(argm.count("seq1"))
            queries.push_back(SSequenceRecord{"seq1", argm["seq1"].as<string>()});
        else
            queries = CSequenceReader(argm["query"].as<string>()).ReadAll();

        SSequenceRecord target;
        if(argm.count("seq2"))
            target = SSequenceRecord{"seq2", argm["seq2"].as<string>()};
        else
            target = CSequenceReader(argm["target"].as<string>()).ReadFirst();

        cerr << "Sequences read: " << queries.size() << " query, 1 target in " << timer.Elapsed();

        const CScoringMatrix& delta = options.Matrix();
        cerr << "Algorithm: " << aligner->Name() << " Matrix: " << delta.Name() << " Gap open: " << options.m_gap_open << " Gap extend: " << options.m_gap_extend << endl;

        string target_seq = PrepareSequence(target.m_seq, options.m_case_normalize);
        string unscored = UnscoredSymbols(delta, target_seq);
        if(!unscored.empty())
            cerr << "WARNING: symbols " << unscored << " in " << target.m_id << " are not in matrix " << delta.Name() << " and score 0" << endl;
        for(auto& query : queries) {
            unscored = UnscoredSymbols(delta, PrepareSequence(query.m_seq, options.m_case_normalize));
            if(!unscored.empty())
                cerr << "WARNING: symbols " << unscored << " in " << query.m_id << " are not in matrix " << delta.Name() << " and score 0" << endl;
        }

        timer.Restart();
        vector<SBatchResult> results = AlignBatch(*aligner, queries, target, options, ncores, repeat);
        timer.Stop();

        int failed = 0;
        for(size_t q = 0; q < queries.size(); ++q) {
            if(!results[q].m_error.empty()) {
                cerr << "WARNING: " << queries[q].m_id << " was not aligned: " << results[q].m_error << endl;
                ++failed;
            }
        }

        double aligns = double(queries.size())*repeat;
        cerr << "Alignments computed: " << queries.size()-failed << " in " << timer.Elapsed();
        if(repeat > 1)
            cerr << "Mean time per alignment: wall " << timer.WallSeconds()/aligns << "s cpu " << timer.CpuSeconds()/aligns << "s" << endl;

        timer.Restart();
        if(format == eTsv)
            WriteTsvHeader(out);
        for(size_t q = 0; q < queries.size(); ++q) {
            if(!results[q].m_error.empty())
                continue;
            string query_seq = PrepareSequence(queries[q].m_seq, options.m_case_normalize);
            WriteAlignment(out, format, queries[q].m_id, target.m_id, query_seq, target_seq, results[q].m_result, delta);
        }
        out.flush();
        if(!out) {
            cerr << "Error writing output" << endl;
            exit(1);
        }
    } catch (CAlignException &e) {
        cerr << endl << e.GetErrCodeString() << ": " << e.what() << endl;
        exit(1);
    } catch (exception &e) {
        cerr << endl << e.what() << endl;
        exit(1);
    }

    cerr << "Output written in " << timer.Elapsed();
    cerr << "DONE" << endl;

    return 0;
}
