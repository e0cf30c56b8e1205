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

#define BOOST_TEST_MODULE output
#include <boost/test/unit_test.hpp>

#include <sstream>

#include "aligners.hpp"
#include "output.hpp"
#include "align_exception.hpp"

using namespace PairAlign;

namespace {
SAlignmentOptions DnaOptions() {
    SAlignmentOptions options;
    options.m_matrix = string("DNA_SIMPLE");
    options.m_gap_open = -5;
    options.m_gap_extend = -2;
    return options;
}
}

BOOST_AUTO_TEST_CASE(format_names) {
    BOOST_CHECK_EQUAL(ParseOutputFormat("pretty"), ePretty);
    BOOST_CHECK_EQUAL(ParseOutputFormat("TSV"), eTsv);
    try {
        ParseOutputFormat("json");
        BOOST_FAIL("exception expected");
    } catch(CAlignException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CAlignException::eInvalidOption);
    }
}

BOOST_AUTO_TEST_CASE(tsv) {
    SAlignmentResult r = CGlobalAligner().Align("ACGTA", "ACGT", DnaOptions());
    ostringstream os;
    WriteTsvHeader(os);
    WriteAlignment(os, eTsv, "q", "t", "ACGTA", "ACGT", r, GetMatrix("DNA_SIMPLE"));
    BOOST_CHECK_EQUAL(os.str(), "#seq1\tseq2\tscore\tstart1\tend1\tstart2\tend2\tidentity\tlength\tidentity_percent\tcigar\txcigar\tbtop\n"
                                "q\tt\t15\t0\t5\t0\t4\t4\t5\t80.00\t4M1I\t4=1I\t4A-\n");
}

BOOST_AUTO_TEST_CASE(tsv_mismatches) {
    SAlignmentResult r = CGlobalAligner().Align("ACGTTCGT", "ACGTACGT", DnaOptions());
    ostringstream os;
    WriteAlignment(os, eTsv, "q", "t", "ACGTTCGT", "ACGTACGT", r, GetMatrix("DNA_SIMPLE"));
    BOOST_CHECK_EQUAL(os.str(), "q\tt\t31\t0\t8\t0\t8\t7\t8\t87.50\t8M\t4=1X3=\t4TA3\n");
}

BOOST_AUTO_TEST_CASE(pretty) {
    SAlignmentResult r = CGlobalAligner().Align("ACGTA", "ACGT", DnaOptions());
    ostringstream os;
    WriteAlignment(os, ePretty, "q", "t", "ACGTA", "ACGT", r, GetMatrix("DNA_SIMPLE"));
    BOOST_CHECK_EQUAL(os.str(), ">q vs t\nScore: 15  Identity: 4/5 (80.00%)  Seq1: 0-5  Seq2: 0-4\nACGTA\n|||| \nACGT-\n\n");
}

BOOST_AUTO_TEST_CASE(score_precision_is_not_changed) {
    string seq(30, 'A');
    SAlignmentResult r = CGlobalAligner().Align(seq, seq, DnaOptions());
    ostringstream os;
    WriteAlignment(os, eTsv, "q", "t", seq, seq, r, GetMatrix("DNA_SIMPLE"));
    WriteAlignment(os, eTsv, "q", "t", seq, seq, r, GetMatrix("DNA_SIMPLE"));
    string line = "q\tt\t150\t0\t30\t0\t30\t30\t30\t100.00\t30M\t30=\t30\n";
    BOOST_CHECK_EQUAL(os.str(), line+line);
}

BOOST_AUTO_TEST_CASE(empty_local_alignment) {
    SAlignmentResult r = CLocalAligner().Align("AAAA", "CCCC", DnaOptions());
    ostringstream tsv;
    WriteAlignment(tsv, eTsv, "q", "t", "AAAA", "CCCC", r, GetMatrix("DNA_SIMPLE"));
    BOOST_CHECK_EQUAL(tsv.str(), "q\tt\t0\t0\t0\t0\t0\t0\t0\t0.00\t*\t*\t*\n");

    ostringstream pretty;
    WriteAlignment(pretty, ePretty, "q", "t", "AAAA", "CCCC", r, GetMatrix("DNA_SIMPLE"));
    BOOST_CHECK(pretty.str().find("No alignment") != string::npos);
}
