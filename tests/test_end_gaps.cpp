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

#define BOOST_TEST_MODULE end_gaps
#include <algorithm>
#include <boost/test/unit_test.hpp>

#include "aligners.hpp"
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

void CheckPositions(const SAlignmentResult& r, int start1, int start2, int end1, int end2) {
    BOOST_CHECK_EQUAL(r.m_start_pos1, start1);
    BOOST_CHECK_EQUAL(r.m_start_pos2, start2);
    BOOST_CHECK_EQUAL(r.m_end_pos1, end1);
    BOOST_CHECK_EQUAL(r.m_end_pos2, end2);
}
}

BOOST_AUTO_TEST_SUITE(semiglobal)

BOOST_AUTO_TEST_CASE(contained_second_sequence) {
    SAlignmentResult r = CSemiGlobalAligner().Align("ACGTACGT", "TACG", DnaOptions());
    BOOST_CHECK_EQUAL(r.m_score, 20);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "ACGTACGT");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "---TACG-");
    CheckPositions(r, 0, 0, 7, 4);
    BOOST_CHECK_EQUAL(r.m_identity, 4);
    BOOST_CHECK_EQUAL(r.m_alignment_length, 8);
    BOOST_CHECK_CLOSE(r.m_identity_percent, 50., 1e-9);
    BOOST_CHECK_EQUAL(r.m_cigar.CigarString(0, 8), "3I4M1I");
}

BOOST_AUTO_TEST_CASE(contained_first_sequence) {
    SAlignmentResult r = CSemiGlobalAligner().Align("TACG", "ACGTACGT", DnaOptions());
    BOOST_CHECK_EQUAL(r.m_score, 20);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "---TACG-");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "ACGTACGT");
    CheckPositions(r, 0, 0, 4, 7);
}

BOOST_AUTO_TEST_CASE(dovetail) {
    SAlignmentResult r = CSemiGlobalAligner().Align("AAACGT", "CGTTTT", DnaOptions());
    BOOST_CHECK_EQUAL(r.m_score, 15);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "AAACGT---");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "---CGTTTT");
    CheckPositions(r, 0, 0, 6, 3);
    BOOST_CHECK_EQUAL(r.m_identity, 3);
    BOOST_CHECK_EQUAL(r.m_alignment_length, 9);
}

BOOST_AUTO_TEST_CASE(nothing_paired) {
    SAlignmentResult r = CSemiGlobalAligner().Align("A", "C", DnaOptions());
    BOOST_CHECK_EQUAL(r.m_score, 0);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "A-");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "-C");
    // start positions cover the leading free gaps
    CheckPositions(r, 0, 0, 1, 0);
}

BOOST_AUTO_TEST_CASE(end_gaps_are_not_scored) {
    // the same pair aligned globally pays for the overhangs
    SAlignmentResult global = CGlobalAligner().Align("ACGTACGT", "TACG", DnaOptions());
    SAlignmentResult semi = CSemiGlobalAligner().Align("ACGTACGT", "TACG", DnaOptions());
    BOOST_CHECK_LT(global.m_score, semi.m_score);
}

BOOST_AUTO_TEST_CASE(errors) {
    try {
        CSemiGlobalAligner().Align(" ", "ACGT", DnaOptions());
        BOOST_FAIL("exception expected");
    } catch(CAlignException& e) {
        BOOST_CHECK_EQUAL(e.GetErrCode(), CAlignException::eEmptySequence);
        BOOST_CHECK_EQUAL(string(e.what()), "sequences cannot be empty");
    }
    SAlignmentOptions options = DnaOptions();
    options.m_gap_extend = 1;
    BOOST_CHECK_THROW(CSemiGlobalAligner().Align("ACGT", "ACGT", options), CAlignException);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(overlap)

BOOST_AUTO_TEST_CASE(no_overlap) {
    SAlignmentResult r = COverlapAligner().Align("AAACCCGGG", "GGGTTT", DnaOptions());
    BOOST_CHECK_EQUAL(r.m_score, 0);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "------AAACCCGGG");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "GGGTTT---------");
    CheckPositions(r, 0, 6, 0, 6);
    BOOST_CHECK_EQUAL(r.m_identity, 0);
    BOOST_CHECK_EQUAL(r.m_alignment_length, 15);
}

BOOST_AUTO_TEST_CASE(single_base_overlap) {
    SAlignmentResult r = COverlapAligner().Align("ACGTTT", "TTTGCA", DnaOptions());
    BOOST_CHECK_EQUAL(r.m_score, 5);
    BOOST_CHECK_EQUAL(r.m_aligned_seq1, "-----ACGTTT");
    BOOST_CHECK_EQUAL(r.m_aligned_seq2, "TTTGCA-----");
    CheckPositions(r, 0, 5, 1, 6);
    BOOST_CHECK_EQUAL(r.m_identity, 1);
    BOOST_CHECK_EQUAL(r.m_alignment_length, 11);
}

BOOST_AUTO_TEST_CASE(aligned_strings_cover_both_sequences) {
    SAlignmentResult r = COverlapAligner().Align("GATTACAGATTACA", "TACAGGG", DnaOptions());
    string s1 = r.m_aligned_seq1;
    string s2 = r.m_aligned_seq2;
    s1.erase(remove(s1.begin(), s1.end(), '-'), s1.end());
    s2.erase(remove(s2.begin(), s2.end(), '-'), s2.end());
    BOOST_CHECK_EQUAL(s1, "GATTACAGATTACA");
    BOOST_CHECK_EQUAL(s2, "TACAGGG");
    BOOST_CHECK_EQUAL(r.m_start_pos1, 0);
    BOOST_CHECK_EQUAL(r.m_end_pos2, 7);
}

BOOST_AUTO_TEST_SUITE_END()
